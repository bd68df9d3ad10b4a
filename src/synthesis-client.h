#pragma once

#include "credential-cache.h"
#include "proxy-common.h"

#include <cstdint>
#include <string>

namespace edge_tts {

static constexpr const char * k_default_output_format = "audio-24khz-48kbitrate-mono-mp3";

struct voice_params {
    std::string voice;
    std::string rate = "0";   // percent offset, e.g. "-25"
    std::string pitch = "0";  // percent offset
    std::string style = "general";
    std::string output_format = k_default_output_format;
};

class synthesis_client {
public:
    virtual ~synthesis_client() = default;

    // Synthesizes one unit of text. Called once per unit, after a credential
    // has been obtained; implementations must be safe to call concurrently.
    virtual bool synthesize(
            const std::string & text,
            const voice_params & params,
            const credential & cred,
            std::string & audio_out,
            proxy_error & err) = 0;
};

class edge_synthesis_client : public synthesis_client {
public:
    explicit edge_synthesis_client(int32_t timeout_sec);

    bool synthesize(
            const std::string & text,
            const voice_params & params,
            const credential & cred,
            std::string & audio_out,
            proxy_error & err) override;

private:
    int32_t timeout_sec_;
};

// Escapes XML specials in `text` except for <break .../> tags, which pass
// through so callers can insert pauses.
std::string escape_ssml_text(const std::string & text);

std::string escape_xml_attr(const std::string & value);

std::string build_ssml(const std::string & text, const voice_params & params);

std::string synthesis_host(const std::string & region);

} // namespace edge_tts
