#pragma once

#include "proxy-common.h"
#include "synthesis-client.h"
#include "text-cleaner.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace edge_tts {

// Upper bound on the UTF-8 byte length of 'input'.
static constexpr size_t k_max_input_bytes = 128 * 1024;

struct request_defaults {
    int32_t concurrency = 10;
    int32_t chunk_size = 300;
    std::string output_format = k_default_output_format;
};

// OpenAI-style /v1/audio/speech request after defaults are applied.
struct speech_request {
    std::string model = "tts-1";
    std::string input;
    std::string voice = "shimmer";
    double speed = 1.0;
    double pitch = 1.0;
    std::string style = "general";
    bool stream = false;
    int32_t concurrency = 10;
    int32_t chunk_size = 300;
    cleaning_options cleaning;
};

const std::vector<std::pair<std::string, std::string>> & openai_voice_map();

bool parse_speech_request_json(
        const nlohmann::ordered_json & body,
        const request_defaults & defaults,
        speech_request & out,
        proxy_error & err);

// GET form: input|t, voice|v, model, speed|r, pitch|p, style|s, stream.
bool parse_speech_request_query(
        const std::multimap<std::string, std::string> & params,
        const request_defaults & defaults,
        speech_request & out,
        proxy_error & err);

// "(value - 1) * 100" rounded to an integer percent, as SSML prosody expects.
std::string to_prosody_percent(double value);

bool resolve_voice_params(
        const speech_request & req,
        const std::string & output_format,
        voice_params & out,
        proxy_error & err);

} // namespace edge_tts
