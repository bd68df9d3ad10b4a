#pragma once

#include "credential-cache.h"
#include "proxy-common.h"

#include <cstdint>
#include <ctime>
#include <string>

namespace edge_tts {

static constexpr const char * k_default_token_endpoint =
        "https://dev.microsofttranslator.com/apps/endpoint?api-version=1.0";

struct edge_auth_config {
    std::string token_endpoint = k_default_token_endpoint;
    int32_t timeout_sec = 30;
};

// Fetches a region + JWT pair from the translator app endpoint. The request
// is signed with the app's shared HMAC key, a random nonce and the date.
class edge_token_issuer : public token_issuer {
public:
    explicit edge_token_issuer(edge_auth_config cfg);

    bool issue(credential & out, proxy_error & err) override;

private:
    edge_auth_config cfg_;
};

// `MSTranslatorAndroidApp::<b64 hmac>::<date>::<nonce>`
bool make_translator_signature(
        const std::string & url,
        const std::string & http_date,
        const std::string & nonce,
        std::string & out,
        std::string & err);

std::string format_http_date(std::time_t t);
std::string make_nonce_hex();
std::string uri_component_encode(const std::string & s);

// Reads the `exp` claim from the payload segment of a compact JWT.
bool decode_jwt_expiry(const std::string & token, int64_t & exp, std::string & err);

// Parses the token endpoint's JSON body ({"r": region, "t": jwt, ...}).
bool parse_token_response(const std::string & body, credential & out, std::string & err);

} // namespace edge_tts
