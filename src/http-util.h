#pragma once

#include <cpp-httplib/httplib.h>

#include <cstdint>
#include <string>

namespace edge_tts {

struct parsed_http_url {
    bool https = false;
    std::string host;
    int32_t port = 0;
    std::string path = "/";
};

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err);

// One blocking POST with connect/read/write timeouts. Returns false with `err`
// set when no HTTP response was received at all.
bool http_post(
        const parsed_http_url & endpoint,
        const httplib::Headers & headers,
        const std::string & body,
        const std::string & content_type,
        int32_t timeout_sec,
        httplib::Result & res,
        std::string & err);

} // namespace edge_tts
