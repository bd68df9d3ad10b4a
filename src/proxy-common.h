#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace edge_tts {

enum error_kind {
    ERROR_KIND_NONE         = 0,
    ERROR_KIND_INPUT        = 1,
    ERROR_KIND_AUTH         = 2,
    ERROR_KIND_CREDENTIAL   = 3,
    ERROR_KIND_SYNTHESIS    = 4,
    ERROR_KIND_STREAM_ABORT = 5,
    ERROR_KIND_INTERNAL     = 6,
};

// Terminal failure for one request. `status` is the backend HTTP status when
// the failure came from an outbound call, otherwise the status to answer with.
struct proxy_error {
    error_kind kind = ERROR_KIND_NONE;
    int32_t status = 0;
    std::string message;
};

void set_error(proxy_error & err, error_kind kind, int32_t status, const std::string & message);

const char * error_kind_to_cstr(error_kind kind);

int64_t now_ms();
int64_t now_sec();

std::string trim_copy(const std::string & in);
std::string to_lower_ascii(std::string s);
std::string truncate_text(const std::string & s, size_t max_len = 240);
std::vector<std::string> split_csv(const std::string & raw);

// Decodes one code point starting at `pos` and returns the offset of the next
// one. Malformed sequences consume a single byte and yield U+FFFD.
size_t utf8_next(const std::string & s, size_t pos, uint32_t & cp);
size_t utf8_length(const std::string & s);

std::string base64_encode(const uint8_t * data, size_t len);
bool base64_decode(const std::string & in, std::string & out);

} // namespace edge_tts
