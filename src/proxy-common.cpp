#include "proxy-common.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace edge_tts {

void set_error(proxy_error & err, error_kind kind, int32_t status, const std::string & message) {
    err.kind = kind;
    err.status = status;
    err.message = message;
}

const char * error_kind_to_cstr(error_kind kind) {
    switch (kind) {
        case ERROR_KIND_NONE:         return "none";
        case ERROR_KIND_INPUT:        return "input";
        case ERROR_KIND_AUTH:         return "auth";
        case ERROR_KIND_CREDENTIAL:   return "credential";
        case ERROR_KIND_SYNTHESIS:    return "synthesis";
        case ERROR_KIND_STREAM_ABORT: return "stream_abort";
        case ERROR_KIND_INTERNAL:     return "internal";
        default:                      return "unknown";
    }
}

int64_t now_ms() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

int64_t now_sec() {
    return now_ms() / 1000;
}

std::string trim_copy(const std::string & in) {
    size_t b = 0;
    while (b < in.size() && std::isspace((unsigned char) in[b])) {
        ++b;
    }
    size_t e = in.size();
    while (e > b && std::isspace((unsigned char) in[e - 1])) {
        --e;
    }
    return in.substr(b, e - b);
}

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return s;
}

std::string truncate_text(const std::string & s, size_t max_len) {
    if (s.size() <= max_len) {
        return s;
    }
    return s.substr(0, max_len) + "...";
}

std::vector<std::string> split_csv(const std::string & raw) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= raw.size()) {
        const size_t comma = raw.find(',', start);
        const size_t end = comma == std::string::npos ? raw.size() : comma;
        const std::string token = trim_copy(raw.substr(start, end - start));
        if (!token.empty()) {
            out.push_back(token);
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

size_t utf8_next(const std::string & s, size_t pos, uint32_t & cp) {
    const unsigned char c0 = (unsigned char) s[pos];
    size_t n = 0;
    if (c0 < 0x80) {
        cp = c0;
        return pos + 1;
    } else if ((c0 & 0xE0) == 0xC0) {
        cp = c0 & 0x1F;
        n = 1;
    } else if ((c0 & 0xF0) == 0xE0) {
        cp = c0 & 0x0F;
        n = 2;
    } else if ((c0 & 0xF8) == 0xF0) {
        cp = c0 & 0x07;
        n = 3;
    } else {
        cp = 0xFFFD;
        return pos + 1;
    }
    if (pos + n >= s.size()) {
        cp = 0xFFFD;
        return pos + 1;
    }
    for (size_t k = 1; k <= n; ++k) {
        const unsigned char c = (unsigned char) s[pos + k];
        if ((c & 0xC0) != 0x80) {
            cp = 0xFFFD;
            return pos + 1;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    return pos + n + 1;
}

size_t utf8_length(const std::string & s) {
    size_t n = 0;
    uint32_t cp = 0;
    for (size_t pos = 0; pos < s.size(); pos = utf8_next(s, pos, cp)) {
        ++n;
    }
    return n;
}

std::string base64_encode(const uint8_t * data, size_t len) {
    static const char table[] =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(((len + 2) / 3) * 4);
    for (size_t i = 0; i < len; i += 3) {
        const uint32_t a = data[i];
        const uint32_t b = (i + 1 < len) ? data[i + 1] : 0;
        const uint32_t c = (i + 2 < len) ? data[i + 2] : 0;
        const uint32_t triple = (a << 16) | (b << 8) | c;
        result += table[(triple >> 18) & 0x3F];
        result += table[(triple >> 12) & 0x3F];
        result += (i + 1 < len) ? table[(triple >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? table[triple & 0x3F] : '=';
    }
    return result;
}

// Accepts both the standard and the URL-safe alphabet, padded or not.
bool base64_decode(const std::string & in, std::string & out) {
    out.clear();
    out.reserve((in.size() * 3) / 4);

    uint32_t acc = 0;
    int32_t bits = 0;
    for (char ch : in) {
        int32_t v = -1;
        if (ch >= 'A' && ch <= 'Z') {
            v = ch - 'A';
        } else if (ch >= 'a' && ch <= 'z') {
            v = ch - 'a' + 26;
        } else if (ch >= '0' && ch <= '9') {
            v = ch - '0' + 52;
        } else if (ch == '+' || ch == '-') {
            v = 62;
        } else if (ch == '/' || ch == '_') {
            v = 63;
        } else if (ch == '=') {
            break;
        } else {
            return false;
        }
        acc = (acc << 6) | (uint32_t) v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((char) ((acc >> bits) & 0xFF));
        }
    }
    return true;
}

} // namespace edge_tts
