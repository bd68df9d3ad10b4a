#include "http-util.h"

#include "proxy-common.h"

#include <cstdlib>
#include <regex>

namespace edge_tts {

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(raw, m, re)) {
        err = "invalid URL: " + raw;
        return false;
    }

    const std::string scheme = to_lower_ascii(m[1].str());
    if (scheme != "http" && scheme != "https") {
        err = "unsupported URL scheme: " + scheme;
        return false;
    }

    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        char * end = nullptr;
        const long p = std::strtol(m[3].str().c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || p < 1 || p > 65535) {
            err = "invalid port in URL: " + raw;
            return false;
        }
        out.port = (int32_t) p;
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }

    return true;
}

bool http_post(
        const parsed_http_url & endpoint,
        const httplib::Headers & headers,
        const std::string & body,
        const std::string & content_type,
        int32_t timeout_sec,
        httplib::Result & res,
        std::string & err) {
    if (endpoint.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(endpoint.host, endpoint.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(timeout_sec, 0);
        cli.set_read_timeout(timeout_sec, 0);
        cli.set_write_timeout(timeout_sec, 0);
        res = cli.Post(endpoint.path, headers, body, content_type);
#else
        err = "https URL requires CPPHTTPLIB_OPENSSL_SUPPORT";
        return false;
#endif
    } else {
        httplib::Client cli(endpoint.host, endpoint.port);
        cli.set_follow_location(true);
        cli.set_connection_timeout(timeout_sec, 0);
        cli.set_read_timeout(timeout_sec, 0);
        cli.set_write_timeout(timeout_sec, 0);
        res = cli.Post(endpoint.path, headers, body, content_type);
    }

    if (!res) {
        err = "request to " + endpoint.host + " failed: " + httplib::to_string(res.error());
        return false;
    }
    return true;
}

} // namespace edge_tts
