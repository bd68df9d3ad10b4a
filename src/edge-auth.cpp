#include "edge-auth.h"

#include "http-util.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <cstdio>
#include <utility>

using json = nlohmann::ordered_json;

namespace edge_tts {

namespace {

static constexpr const char * k_signature_app_id = "MSTranslatorAndroidApp";
static constexpr const char * k_signature_key_b64 =
        "oik6PdDdMnOXemTbwvMn9de/h9lFnfBaCWbGMMZqqoSaQaqUOqjVGm5NqsmjcBI1x+sS9ugjB55HEJWRiFXYFw==";

static constexpr const char * k_client_version = "4.0.530a 5fe1dc6c";
static constexpr const char * k_user_id = "0f04d16a175c411e";
static constexpr const char * k_home_region = "zh-Hans-CN";
static constexpr const char * k_user_agent = "okhttp/4.5.0";

} // namespace

edge_token_issuer::edge_token_issuer(edge_auth_config cfg) : cfg_(std::move(cfg)) {
}

std::string format_http_date(std::time_t t) {
    static const char * days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char * months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::tm tm_utc {};
    gmtime_r(&t, &tm_utc);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s, %02d %s %04d %02d:%02d:%02d GMT",
            days[tm_utc.tm_wday], tm_utc.tm_mday, months[tm_utc.tm_mon], tm_utc.tm_year + 1900,
            tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec);
    return buf;
}

std::string make_nonce_hex() {
    unsigned char raw[16];
    if (RAND_bytes(raw, sizeof(raw)) != 1) {
        // RAND_bytes only fails without an entropy source; fall back to the clock
        const int64_t t = now_ms();
        for (size_t i = 0; i < sizeof(raw); ++i) {
            raw[i] = (unsigned char) ((t >> ((i % 8) * 8)) ^ (i * 131));
        }
    }
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sizeof(raw) * 2);
    for (unsigned char c : raw) {
        out.push_back(hex[c >> 4]);
        out.push_back(hex[c & 0x0F]);
    }
    return out;
}

std::string uri_component_encode(const std::string & s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        const bool unreserved = (c >= 'a' && c <= 'z') ||
                                (c >= 'A' && c <= 'Z') ||
                                (c >= '0' && c <= '9') ||
                                c == '-' || c == '_' || c == '.' || c == '!' ||
                                c == '~' || c == '*' || c == '\'' || c == '(' || c == ')';
        if (unreserved) {
            out.push_back((char) c);
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool make_translator_signature(
        const std::string & url,
        const std::string & http_date,
        const std::string & nonce,
        std::string & out,
        std::string & err) {
    const size_t scheme_end = url.find("://");
    const std::string without_scheme = scheme_end == std::string::npos ? url : url.substr(scheme_end + 3);

    const std::string to_sign = to_lower_ascii(
            std::string(k_signature_app_id) + uri_component_encode(without_scheme) + http_date + nonce);

    std::string key;
    if (!base64_decode(k_signature_key_b64, key)) {
        err = "signature key is not valid base64";
        return false;
    }

    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (HMAC(EVP_sha256(),
             key.data(), (int) key.size(),
             reinterpret_cast<const unsigned char *>(to_sign.data()), to_sign.size(),
             mac, &mac_len) == nullptr) {
        err = "HMAC-SHA256 failed";
        return false;
    }

    out = std::string(k_signature_app_id) + "::" + base64_encode(mac, mac_len) + "::" + http_date + "::" + nonce;
    return true;
}

bool decode_jwt_expiry(const std::string & token, int64_t & exp, std::string & err) {
    const size_t first = token.find('.');
    const size_t second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
    if (second == std::string::npos) {
        err = "JWT is not in compact form";
        return false;
    }

    std::string payload;
    if (!base64_decode(token.substr(first + 1, second - first - 1), payload)) {
        err = "JWT payload is not valid base64";
        return false;
    }

    try {
        const json j = json::parse(payload);
        const auto it = j.find("exp");
        if (it == j.end() || !it->is_number()) {
            err = "JWT payload has no numeric 'exp' claim";
            return false;
        }
        exp = it->get<int64_t>();
    } catch (const std::exception & e) {
        err = std::string("JWT payload is not JSON: ") + e.what();
        return false;
    }
    return true;
}

bool parse_token_response(const std::string & body, credential & out, std::string & err) {
    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception & e) {
        err = std::string("token endpoint returned non-JSON body: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        err = "token endpoint returned a non-object body";
        return false;
    }

    const auto it_r = j.find("r");
    const auto it_t = j.find("t");
    if (it_r == j.end() || !it_r->is_string() || it_r->get<std::string>().empty()) {
        err = "token endpoint response has no region ('r')";
        return false;
    }
    if (it_t == j.end() || !it_t->is_string() || it_t->get<std::string>().empty()) {
        err = "token endpoint response has no token ('t')";
        return false;
    }

    credential cred;
    cred.region = it_r->get<std::string>();
    cred.token = it_t->get<std::string>();
    std::string jwt_err;
    if (!decode_jwt_expiry(cred.token, cred.expires_at, jwt_err)) {
        err = "JWT decode failed: " + jwt_err;
        return false;
    }
    cred.endpoint = std::move(j);
    out = std::move(cred);
    return true;
}

bool edge_token_issuer::issue(credential & out, proxy_error & err) {
    parsed_http_url endpoint;
    std::string perr;
    if (!parse_http_url(cfg_.token_endpoint, endpoint, perr)) {
        set_error(err, ERROR_KIND_CREDENTIAL, 0, perr);
        return false;
    }

    std::string signature;
    if (!make_translator_signature(cfg_.token_endpoint, format_http_date(std::time(nullptr)), make_nonce_hex(), signature, perr)) {
        set_error(err, ERROR_KIND_CREDENTIAL, 0, perr);
        return false;
    }

    httplib::Headers headers = {
        {"Accept-Language", "zh-Hans"},
        {"X-ClientVersion", k_client_version},
        {"X-UserId", k_user_id},
        {"X-HomeGeographicRegion", k_home_region},
        {"X-ClientTraceId", make_nonce_hex()},
        {"X-MT-Signature", signature},
        {"User-Agent", k_user_agent},
    };

    httplib::Result res;
    if (!http_post(endpoint, headers, "", "application/json; charset=utf-8", cfg_.timeout_sec, res, perr)) {
        set_error(err, ERROR_KIND_CREDENTIAL, 0, perr);
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        set_error(err, ERROR_KIND_CREDENTIAL, res->status,
                "token endpoint HTTP " + std::to_string(res->status) + ": " + truncate_text(res->body));
        return false;
    }

    if (!parse_token_response(res->body, out, perr)) {
        set_error(err, ERROR_KIND_CREDENTIAL, res->status, perr);
        return false;
    }
    return true;
}

} // namespace edge_tts
