#include "speech-request.h"

#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace edge_tts {

namespace {

static constexpr int32_t k_max_concurrency = 64;
static constexpr int32_t k_max_chunk_size = 5000;

static bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

template<typename T>
static bool get_json_number(const json & j, const char * key, T & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    out = it->get<T>();
    return true;
}

static bool get_json_int32(const json & j, const char * key, int32_t & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    int64_t v = 0;
    if (it->is_number_unsigned()) {
        const uint64_t u = it->get<uint64_t>();
        if (u > (uint64_t) INT32_MAX) {
            throw std::runtime_error(std::string("field '") + key + "' is out of range");
        }
        v = (int64_t) u;
    } else if (it->is_number_integer()) {
        v = it->get<int64_t>();
    } else if (it->is_number_float()) {
        const double d = it->get<double>();
        if (!std::isfinite(d) || d != std::floor(d)) {
            throw std::runtime_error(std::string("field '") + key + "' must be an integer");
        }
        if (d < (double) INT32_MIN || d > (double) INT32_MAX) {
            throw std::runtime_error(std::string("field '") + key + "' is out of range");
        }
        v = (int64_t) d;
    } else {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    if (v < INT32_MIN || v > INT32_MAX) {
        throw std::runtime_error(std::string("field '") + key + "' is out of range");
    }
    out = (int32_t) v;
    return true;
}

static bool get_json_bool(const json & j, const char * key, bool & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        throw std::runtime_error(std::string("field '") + key + "' must be bool");
    }
    out = it->get<bool>();
    return true;
}

static const std::string * find_param(
        const std::multimap<std::string, std::string> & params,
        const char * key,
        const char * alias = nullptr) {
    auto it = params.find(key);
    if (it != params.end() && !it->second.empty()) {
        return &it->second;
    }
    if (alias != nullptr) {
        it = params.find(alias);
        if (it != params.end() && !it->second.empty()) {
            return &it->second;
        }
    }
    return nullptr;
}

static bool parse_double(const std::string & s, double & out) {
    char * end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end == nullptr || end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
        return false;
    }
    out = v;
    return true;
}

static void apply_defaults(const request_defaults & defaults, speech_request & out) {
    out = speech_request();
    out.concurrency = defaults.concurrency;
    out.chunk_size = defaults.chunk_size;
}

static bool validate_request(speech_request & req, proxy_error & err) {
    if (req.input.empty()) {
        set_error(err, ERROR_KIND_INPUT, 400, "'input' is required");
        return false;
    }
    if (req.input.size() > k_max_input_bytes) {
        set_error(err, ERROR_KIND_INPUT, 400,
                "'input' exceeds " + std::to_string(k_max_input_bytes) + " bytes");
        return false;
    }
    if (req.concurrency < 1 || req.concurrency > k_max_concurrency) {
        set_error(err, ERROR_KIND_INPUT, 400,
                "'concurrency' must be between 1 and " + std::to_string(k_max_concurrency));
        return false;
    }
    if (req.chunk_size < 1 || req.chunk_size > k_max_chunk_size) {
        set_error(err, ERROR_KIND_INPUT, 400,
                "'chunk_size' must be between 1 and " + std::to_string(k_max_chunk_size));
        return false;
    }
    if (!(req.speed > 0.0) || !(req.pitch > 0.0)) {
        set_error(err, ERROR_KIND_INPUT, 400, "'speed' and 'pitch' must be positive");
        return false;
    }
    return true;
}

} // namespace

const std::vector<std::pair<std::string, std::string>> & openai_voice_map() {
    static const std::vector<std::pair<std::string, std::string>> map = {
        {"shimmer", "zh-CN-XiaoxiaoNeural"},
        {"alloy",   "zh-CN-YunyangNeural"},
        {"fable",   "zh-CN-YunjianNeural"},
        {"onyx",    "zh-CN-XiaoyiNeural"},
        {"nova",    "zh-CN-YunxiNeural"},
        {"echo",    "zh-CN-liaoning-XiaobeiNeural"},
    };
    return map;
}

bool parse_speech_request_json(
        const json & body,
        const request_defaults & defaults,
        speech_request & out,
        proxy_error & err) {
    if (!body.is_object()) {
        set_error(err, ERROR_KIND_INPUT, 400, "request body must be a JSON object");
        return false;
    }
    apply_defaults(defaults, out);

    try {
        get_json_string(body, "model", out.model);
        get_json_string(body, "input", out.input);
        get_json_string(body, "voice", out.voice);
        get_json_number(body, "speed", out.speed);
        get_json_number(body, "pitch", out.pitch);
        get_json_string(body, "style", out.style);
        get_json_bool(body, "stream", out.stream);
        get_json_int32(body, "concurrency", out.concurrency);
        get_json_int32(body, "chunk_size", out.chunk_size);

        auto it = body.find("cleaning_options");
        if (it != body.end() && !it->is_null()) {
            if (!it->is_object()) {
                throw std::runtime_error("field 'cleaning_options' must be object");
            }
            cleaning_options & c = out.cleaning;
            get_json_bool(*it, "remove_markdown", c.remove_markdown);
            get_json_bool(*it, "remove_emoji", c.remove_emoji);
            get_json_bool(*it, "remove_urls", c.remove_urls);
            get_json_bool(*it, "remove_line_breaks", c.remove_line_breaks);
            get_json_bool(*it, "remove_citation_numbers", c.remove_citation_numbers);
            get_json_string(*it, "custom_keywords", c.custom_keywords);
        }
    } catch (const std::exception & e) {
        set_error(err, ERROR_KIND_INPUT, 400, e.what());
        return false;
    }

    return validate_request(out, err);
}

bool parse_speech_request_query(
        const std::multimap<std::string, std::string> & params,
        const request_defaults & defaults,
        speech_request & out,
        proxy_error & err) {
    apply_defaults(defaults, out);

    if (const std::string * v = find_param(params, "input", "t")) {
        out.input = *v;
    }
    if (const std::string * v = find_param(params, "voice", "v")) {
        out.voice = *v;
    } else {
        out.voice.clear();
    }
    if (const std::string * v = find_param(params, "model")) {
        out.model = *v;
    }
    if (const std::string * v = find_param(params, "speed", "r")) {
        if (!parse_double(*v, out.speed)) {
            set_error(err, ERROR_KIND_INPUT, 400, "'speed' must be a number");
            return false;
        }
    }
    if (const std::string * v = find_param(params, "pitch", "p")) {
        if (!parse_double(*v, out.pitch)) {
            set_error(err, ERROR_KIND_INPUT, 400, "'pitch' must be a number");
            return false;
        }
    }
    if (const std::string * v = find_param(params, "style", "s")) {
        out.style = *v;
    }
    if (const std::string * v = find_param(params, "stream")) {
        out.stream = *v == "true";
    }

    return validate_request(out, err);
}

std::string to_prosody_percent(double value) {
    const long pct = std::lround((value - 1.0) * 100.0);
    return std::to_string(pct);
}

bool resolve_voice_params(
        const speech_request & req,
        const std::string & output_format,
        voice_params & out,
        proxy_error & err) {
    // An empty voice falls back to the model suffix ("tts-1-nova"); only
    // aliases are accepted there.
    std::string alias = req.voice;
    if (alias.empty()) {
        const std::string prefix = "tts-1-";
        if (req.model.compare(0, prefix.size(), prefix) == 0) {
            alias = req.model.substr(prefix.size());
        }
    }

    std::string voice;
    for (const auto & kv : openai_voice_map()) {
        if (kv.first == alias) {
            voice = kv.second;
            break;
        }
    }
    if (voice.empty()) {
        voice = req.voice;
    }
    if (voice.empty()) {
        set_error(err, ERROR_KIND_INPUT, 400,
                "invalid voice - model: " + req.model + ", voice: " + req.voice);
        return false;
    }

    out.voice = voice;
    out.rate = to_prosody_percent(req.speed);
    out.pitch = to_prosody_percent(req.pitch);
    out.style = req.style.empty() ? "general" : req.style;
    out.output_format = output_format;
    return true;
}

} // namespace edge_tts
