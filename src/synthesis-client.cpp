#include "synthesis-client.h"

#include "http-util.h"

#include <regex>
#include <utility>

namespace edge_tts {

edge_synthesis_client::edge_synthesis_client(int32_t timeout_sec) : timeout_sec_(timeout_sec) {
}

std::string escape_ssml_text(const std::string & text) {
    // repetitions are bounded so a long unterminated tag cannot exhaust the stack
    static const std::regex break_re(
            R"(<break\s{1,8}time="[^"<>]{0,64}"\s{0,8}/?>|<break\s{0,8}/?>|<break\s{1,8}time='[^'<>]{0,64}'\s{0,8}/?>)",
            std::regex::icase);

    auto escape = [](const std::string & s, std::string & out) {
        for (char c : s) {
            switch (c) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;";  break;
                case '>': out += "&gt;";  break;
                default:  out.push_back(c); break;
            }
        }
    };

    std::string out;
    out.reserve(text.size() + 16);
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), break_re), end; it != end; ++it) {
        escape(std::string(last, (*it)[0].first), out);
        out += (*it)[0].str();
        last = (*it)[0].second;
    }
    escape(std::string(last, text.cend()), out);
    return out;
}

std::string escape_xml_attr(const std::string & value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&':  out += "&amp;";  break;
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string build_ssml(const std::string & text, const voice_params & params) {
    std::string ssml;
    ssml.reserve(text.size() + 512);
    ssml += "<speak xmlns=\"http://www.w3.org/2001/10/synthesis\" xmlns:mstts=\"http://www.w3.org/2001/mstts\" version=\"1.0\" xml:lang=\"en-US\">";
    ssml += "<voice name=\"" + escape_xml_attr(params.voice) + "\">";
    ssml += "<mstts:express-as style=\"" + escape_xml_attr(params.style) + "\">";
    ssml += "<prosody rate=\"" + escape_xml_attr(params.rate) + "%\" pitch=\"" + escape_xml_attr(params.pitch) + "%\">";
    ssml += escape_ssml_text(text);
    ssml += "</prosody></mstts:express-as></voice></speak>";
    return ssml;
}

std::string synthesis_host(const std::string & region) {
    return region + ".tts.speech.microsoft.com";
}

bool edge_synthesis_client::synthesize(
        const std::string & text,
        const voice_params & params,
        const credential & cred,
        std::string & audio_out,
        proxy_error & err) {
    parsed_http_url endpoint;
    endpoint.https = true;
    endpoint.host = synthesis_host(cred.region);
    endpoint.port = 443;
    endpoint.path = "/cognitiveservices/v1";

    httplib::Headers headers = {
        {"Authorization", cred.token},
        {"User-Agent", "okhttp/4.5.0"},
        {"X-Microsoft-OutputFormat", params.output_format},
    };

    httplib::Result res;
    std::string perr;
    if (!http_post(endpoint, headers, build_ssml(text, params), "application/ssml+xml", timeout_sec_, res, perr)) {
        set_error(err, ERROR_KIND_SYNTHESIS, 0, perr);
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        set_error(err, ERROR_KIND_SYNTHESIS, res->status,
                "speech backend HTTP " + std::to_string(res->status) + ": " + truncate_text(res->body));
        return false;
    }

    audio_out = std::move(res->body);
    return true;
}

} // namespace edge_tts
