#pragma once

#include <string>

namespace edge_tts {

struct cleaning_options {
    bool remove_markdown = true;
    bool remove_emoji = true;
    bool remove_urls = true;
    bool remove_line_breaks = true;
    bool remove_citation_numbers = true;
    std::string custom_keywords; // comma-separated literals

    static cleaning_options none() {
        cleaning_options o;
        o.remove_markdown = false;
        o.remove_emoji = false;
        o.remove_urls = false;
        o.remove_line_breaks = false;
        o.remove_citation_numbers = false;
        return o;
    }
};

std::string clean_text(const std::string & text, const cleaning_options & opts);

// Each stage is a single forward pass, so cost stays linear in the input.
std::string strip_urls(const std::string & text);
std::string strip_markdown(const std::string & text);
std::string collapse_whitespace(const std::string & text);
std::string strip_emoji(const std::string & text);
std::string remove_keywords(const std::string & text, const std::string & custom_keywords);

} // namespace edge_tts
