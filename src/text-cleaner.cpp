#include "text-cleaner.h"

#include "proxy-common.h"

#include <algorithm>
#include <regex>
#include <vector>

namespace edge_tts {

namespace {

static constexpr size_t npos = std::string::npos;

static bool is_emoji_presentation(uint32_t cp) {
    return (cp >= 0x1F300 && cp <= 0x1F5FF) ||
           (cp >= 0x1F600 && cp <= 0x1F64F) ||
           (cp >= 0x1F680 && cp <= 0x1F6FF) ||
           (cp >= 0x1F900 && cp <= 0x1F9FF) ||
           (cp >= 0x1FA70 && cp <= 0x1FAFF) ||
           (cp >= 0x1F1E6 && cp <= 0x1F1FF) ||
           (cp >= 0x2600 && cp <= 0x26FF)   ||
           (cp >= 0x2700 && cp <= 0x27BF)   ||
           cp == 0x2B50 || cp == 0x2B55 ||
           cp == 0xFE0F || cp == 0x200D;
}

static bool is_space_cp(uint32_t cp) {
    return cp == 0x20 || (cp >= 0x09 && cp <= 0x0D) ||
           cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000 || cp == 0xFEFF;
}

static std::string escape_regex(const std::string & s) {
    static const std::string special = "-/\\^$*+?.()|[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// Next occurrence of `needle` at or after `from`. Callers pass non-decreasing
// `from` values, so each stage stays linear in the input size.
class forward_finder {
public:
    forward_finder(const std::string & s, const char * needle) : s_(s), needle_(needle) {}

    size_t next(size_t from) {
        if (!searched_ || (pos_ != npos && pos_ < from)) {
            pos_ = s_.find(needle_, from);
            searched_ = true;
        }
        return pos_;
    }

private:
    const std::string & s_;
    std::string needle_;
    size_t pos_ = npos;
    bool searched_ = false;
};

// End of the line containing `from` (first '\n' or '\r', else the input size).
class line_end_finder {
public:
    explicit line_end_finder(const std::string & s) : size_(s.size()), lf_(s, "\n"), cr_(s, "\r") {}

    size_t next(size_t from) {
        const size_t e = std::min(lf_.next(from), cr_.next(from));
        return e == npos ? size_ : e;
    }

private:
    size_t size_;
    forward_finder lf_;
    forward_finder cr_;
};

// `![alt](url)` is dropped; `[label](url)` becomes `label`. Neither spans a
// line break, and the first `](` and `)` after the opener close it.
static std::string replace_bracket_links(const std::string & s, bool image) {
    forward_finder mid(s, "](");
    forward_finder close(s, ")");
    line_end_finder eol(s);

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        const bool opener = image
                ? (s[pos] == '!' && pos + 1 < s.size() && s[pos + 1] == '[')
                : s[pos] == '[';
        if (opener) {
            const size_t label = pos + (image ? 2 : 1);
            const size_t line_end = eol.next(label);
            const size_t m = mid.next(label);
            if (m != npos && m < line_end) {
                const size_t c = close.next(m + 2);
                if (c != npos && c < line_end) {
                    if (!image) {
                        out.append(s, label, m - label);
                    }
                    pos = c + 1;
                    continue;
                }
            }
        }
        out.push_back(s[pos]);
        ++pos;
    }
    return out;
}

// `<d>text<d>` becomes `text`, closed by the next `d` on the same line.
static std::string unwrap_delimited(const std::string & s, const std::vector<std::string> & delims) {
    std::vector<forward_finder> finders;
    finders.reserve(delims.size());
    for (const auto & d : delims) {
        finders.emplace_back(s, d.c_str());
    }
    line_end_finder eol(s);

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        bool matched = false;
        for (size_t k = 0; k < delims.size(); ++k) {
            const std::string & d = delims[k];
            if (s.compare(pos, d.size(), d) != 0) {
                continue;
            }
            const size_t begin = pos + d.size();
            const size_t c = finders[k].next(begin);
            if (c != npos && c < eol.next(begin)) {
                out.append(s, begin, c - begin);
                pos = c + d.size();
                matched = true;
            }
            break;
        }
        if (!matched) {
            out.push_back(s[pos]);
            ++pos;
        }
    }
    return out;
}

static size_t backtick_run(const std::string & s, size_t pos) {
    size_t n = 0;
    while (pos + n < s.size() && s[pos + n] == '`' && n < 3) {
        ++n;
    }
    return n;
}

// Inline code: one to three backticks, content up to the next backtick on the
// line. A run of two or three with no closer is dropped as empty code.
static std::string unwrap_inline_code(const std::string & s) {
    forward_finder tick(s, "`");
    line_end_finder eol(s);

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    while (pos < s.size()) {
        if (s[pos] == '`') {
            const size_t run = backtick_run(s, pos);
            const size_t begin = pos + run;
            const size_t c = tick.next(begin);
            if (c != npos && c < eol.next(begin)) {
                out.append(s, begin, c - begin);
                pos = c + backtick_run(s, c);
                continue;
            }
            if (run >= 2) {
                pos = begin;
                continue;
            }
        }
        out.push_back(s[pos]);
        ++pos;
    }
    return out;
}

} // namespace

std::string strip_urls(const std::string & text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t scheme_len = 0;
        if (text.compare(pos, 8, "https://") == 0) {
            scheme_len = 8;
        } else if (text.compare(pos, 7, "http://") == 0) {
            scheme_len = 7;
        }
        if (scheme_len > 0) {
            size_t end = pos + scheme_len;
            uint32_t cp = 0;
            while (end < text.size()) {
                const size_t next = utf8_next(text, end, cp);
                if (is_space_cp(cp)) {
                    break;
                }
                end = next;
            }
            if (end > pos + scheme_len) {
                pos = end;
                continue;
            }
        }
        out.push_back(text[pos]);
        ++pos;
    }
    return out;
}

std::string strip_markdown(const std::string & text) {
    static const std::regex md_heading_re(R"(#{1,6}\s)");

    std::string out = replace_bracket_links(text, true);
    out = replace_bracket_links(out, false);
    out = unwrap_delimited(out, {"**", "__"});
    out = unwrap_delimited(out, {"*", "_"});
    out = unwrap_inline_code(out);
    return std::regex_replace(out, md_heading_re, "");
}

std::string collapse_whitespace(const std::string & text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    uint32_t cp = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t next = utf8_next(text, pos, cp);
        if (is_space_cp(cp)) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
        } else {
            out.append(text, pos, next - pos);
            in_space = false;
        }
        pos = next;
    }
    return out;
}

std::string strip_emoji(const std::string & text) {
    std::string out;
    out.reserve(text.size());
    uint32_t cp = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t next = utf8_next(text, pos, cp);
        if (!is_emoji_presentation(cp)) {
            out.append(text, pos, next - pos);
        }
        pos = next;
    }
    return out;
}

std::string remove_keywords(const std::string & text, const std::string & custom_keywords) {
    const std::vector<std::string> keywords = split_csv(custom_keywords);
    if (keywords.empty()) {
        return text;
    }
    std::string pattern;
    for (const auto & k : keywords) {
        if (!pattern.empty()) {
            pattern.push_back('|');
        }
        pattern += escape_regex(k);
    }
    const std::regex re(pattern);
    return std::regex_replace(text, re, "");
}

std::string clean_text(const std::string & text, const cleaning_options & opts) {
    // CJK punctuation is multi-byte, so it is listed as alternatives, not in a class.
    static const std::regex citation_re(R"(\s\d{1,2}(?=[.,;:]|。|，|；|：|$))");

    std::string out = text;

    if (opts.remove_urls) {
        out = strip_urls(out);
    }

    if (opts.remove_markdown) {
        out = strip_markdown(out);
    }

    if (!opts.custom_keywords.empty()) {
        out = remove_keywords(out, opts.custom_keywords);
    }

    if (opts.remove_emoji) {
        out = strip_emoji(out);
    }

    if (opts.remove_citation_numbers) {
        out = std::regex_replace(out, citation_re, "");
    }

    if (opts.remove_line_breaks) {
        out = collapse_whitespace(out);
    }

    return trim_copy(out);
}

} // namespace edge_tts
