#include "text-chunker.h"

#include "proxy-common.h"

namespace edge_tts {

namespace {

struct text_piece {
    std::string text;
    size_t n_cp = 0;
};

// Alternating runs of non-boundary and boundary code points, delimiters kept.
static std::vector<text_piece> split_pieces(const std::string & text) {
    std::vector<text_piece> pieces;
    text_piece cur;
    bool cur_is_boundary = false;

    uint32_t cp = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t next = utf8_next(text, pos, cp);
        const bool boundary = is_chunk_boundary(cp);
        if (cur.n_cp > 0 && boundary != cur_is_boundary) {
            pieces.push_back(std::move(cur));
            cur = text_piece();
        }
        cur_is_boundary = boundary;
        cur.text.append(text, pos, next - pos);
        cur.n_cp += 1;
        pos = next;
    }
    if (cur.n_cp > 0) {
        pieces.push_back(std::move(cur));
    }
    return pieces;
}

} // namespace

bool is_chunk_boundary(uint32_t cp) {
    switch (cp) {
        case '.': case '?': case '!': case ',': case ';': case ':':
        case '\n': case '\r':
        case 0x3002: // 。
        case 0xFF1F: // ？
        case 0xFF01: // ！
        case 0xFF0C: // ，
        case 0xFF1B: // ；
        case 0xFF1A: // ：
            return true;
        default:
            return false;
    }
}

std::vector<std::string> slice_fixed_width(const std::string & text, size_t max_length) {
    std::vector<std::string> out;
    if (max_length == 0) {
        return out;
    }
    std::string window;
    size_t n_cp = 0;
    uint32_t cp = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t next = utf8_next(text, pos, cp);
        window.append(text, pos, next - pos);
        pos = next;
        if (++n_cp == max_length) {
            out.push_back(std::move(window));
            window.clear();
            n_cp = 0;
        }
    }
    if (!window.empty()) {
        out.push_back(std::move(window));
    }
    return out;
}

std::vector<text_unit> chunk_text(const std::string & text, size_t max_length) {
    std::vector<text_unit> units;
    if (text.empty() || max_length == 0) {
        return units;
    }

    std::vector<std::string> raw;
    std::string buffer;
    size_t buffer_len = 0;
    bool has_parts = false;

    for (auto & piece : split_pieces(text)) {
        if (buffer_len + piece.n_cp <= max_length) {
            buffer += piece.text;
            buffer_len += piece.n_cp;
            has_parts = true;
            continue;
        }

        if (has_parts) {
            raw.push_back(trim_copy(buffer));
        }
        buffer.clear();
        buffer_len = 0;
        has_parts = true;

        if (piece.n_cp <= max_length) {
            buffer = std::move(piece.text);
            buffer_len = piece.n_cp;
            continue;
        }

        // Oversized run: emit full windows, keep the tail open for the next pieces.
        std::vector<std::string> windows = slice_fixed_width(piece.text, max_length);
        for (size_t k = 0; k + 1 < windows.size(); ++k) {
            raw.push_back(trim_copy(windows[k]));
        }
        buffer = std::move(windows.back());
        buffer_len = utf8_length(buffer);
    }

    if (has_parts) {
        raw.push_back(trim_copy(buffer));
    }

    if (raw.empty()) {
        raw = slice_fixed_width(text, max_length);
    }

    for (auto & content : raw) {
        if (content.empty()) {
            continue;
        }
        text_unit unit;
        unit.index = (int32_t) units.size();
        unit.content = std::move(content);
        units.push_back(std::move(unit));
    }
    return units;
}

} // namespace edge_tts
