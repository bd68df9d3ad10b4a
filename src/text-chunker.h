#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace edge_tts {

static constexpr size_t k_default_chunk_size = 300;

struct text_unit {
    int32_t index = 0;
    std::string content;
};

// Splits `text` on Latin and CJK sentence/clause punctuation and greedily packs
// the pieces into units of at most `max_length` code points. Empty input gives
// an empty result. A run longer than `max_length` without any boundary is cut
// into fixed-width windows.
std::vector<text_unit> chunk_text(const std::string & text, size_t max_length);

// Contiguous `max_length`-code-point windows of `text`, untrimmed.
std::vector<std::string> slice_fixed_width(const std::string & text, size_t max_length);

bool is_chunk_boundary(uint32_t cp);

} // namespace edge_tts
