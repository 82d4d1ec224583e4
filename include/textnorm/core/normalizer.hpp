#pragma once

#include "textnorm/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace textnorm::normalizer {

// Total and pure. Steps run in a fixed order: newlines, tabs, trailing
// whitespace, final newline. Applying it twice gives the same text as once.
auto normalize(std::string_view text, const NormalizationConfig& config) -> std::string;

// CR-LF and lone CR become LF
auto unify_newlines(std::string_view text) -> std::string;

// Splits on LF; "a\n" yields {"a", ""}
auto split_lines(std::string_view text) -> std::vector<std::string_view>;

auto convert_tabs(std::string_view line, const NormalizationConfig& config) -> std::string;

// Strips spaces and tabs from the right edge. With keep_tabs only spaces go,
// so no tab byte is ever removed from a tab-sensitive file.
auto trim_trailing_whitespace(std::string_view line, bool keep_tabs) -> std::string_view;

} // namespace textnorm::normalizer
