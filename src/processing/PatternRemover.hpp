#pragma once

#include "LineClassifier.hpp"

#include <cstddef>
#include <regex>
#include <vector>

namespace processing
{

// std::regex matches recursively, one stack frame set per input character. Longer
// lines are never handed to user patterns and are always kept.
inline constexpr std::size_t kMaxPatternLineLength = 2048;

// Drops every line whose trimmed content contains a match for any of the patterns.
// Lines are removed whole; an empty pattern list returns the input unchanged.
// Trimmed lines longer than kMaxPatternLineLength bytes are kept unmatched.
[[nodiscard]] MarkdownLines remove_pattern_matches(const MarkdownLines& lines, const std::vector<std::regex>& patterns);

} // namespace processing
