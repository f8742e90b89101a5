#pragma once

#include "LineClassifier.hpp"

#include <optional>

namespace processing
{

// "## 2" + "## Hope" -> "## 2. Hope". nullopt when the pair does not qualify.
[[nodiscard]] std::optional<std::string> merge_heading_pair(const MarkdownLine& number_line,
                                                            const MarkdownLine& title_line);

// Merges a pure-numeric heading with the immediately following heading of the same level.
// Exactly two lines take part in a merge; longer numbering chains are left alone.
[[nodiscard]] MarkdownLines combine_numbered_headings(const MarkdownLines& lines);

} // namespace processing
