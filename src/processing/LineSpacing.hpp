#pragma once

#include "LineClassifier.hpp"

namespace processing
{

// Inserts one blank line after a heading directly followed by non-blank, non-heading content
[[nodiscard]] MarkdownLines ensure_heading_spacing(const MarkdownLines& lines);

// Keeps only the first line of every run of consecutive blank lines
[[nodiscard]] MarkdownLines squash_blank_lines(const MarkdownLines& lines);

} // namespace processing
