#pragma once

#include "LineClassifier.hpp"

namespace processing
{

/**
 * Joins runs of consecutive prose lines into one line separated by single
 * spaces. Blank lines, structural lines and everything between code fences
 * pass through with only their trailing whitespace removed. No column
 * wrapping is performed.
 */
[[nodiscard]] MarkdownLines reflow_paragraphs(const MarkdownLines& lines);

} // namespace processing
