#pragma once

#include "CleanupOptions.hpp"

#include <string>

namespace processing
{

/**
 * @brief Clean up Markdown exported by a document converter
 *
 * Applies, in this order:
 *   1. removal of lines matching options.removePatterns() (when non-empty)
 *   2. removal of repeated domain-shaped headings (watermarks)
 *   3. merging of "## 2" / "## Title" heading pairs
 *   4. paragraph reflow
 *   5. a blank line after headings followed by content (always)
 *   6. collapsing of blank-line runs (always)
 *
 * Output lines are joined with '\n'. If @p markdown ends with a newline the
 * result ends with exactly one. Empty input is returned as-is.
 *
 * Never throws for any input text: a stage that fails is logged and skipped.
 * Lines of any length are safe. User patterns only see lines up to
 * kMaxPatternLineLength bytes (see PatternRemover.hpp).
 */
[[nodiscard]] std::string cleanup_markdown(const std::string& markdown, const MarkdownCleanupOptions& options);

} // namespace processing
