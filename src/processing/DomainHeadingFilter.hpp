#pragma once

#include "LineClassifier.hpp"

#include <string>
#include <unordered_map>

namespace processing
{

// Lowercased domain-shaped heading text -> number of occurrences in the document
using HeadingFrequency = std::unordered_map<std::string, size_t>;

[[nodiscard]] HeadingFrequency count_domain_headings(const MarkdownLines& lines);

/**
 * Removes watermark headings: every domain-shaped heading ("## OceanofPDF.com")
 * whose lowercased text occurs more than once anywhere in the document. All
 * occurrences go, including the first. Domain headings seen once and all other
 * headings are kept.
 *
 * Counting has to finish over the whole document before the first line is
 * dropped, so this runs as two separate passes.
 */
[[nodiscard]] MarkdownLines remove_repeated_domain_headings(const MarkdownLines& lines);

} // namespace processing
