#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

[[nodiscard]] std::string normalize_line_endings(const std::string& text);

// Splits on \n, \r\n and \r. A terminator at the very end does not start a new line.
[[nodiscard]] std::vector<std::string> split_lines(const std::string& text);

[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);

// Strips ASCII whitespace and the UTF-8 encoded Unicode spaces (NBSP, U+2000..U+200A,
// U+3000, ...). Other multi-byte characters are never touched.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::string_view trim_right(std::string_view text) noexcept;

} // namespace processing
