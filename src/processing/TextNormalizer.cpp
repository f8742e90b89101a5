#include "TextNormalizer.hpp"

namespace processing
{

namespace
{

bool is_ascii_space(unsigned char c) noexcept
{
    // 0x1C..0x1F are the information separators, whitespace for str.isspace-style stripping
    return c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1C && c <= 0x1F);
}

// UTF-8 encoded Unicode whitespace outside ASCII
constexpr std::string_view kUnicodeSpaces[] = {
    "\xC2\x85",     // U+0085 NEXT LINE
    "\xC2\xA0",     // U+00A0 NO-BREAK SPACE
    "\xE1\x9A\x80", // U+1680 OGHAM SPACE MARK
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84", "\xE2\x80\x85",
    "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A", // U+2000..U+200A
    "\xE2\x80\xA8", // U+2028 LINE SEPARATOR
    "\xE2\x80\xA9", // U+2029 PARAGRAPH SEPARATOR
    "\xE2\x80\xAF", // U+202F NARROW NO-BREAK SPACE
    "\xE2\x81\x9F", // U+205F MEDIUM MATHEMATICAL SPACE
    "\xE3\x80\x80", // U+3000 IDEOGRAPHIC SPACE
};

bool starts_with(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Byte length of the whitespace character that opens text, 0 if it is not whitespace
size_t leading_space_length(std::string_view text) noexcept
{
    if (text.empty())
        return 0;
    if (is_ascii_space(static_cast<unsigned char>(text.front())))
        return 1;
    for (std::string_view space : kUnicodeSpaces)
    {
        if (starts_with(text, space))
            return space.size();
    }
    return 0;
}

size_t trailing_space_length(std::string_view text) noexcept
{
    if (text.empty())
        return 0;
    if (is_ascii_space(static_cast<unsigned char>(text.back())))
        return 1;
    for (std::string_view space : kUnicodeSpaces)
    {
        if (ends_with(text, space))
            return space.size();
    }
    return 0;
}

} // namespace

std::string normalize_line_endings(const std::string& text)
{
    if (text.empty())
        return text;
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            // \r\n and a lone \r both become a single \n
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::vector<std::string> split_lines(const std::string& text)
{
    std::vector<std::string> lines;
    if (text.empty())
        return lines;

    const std::string normalized = normalize_line_endings(text);

    size_t start = 0;
    while (start < normalized.size())
    {
        size_t end = normalized.find('\n', start);
        if (end == std::string::npos)
        {
            lines.emplace_back(normalized, start, std::string::npos);
            break;
        }
        lines.emplace_back(normalized, start, end - start);
        start = end + 1;
    }

    return lines;
}

std::string join_lines(const std::vector<std::string>& lines)
{
    size_t total = 0;
    for (const auto& line : lines)
        total += line.size() + 1;

    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string_view trim(std::string_view text) noexcept
{
    while (size_t n = leading_space_length(text))
        text.remove_prefix(n);
    return trim_right(text);
}

std::string_view trim_right(std::string_view text) noexcept
{
    while (size_t n = trailing_space_length(text))
        text.remove_suffix(n);
    return text;
}

} // namespace processing
