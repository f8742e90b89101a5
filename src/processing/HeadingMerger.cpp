#include "HeadingMerger.hpp"
#include "TextNormalizer.hpp"

namespace processing
{

namespace
{

constexpr std::string_view kEnDash = "\xE2\x80\x93"; // U+2013

// Titles that already open with punctuation attach directly to the number
bool attaches_without_space(std::string_view title)
{
    if (title.empty())
        return true;
    const char first = title.front();
    if (first == '.' || first == ')' || first == '-')
        return true;
    return title.compare(0, kEnDash.size(), kEnDash) == 0;
}

} // namespace

std::optional<std::string> merge_heading_pair(const MarkdownLine& number_line, const MarkdownLine& title_line)
{
    const auto& number = number_line.info.heading;
    const auto& title = title_line.info.heading;
    if (!number || !number->numeric || !title)
        return std::nullopt;

    if (title->level != number->level || title->text.empty() || title->numeric)
        return std::nullopt;

    const char separator = number->numeric->separator != '\0' ? number->numeric->separator : '.';

    std::string merged = number->marker();
    merged += ' ';
    merged += number->numeric->digits;
    merged += separator;
    if (!attaches_without_space(title->text))
        merged += ' ';
    merged += title->text;

    return std::string(trim_right(merged));
}

MarkdownLines combine_numbered_headings(const MarkdownLines& lines)
{
    MarkdownLines combined;
    combined.reserve(lines.size());

    size_t i = 0;
    while (i < lines.size())
    {
        if (i + 1 < lines.size())
        {
            if (auto merged = merge_heading_pair(lines[i], lines[i + 1]))
            {
                combined.push_back(make_line(std::move(*merged)));
                i += 2;
                continue;
            }
        }
        combined.push_back(lines[i]);
        ++i;
    }

    return combined;
}

} // namespace processing
