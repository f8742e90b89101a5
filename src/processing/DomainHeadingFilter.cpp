#include "DomainHeadingFilter.hpp"

#include <algorithm>
#include <cctype>

namespace processing
{

namespace
{

std::string to_lower_ascii(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

const HeadingInfo* domain_heading(const MarkdownLine& line)
{
    if (!line.info.isHeading() || !line.info.heading || !line.info.heading->domain_shaped)
        return nullptr;
    return &*line.info.heading;
}

} // namespace

HeadingFrequency count_domain_headings(const MarkdownLines& lines)
{
    HeadingFrequency counts;
    for (const auto& line : lines)
    {
        if (const auto* heading = domain_heading(line))
            ++counts[to_lower_ascii(heading->text)];
    }
    return counts;
}

MarkdownLines remove_repeated_domain_headings(const MarkdownLines& lines)
{
    const HeadingFrequency counts = count_domain_headings(lines);

    const bool any_repeated = std::any_of(counts.begin(), counts.end(),
                                          [](const auto& entry) { return entry.second > 1; });
    if (!any_repeated)
        return lines;

    MarkdownLines kept;
    kept.reserve(lines.size());
    for (const auto& line : lines)
    {
        if (const auto* heading = domain_heading(line))
        {
            auto it = counts.find(to_lower_ascii(heading->text));
            if (it != counts.end() && it->second > 1)
                continue;
        }
        kept.push_back(line);
    }
    return kept;
}

} // namespace processing
