#include "LineSpacing.hpp"

namespace processing
{

MarkdownLines ensure_heading_spacing(const MarkdownLines& lines)
{
    MarkdownLines spaced;
    spaced.reserve(lines.size() + lines.size() / 4);

    for (size_t i = 0; i < lines.size(); ++i)
    {
        spaced.push_back(lines[i]);
        if (!lines[i].info.isHeading() || i + 1 >= lines.size())
            continue;

        const auto& next = lines[i + 1].info;
        if (next.isBlank() || next.isHeading())
            continue;

        spaced.push_back(make_line(std::string()));
    }

    return spaced;
}

MarkdownLines squash_blank_lines(const MarkdownLines& lines)
{
    MarkdownLines squashed;
    squashed.reserve(lines.size());

    bool previous_blank = false;
    for (const auto& line : lines)
    {
        const bool blank = line.info.isBlank();
        if (blank && previous_blank)
            continue;
        squashed.push_back(line);
        previous_blank = blank;
    }

    return squashed;
}

} // namespace processing
