#include "LineClassifier.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>

namespace processing
{

namespace
{

constexpr size_t kMaxHeadingLevel = 6;

bool is_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

bool is_alnum(char c) noexcept
{
    return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_label_char(char c) noexcept
{
    return is_alnum(c) || c == '-';
}

bool is_inline_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\v' || c == '\f';
}

bool starts_with(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Linear scan over the stripped line, so arbitrarily long headings are fine.
// "##" reads as a level-1 heading whose text is "#"; a bare "#" has empty text.
std::optional<HeadingInfo> parse_heading(std::string_view stripped)
{
    size_t hashes = 0;
    while (hashes < stripped.size() && hashes < kMaxHeadingLevel && stripped[hashes] == '#')
        ++hashes;
    if (hashes == 0)
        return std::nullopt;

    HeadingInfo heading;
    const std::string_view rest = trim(stripped.substr(hashes));
    if (!rest.empty())
    {
        heading.level = static_cast<int>(hashes);
        heading.text = std::string(rest);
    }
    else if (hashes > 1)
    {
        heading.level = static_cast<int>(hashes) - 1;
        heading.text = "#";
    }
    else
    {
        heading.level = 1;
        return heading;
    }

    heading.domain_shaped = is_domain_shaped(heading.text);
    heading.numeric = parse_numeric_label(heading.text);
    return heading;
}

// "- ", "* ", "+ " or "<digits>. " followed by at least one space
bool is_list_item(std::string_view stripped) noexcept
{
    size_t marker = 0;
    if (stripped.front() == '*' || stripped.front() == '-' || stripped.front() == '+')
    {
        marker = 1;
    }
    else
    {
        while (marker < stripped.size() && is_digit(stripped[marker]))
            ++marker;
        if (marker == 0 || marker >= stripped.size() || stripped[marker] != '.')
            return false;
        ++marker;
    }
    return marker < stripped.size() && is_inline_space(stripped[marker]);
}

bool is_thematic_break(std::string_view stripped) noexcept
{
    if (stripped.size() < 3)
        return false;
    const char first = stripped.front();
    if (first != '=' && first != '-')
        return false;
    return std::all_of(stripped.begin(), stripped.end(), [first](char c) { return c == first; });
}

} // namespace

std::optional<NumericLabel> parse_numeric_label(std::string_view text)
{
    size_t digits = 0;
    while (digits < text.size() && is_digit(text[digits]))
        ++digits;
    if (digits == 0)
        return std::nullopt;

    NumericLabel label;
    label.digits = std::string(text.substr(0, digits));
    if (digits == text.size())
        return label;

    if (digits + 1 != text.size() || (text[digits] != '.' && text[digits] != ')'))
        return std::nullopt;
    label.separator = text[digits];
    return label;
}

// Dot-separated labels of letters, digits and '-'; at least two labels.
// The first label starts and ends with a letter or digit.
bool is_domain_shaped(std::string_view text)
{
    const size_t first_dot = text.find('.');
    if (first_dot == std::string_view::npos || first_dot == 0)
        return false;

    const std::string_view first = text.substr(0, first_dot);
    if (!is_alnum(first.front()) || !is_alnum(first.back()))
        return false;
    if (!std::all_of(first.begin(), first.end(), is_label_char))
        return false;

    std::string_view rest = text.substr(first_dot + 1);
    while (true)
    {
        const size_t dot = rest.find('.');
        const std::string_view label = rest.substr(0, dot);
        if (label.empty() || !std::all_of(label.begin(), label.end(), is_label_char))
            return false;
        if (dot == std::string_view::npos)
            return true;
        rest.remove_prefix(dot + 1);
    }
}

ClassifiedLine classify_line(std::string_view raw_line)
{
    ClassifiedLine line;
    const std::string_view stripped = trim(raw_line);

    if (stripped.empty())
    {
        line.kind = LineKind::Blank;
        return line;
    }

    if (auto heading = parse_heading(stripped))
    {
        line.kind = LineKind::Heading;
        line.heading = std::move(heading);
        return line;
    }

    if (starts_with(stripped, "```"))
        line.kind = LineKind::CodeFence;
    else if (stripped.front() == '>')
        line.kind = LineKind::Blockquote;
    else if (is_list_item(stripped))
        line.kind = LineKind::ListItem;
    else if (starts_with(raw_line, "    ") || starts_with(raw_line, "\t"))
        line.kind = LineKind::IndentedBlock;
    else if (stripped.front() == '|' && std::count(stripped.begin(), stripped.end(), '|') >= 2)
        line.kind = LineKind::TableRow;
    else if (starts_with(stripped, "<!--") && ends_with(stripped, "-->"))
        line.kind = LineKind::HtmlComment;
    else if (is_thematic_break(stripped))
        line.kind = LineKind::ThematicBreak;
    else
        line.kind = LineKind::Prose;

    return line;
}

MarkdownLine make_line(std::string content)
{
    MarkdownLine line;
    line.info = classify_line(content);
    line.content = std::move(content);
    return line;
}

MarkdownLines to_markdown_lines(std::vector<std::string> raw_lines)
{
    MarkdownLines lines;
    lines.reserve(raw_lines.size());
    for (auto& raw : raw_lines)
        lines.push_back(make_line(std::move(raw)));
    return lines;
}

std::vector<std::string> to_strings(const MarkdownLines& lines)
{
    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines)
        out.push_back(line.content);
    return out;
}

const char* line_kind_name(LineKind kind) noexcept
{
    switch (kind)
    {
    case LineKind::Heading:
        return "heading";
    case LineKind::CodeFence:
        return "code_fence";
    case LineKind::ListItem:
        return "list_item";
    case LineKind::TableRow:
        return "table_row";
    case LineKind::Blockquote:
        return "blockquote";
    case LineKind::ThematicBreak:
        return "thematic_break";
    case LineKind::HtmlComment:
        return "html_comment";
    case LineKind::IndentedBlock:
        return "indented_block";
    case LineKind::Blank:
        return "blank";
    case LineKind::Prose:
        return "prose";
    }
    return "unknown";
}

} // namespace processing
