#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Structural kind of a single Markdown line
enum class LineKind
{
    Heading,
    CodeFence,
    ListItem,
    TableRow,
    Blockquote,
    ThematicBreak,
    HtmlComment,
    IndentedBlock,
    Blank,
    Prose
};

// Chapter number of a numeric heading such as "## 2" or "## 3)"
struct NumericLabel
{
    std::string digits;
    char separator = '\0'; // '.', ')' or '\0' when the heading had none
};

struct HeadingInfo
{
    int level = 0;                      // 1..6
    std::string text;                   // heading text without markers or surrounding whitespace
    bool domain_shaped = false;         // "example.com", "OceanofPDF.com", "v1.2"
    std::optional<NumericLabel> numeric;

    [[nodiscard]] std::string marker() const { return std::string(static_cast<size_t>(level), '#'); }
};

struct ClassifiedLine
{
    LineKind kind = LineKind::Prose;
    std::optional<HeadingInfo> heading; // engaged iff kind == LineKind::Heading

    [[nodiscard]] bool isHeading() const noexcept { return kind == LineKind::Heading; }
    [[nodiscard]] bool isBlank() const noexcept { return kind == LineKind::Blank; }
    [[nodiscard]] bool isCodeFence() const noexcept { return kind == LineKind::CodeFence; }

    // Block structure that must never be absorbed into a reflowed paragraph
    [[nodiscard]] bool isStructural() const noexcept
    {
        return kind != LineKind::Prose && kind != LineKind::Blank;
    }
};

// A document line together with its classification, computed once when the line is created
struct MarkdownLine
{
    std::string content;
    ClassifiedLine info;
};

using MarkdownLines = std::vector<MarkdownLine>;

/// Classify one line (without its terminator). Pure; safe to call concurrently.
[[nodiscard]] ClassifiedLine classify_line(std::string_view raw_line);

[[nodiscard]] MarkdownLine make_line(std::string content);

[[nodiscard]] MarkdownLines to_markdown_lines(std::vector<std::string> raw_lines);
[[nodiscard]] std::vector<std::string> to_strings(const MarkdownLines& lines);

/// Digits optionally followed by '.' or ')'; nullopt for anything else
[[nodiscard]] std::optional<NumericLabel> parse_numeric_label(std::string_view text);

[[nodiscard]] bool is_domain_shaped(std::string_view text);

const char* line_kind_name(LineKind kind) noexcept;

} // namespace processing
