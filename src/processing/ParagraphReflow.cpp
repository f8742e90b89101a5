#include "ParagraphReflow.hpp"
#include "TextNormalizer.hpp"

namespace processing
{

namespace
{

class ParagraphBuffer
{
public:
    explicit ParagraphBuffer(MarkdownLines& out)
        : out_(out)
    {
    }

    void append(std::string_view stripped)
    {
        if (!text_.empty())
            text_ += ' ';
        text_.append(stripped.data(), stripped.size());
        pending_ = true;
    }

    void flush()
    {
        if (!pending_)
            return;
        out_.push_back(make_line(std::move(text_)));
        text_.clear();
        pending_ = false;
    }

private:
    MarkdownLines& out_;
    std::string text_;
    bool pending_ = false;
};

// Same line with trailing whitespace removed; classification does not depend on it
MarkdownLine right_trimmed(const MarkdownLine& line)
{
    MarkdownLine out;
    out.content = std::string(trim_right(line.content));
    out.info = line.info;
    return out;
}

} // namespace

MarkdownLines reflow_paragraphs(const MarkdownLines& lines)
{
    MarkdownLines reflowed;
    reflowed.reserve(lines.size());

    ParagraphBuffer paragraph(reflowed);
    bool in_code_block = false;

    for (const auto& line : lines)
    {
        if (line.info.isCodeFence())
        {
            paragraph.flush();
            reflowed.push_back(right_trimmed(line));
            in_code_block = !in_code_block;
            continue;
        }

        if (in_code_block)
        {
            reflowed.push_back(right_trimmed(line));
            continue;
        }

        if (line.info.isBlank())
        {
            paragraph.flush();
            reflowed.push_back(make_line(std::string()));
            continue;
        }

        if (line.info.isStructural())
        {
            paragraph.flush();
            reflowed.push_back(right_trimmed(line));
            continue;
        }

        paragraph.append(trim(line.content));
    }

    paragraph.flush();
    return reflowed;
}

} // namespace processing
