#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 120 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(std::max<std::size_t>(bytes, 1), std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = std::min(MaxPreview(), text.size());
    // never split a UTF-8 sequence; back up to its lead byte
    if (cut < text.size())
    {
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
            --cut;
    }
    const std::string_view head = text.substr(0, cut);

    std::string out;
    out.reserve(head.size() + 24);
    for (char ch : head)
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            // other control bytes would corrupt the log line
            out.push_back(static_cast<unsigned char>(ch) < 0x20 ? '?' : ch);
            break;
        }
    }

    if (text.size() > cut)
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

std::string Diagnostics::Shape(std::string_view text)
{
    std::size_t lines = text.empty() ? 0 : 1;
    lines += static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    if (!text.empty() && text.back() == '\n')
        --lines;
    return "lines=" + std::to_string(lines) + " bytes=" + std::to_string(text.size());
}

} // namespace processing
