#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Switches for the per-stage trace written to the diagnostics log instance.
// Only logging is affected; cleanup results never depend on these settings.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line rendering of text: escapes line breaks and tabs, truncates at MaxPreview()
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "lines=<n> bytes=<n>" for a whole document
    [[nodiscard]] static std::string Shape(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
