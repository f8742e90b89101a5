#pragma once

#include "../processing/CleanupOptions.hpp"

#include <string>
#include <vector>

// [markdown_cleanup] table
struct CleanupSettings
{
    bool enabled = true;
    std::vector<std::string> remove_patterns;
    bool auto_remove_domain_headings = true;
    bool combine_numbered_headings = true;
    bool reflow_paragraphs = true;

    // Compiles the patterns; throws processing::ConfigurationError on an invalid one
    [[nodiscard]] processing::MarkdownCleanupOptions toOptions() const;
};

// [logging] table
struct LoggingSettings
{
    int level = 3;     // plog::Severity, 0 (none) .. 6 (verbose)
    std::string file;  // empty: console (stderr) only
    bool append = true;
    bool verbose = false;
};
