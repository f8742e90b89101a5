#pragma once

#include "../config/CleanupSettings.hpp"
#include "../processing/CleanupOptions.hpp"

#include <nlohmann/json.hpp>

// Applies Markdown cleanup to a conversion result before it is handed out.
//
// Accepts either a response object ({"document": {"md_content": ...}, ...}) or
// a bare document ({"md_content": ...}). Only md_content is ever touched, and
// only when cleanup is enabled, the field is a non-empty string and the
// cleaned text differs from it.
class ResultPreparation
{
public:
    // Throws processing::ConfigurationError when a removal pattern is invalid
    explicit ResultPreparation(const CleanupSettings& settings);

    // Returns true when md_content was replaced
    bool prepareDocument(nlohmann::json& result) const;

    [[nodiscard]] bool enabled() const noexcept { return enabled_; }
    [[nodiscard]] const processing::MarkdownCleanupOptions& options() const noexcept { return options_; }

private:
    nlohmann::json* findMarkdownHolder(nlohmann::json& result) const;

    bool enabled_;
    processing::MarkdownCleanupOptions options_;
};
