#pragma once

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace processing
{

// Raised while building options, never while a document is being cleaned
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Immutable set of switches for one cleanup_markdown() call
 *
 * Removal patterns are compiled once in the constructor (ECMAScript grammar,
 * case-insensitive, search semantics). Copies share the compiled patterns
 * read-only, so a single instance may be used by concurrent callers.
 */
class MarkdownCleanupOptions
{
public:
    MarkdownCleanupOptions();

    /// @throws ConfigurationError if any pattern is not a valid regular expression
    explicit MarkdownCleanupOptions(std::vector<std::string> remove_patterns,
                                    bool auto_remove_domain_headings = true,
                                    bool combine_numbered_headings = true,
                                    bool reflow_paragraphs = true);

    [[nodiscard]] const std::vector<std::string>& removePatterns() const noexcept { return patterns_->sources; }
    [[nodiscard]] const std::vector<std::regex>& compiledPatterns() const noexcept { return patterns_->compiled; }

    [[nodiscard]] bool autoRemoveDomainHeadings() const noexcept { return auto_remove_domain_headings_; }
    [[nodiscard]] bool combineNumberedHeadings() const noexcept { return combine_numbered_headings_; }
    [[nodiscard]] bool reflowParagraphs() const noexcept { return reflow_paragraphs_; }

private:
    struct PatternSet
    {
        std::vector<std::string> sources;
        std::vector<std::regex> compiled;
    };

    std::shared_ptr<const PatternSet> patterns_;
    bool auto_remove_domain_headings_ = true;
    bool combine_numbered_headings_ = true;
    bool reflow_paragraphs_ = true;
};

} // namespace processing
