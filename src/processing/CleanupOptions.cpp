#include "CleanupOptions.hpp"

namespace processing
{

MarkdownCleanupOptions::MarkdownCleanupOptions()
    : patterns_(std::make_shared<const PatternSet>())
{
}

MarkdownCleanupOptions::MarkdownCleanupOptions(std::vector<std::string> remove_patterns,
                                               bool auto_remove_domain_headings, bool combine_numbered_headings,
                                               bool reflow_paragraphs)
    : auto_remove_domain_headings_(auto_remove_domain_headings)
    , combine_numbered_headings_(combine_numbered_headings)
    , reflow_paragraphs_(reflow_paragraphs)
{
    auto set = std::make_shared<PatternSet>();
    set->compiled.reserve(remove_patterns.size());

    for (size_t i = 0; i < remove_patterns.size(); ++i)
    {
        try
        {
            set->compiled.emplace_back(remove_patterns[i],
                                       std::regex_constants::ECMAScript | std::regex_constants::icase);
        }
        catch (const std::regex_error& ex)
        {
            throw ConfigurationError("remove_patterns[" + std::to_string(i) + "] '" + remove_patterns[i] +
                                     "' is not a valid regular expression: " + ex.what());
        }
    }

    set->sources = std::move(remove_patterns);
    patterns_ = std::move(set);
}

} // namespace processing
