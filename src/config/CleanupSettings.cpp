#include "CleanupSettings.hpp"

processing::MarkdownCleanupOptions CleanupSettings::toOptions() const
{
    return processing::MarkdownCleanupOptions(remove_patterns, auto_remove_domain_headings, combine_numbered_headings,
                                              reflow_paragraphs);
}
