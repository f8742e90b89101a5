#include "PatternRemover.hpp"
#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace processing
{

MarkdownLines remove_pattern_matches(const MarkdownLines& lines, const std::vector<std::regex>& patterns)
{
    if (patterns.empty())
        return lines;

    MarkdownLines kept;
    kept.reserve(lines.size());

    for (const auto& line : lines)
    {
        const std::string_view stripped = trim(line.content);
        if (stripped.size() > kMaxPatternLineLength)
        {
            if (Diagnostics::IsVerbose())
            {
                PLOG_DEBUG_(Diagnostics::kLogInstance)
                    << "[PatternRemover] kept " << stripped.size() << "-byte line without matching";
            }
            kept.push_back(line);
            continue;
        }

        const bool matched = std::any_of(patterns.begin(), patterns.end(),
                                         [stripped](const std::regex& re)
                                         {
                                             return std::regex_search(stripped.begin(), stripped.end(), re);
                                         });
        if (!matched)
            kept.push_back(line);
    }

    return kept;
}

} // namespace processing
