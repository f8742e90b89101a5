#include "MarkdownCleanup.hpp"
#include "DomainHeadingFilter.hpp"
#include "HeadingMerger.hpp"
#include "LineClassifier.hpp"
#include "LineSpacing.hpp"
#include "ParagraphReflow.hpp"
#include "PatternRemover.hpp"
#include "StageRunner.hpp"
#include "TextNormalizer.hpp"
#include "Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace processing
{

namespace
{

void logInput(const std::string& input, const MarkdownCleanupOptions& options)
{
    if (!Diagnostics::IsVerbose())
        return;

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[MarkdownCleanup] stage=input " << Diagnostics::Shape(input)
        << " patterns=" << options.removePatterns().size()
        << " domains=" << options.autoRemoveDomainHeadings()
        << " combine=" << options.combineNumberedHeadings()
        << " reflow=" << options.reflowParagraphs()
        << " raw=" << Diagnostics::Preview(input);
}

void logStageResult(const text_processing::StageResult<MarkdownLines>& stage, size_t input_lines)
{
    if (!Diagnostics::IsVerbose() || !stage.succeeded)
        return;

    PLOG_INFO_(Diagnostics::kLogInstance)
        << "[MarkdownCleanup] stage=" << stage.stage_name << " status=ok duration=" << stage.duration.count()
        << "us lines_in=" << input_lines << " lines_out=" << stage.result.size();
}

void logCompletion(const std::string& output)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[MarkdownCleanup] stage=complete " << Diagnostics::Shape(output)
            << " output=" << Diagnostics::Preview(output);
}

// Runs one stage; a failed stage hands its input through untouched
template<typename Fn>
MarkdownLines apply_stage(const char* name, MarkdownLines lines, Fn&& fn)
{
    auto stage = run_stage<MarkdownLines>(name, [&]() { return fn(lines); });
    logStageResult(stage, lines.size());
    if (!stage.succeeded)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[MarkdownCleanup] fallback=skip stage=" << name;
        return lines;
    }
    return std::move(stage.result);
}

} // namespace

std::string cleanup_markdown(const std::string& markdown, const MarkdownCleanupOptions& options)
{
    PROFILE_SCOPE_CUSTOM("cleanup_markdown");

    if (markdown.empty())
        return markdown;

    logInput(markdown, options);

    const bool trailing_newline = markdown.back() == '\n';
    MarkdownLines lines = to_markdown_lines(split_lines(markdown));

    if (!options.compiledPatterns().empty())
    {
        lines = apply_stage("pattern_removal", std::move(lines),
                            [&](const MarkdownLines& in)
                            {
                                return remove_pattern_matches(in, options.compiledPatterns());
                            });
    }

    if (options.autoRemoveDomainHeadings())
        lines = apply_stage("domain_headings", std::move(lines), remove_repeated_domain_headings);

    if (options.combineNumberedHeadings())
        lines = apply_stage("heading_merge", std::move(lines), combine_numbered_headings);

    if (options.reflowParagraphs())
        lines = apply_stage("reflow", std::move(lines), reflow_paragraphs);

    lines = apply_stage("heading_spacing", std::move(lines), ensure_heading_spacing);
    lines = apply_stage("blank_squash", std::move(lines), squash_blank_lines);

    std::string cleaned = join_lines(to_strings(lines));
    if (trailing_newline && (cleaned.empty() || cleaned.back() != '\n'))
        cleaned.push_back('\n');

    logCompletion(cleaned);
    return cleaned;
}

} // namespace processing
