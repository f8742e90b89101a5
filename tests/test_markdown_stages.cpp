#include <catch2/catch_test_macros.hpp>

#include "processing/CleanupOptions.hpp"
#include "processing/DomainHeadingFilter.hpp"
#include "processing/HeadingMerger.hpp"
#include "processing/LineSpacing.hpp"
#include "processing/ParagraphReflow.hpp"
#include "processing/PatternRemover.hpp"
#include "processing/StageRunner.hpp"

#include <stdexcept>

using namespace processing;

namespace
{
MarkdownLines lines_of(std::vector<std::string> raw)
{
    return to_markdown_lines(std::move(raw));
}

std::vector<std::string> contents(const MarkdownLines& lines)
{
    return to_strings(lines);
}
} // namespace

TEST_CASE("remove_pattern_matches drops whole lines", "[stages][patterns]")
{
    MarkdownCleanupOptions options({ "^Noise line$", "page \\d+" });
    auto out = remove_pattern_matches(lines_of({ "  Noise line  ", "Actual content", "See PAGE 12 here", "" }),
                                      options.compiledPatterns());
    REQUIRE(contents(out) == std::vector<std::string>{ "Actual content", "" });

    SECTION("no patterns leaves input alone")
    {
        auto in = lines_of({ "a", "b" });
        REQUIRE(contents(remove_pattern_matches(in, {})) == contents(in));
    }
}

TEST_CASE("Repeated domain headings are removed everywhere", "[stages][domain_headings]")
{
    auto in = lines_of({ "## OceanofPDF.com", "# Chapter", "text", "## oceanofpdf.COM", "## example.org" });

    auto counts = count_domain_headings(in);
    REQUIRE(counts.at("oceanofpdf.com") == 2);
    REQUIRE(counts.at("example.org") == 1);
    REQUIRE(counts.count("chapter") == 0);

    auto out = remove_repeated_domain_headings(in);
    REQUIRE(contents(out) == std::vector<std::string>{ "# Chapter", "text", "## example.org" });
}

TEST_CASE("Domain-shaped prose is never removed", "[stages][domain_headings]")
{
    auto in = lines_of({ "example.com", "example.com", "# Title" });
    REQUIRE(contents(remove_repeated_domain_headings(in)) == contents(in));
}

TEST_CASE("Repeated version headings count as watermarks too", "[stages][domain_headings]")
{
    auto in = lines_of({ "## v1.2", "body", "## v1.2" });
    REQUIRE(contents(remove_repeated_domain_headings(in)) == std::vector<std::string>{ "body" });
}

TEST_CASE("merge_heading_pair joins a number with its title", "[stages][heading_merge]")
{
    auto merged = merge_heading_pair(make_line("## 2"), make_line("## Hope"));
    REQUIRE(merged);
    REQUIRE(*merged == "## 2. Hope");

    SECTION("explicit separator is kept")
    {
        REQUIRE(*merge_heading_pair(make_line("### 4)"), make_line("### Steps")) == "### 4) Steps");
    }

    SECTION("punctuation attaches without a space")
    {
        REQUIRE(*merge_heading_pair(make_line("## 3"), make_line("## - Intro")) == "## 3.- Intro");
        REQUIRE(*merge_heading_pair(make_line("## 3"), make_line("## \xE2\x80\x93 Intro")) ==
                "## 3.\xE2\x80\x93 Intro");
    }

    SECTION("pairs that do not qualify")
    {
        REQUIRE_FALSE(merge_heading_pair(make_line("## 2"), make_line("### Hope")));
        REQUIRE_FALSE(merge_heading_pair(make_line("## 2"), make_line("## 3")));
        REQUIRE_FALSE(merge_heading_pair(make_line("## 2"), make_line("Hope")));
        REQUIRE_FALSE(merge_heading_pair(make_line("## Two"), make_line("## Hope")));
        REQUIRE_FALSE(merge_heading_pair(make_line("## 2"), make_line("#")));
    }
}

TEST_CASE("combine_numbered_headings merges only adjacent pairs", "[stages][heading_merge]")
{
    auto out = combine_numbered_headings(lines_of({ "## 1", "## Start", "text", "## 2", "", "## Gap" }));
    REQUIRE(contents(out) == std::vector<std::string>{ "## 1. Start", "text", "## 2", "", "## Gap" });
    REQUIRE(out[0].info.isHeading());
    REQUIRE_FALSE(out[0].info.heading->numeric);
}

TEST_CASE("reflow_paragraphs joins prose runs", "[stages][reflow]")
{
    auto out = reflow_paragraphs(lines_of({ "First", "  sentence  ", "", "Second", "- item", "tail" }));
    REQUIRE(contents(out) == std::vector<std::string>{ "First sentence", "", "Second", "- item", "tail" });
}

TEST_CASE("reflow_paragraphs leaves fenced code alone", "[stages][reflow]")
{
    auto out = reflow_paragraphs(lines_of({ "intro", "```python", "x = 1", "y = 2", "```", "outro" }));
    REQUIRE(contents(out) == std::vector<std::string>{ "intro", "```python", "x = 1", "y = 2", "```", "outro" });

    SECTION("an unterminated fence runs to the end")
    {
        auto open = reflow_paragraphs(lines_of({ "```", "a", "b" }));
        REQUIRE(contents(open) == std::vector<std::string>{ "```", "a", "b" });
    }
}

TEST_CASE("reflow_paragraphs strips trailing whitespace of kept lines", "[stages][reflow]")
{
    auto out = reflow_paragraphs(lines_of({ "# Title   ", "   ", "| a | b |  " }));
    REQUIRE(contents(out) == std::vector<std::string>{ "# Title", "", "| a | b |" });
}

TEST_CASE("ensure_heading_spacing separates headings from content", "[stages][spacing]")
{
    auto out = ensure_heading_spacing(lines_of({ "# A", "## B", "text", "# C", "", "more", "# End" }));
    REQUIRE(contents(out) == std::vector<std::string>{ "# A", "## B", "", "text", "# C", "", "more", "# End" });
}

TEST_CASE("squash_blank_lines keeps one blank per run", "[stages][spacing]")
{
    auto out = squash_blank_lines(lines_of({ "", "", "a", "", "  ", "", "b", "" }));
    REQUIRE(contents(out) == std::vector<std::string>{ "", "a", "", "b", "" });
}

TEST_CASE("run_stage reports success and failure", "[stages][runner]")
{
    auto ok = run_stage<int>("answer", []() { return 42; });
    REQUIRE(ok.succeeded);
    REQUIRE(ok.result == 42);
    REQUIRE(ok.stage_name == "answer");
    REQUIRE_FALSE(ok.error);

    auto failed = run_stage<int>("broken", []() -> int { throw std::runtime_error("boom"); });
    REQUIRE_FALSE(failed.succeeded);
    REQUIRE(failed.error);
    REQUIRE(*failed.error == "boom");
}
