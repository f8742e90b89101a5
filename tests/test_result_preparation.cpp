#include <catch2/catch_test_macros.hpp>

#include "services/ResultPreparation.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("ResultPreparation cleans md_content of a response", "[result_preparation]")
{
    ResultPreparation prep(CleanupSettings{});

    json response = {
        { "document", { { "filename", "book.pdf" }, { "md_content", "First\nsentence" }, { "text_content", "raw" } } },
        { "status", "success" },
    };

    REQUIRE(prep.prepareDocument(response));
    REQUIRE(response["document"]["md_content"] == "First sentence");
    REQUIRE(response["document"]["text_content"] == "raw");
    REQUIRE(response["document"]["filename"] == "book.pdf");
    REQUIRE(response["status"] == "success");
}

TEST_CASE("ResultPreparation accepts a bare document", "[result_preparation]")
{
    ResultPreparation prep(CleanupSettings{});
    json doc = { { "md_content", "## 2\n## Hope" } };

    REQUIRE(prep.prepareDocument(doc));
    REQUIRE(doc["md_content"] == "## 2. Hope");
}

TEST_CASE("ResultPreparation leaves documents alone when it has nothing to do", "[result_preparation]")
{
    ResultPreparation prep(CleanupSettings{});

    SECTION("already clean")
    {
        json doc = { { "md_content", "Already clean." } };
        const json before = doc;
        REQUIRE_FALSE(prep.prepareDocument(doc));
        REQUIRE(doc == before);
    }

    SECTION("empty markdown")
    {
        json doc = { { "md_content", "" } };
        REQUIRE_FALSE(prep.prepareDocument(doc));
        REQUIRE(doc["md_content"] == "");
    }

    SECTION("missing or non-string field")
    {
        json missing = { { "document", { { "text_content", "x" } } } };
        json number = { { "md_content", 7 } };
        json null_md = { { "md_content", nullptr } };
        REQUIRE_FALSE(prep.prepareDocument(missing));
        REQUIRE_FALSE(prep.prepareDocument(number));
        REQUIRE_FALSE(prep.prepareDocument(null_md));
        REQUIRE(number["md_content"] == 7);
    }

    SECTION("not an object")
    {
        json array = json::array({ "First\nsentence" });
        REQUIRE_FALSE(prep.prepareDocument(array));
    }
}

TEST_CASE("ResultPreparation honours the enabled switch", "[result_preparation]")
{
    CleanupSettings settings;
    settings.enabled = false;
    ResultPreparation prep(settings);

    json doc = { { "md_content", "First\nsentence" } };
    REQUIRE_FALSE(prep.enabled());
    REQUIRE_FALSE(prep.prepareDocument(doc));
    REQUIRE(doc["md_content"] == "First\nsentence");
}

TEST_CASE("ResultPreparation forwards settings to the cleanup options", "[result_preparation]")
{
    CleanupSettings settings;
    settings.remove_patterns = { "^Noise line$" };
    settings.reflow_paragraphs = false;
    ResultPreparation prep(settings);

    REQUIRE(prep.options().removePatterns() == settings.remove_patterns);
    REQUIRE_FALSE(prep.options().reflowParagraphs());

    json doc = { { "md_content", "Noise line\nkept\nlines" } };
    REQUIRE(prep.prepareDocument(doc));
    REQUIRE(doc["md_content"] == "kept\nlines");
}

TEST_CASE("ResultPreparation rejects invalid patterns at construction", "[result_preparation]")
{
    CleanupSettings settings;
    settings.remove_patterns = { "[" };
    REQUIRE_THROWS_AS(ResultPreparation(settings), processing::ConfigurationError);
}
