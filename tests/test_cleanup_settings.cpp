#include <catch2/catch_test_macros.hpp>

#include "config/CleanupSettings.hpp"
#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "utils/ErrorReporter.hpp"

#include <toml++/toml.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace
{

// Temporary config file removed when the test ends
class TempConfig
{
public:
    explicit TempConfig(const std::string& name)
        : path_(fs::temp_directory_path() / ("mdtidy_test_" + name + ".toml"))
    {
        fs::remove(path_);
    }

    ~TempConfig()
    {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_.string() + ".tmp", ec);
    }

    void write(const std::string& content) const
    {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read() const
    {
        std::ifstream in(path_, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

void registerSettings(ConfigManager& cfg, CleanupSettings& cleanup, LoggingSettings& logging)
{
    TableCallbacks cleanup_cb;
    cleanup_cb.load = [&](const toml::table& t) { SettingsSerializer::deserializeCleanup(t, cleanup); };
    cleanup_cb.save = [&]() { return SettingsSerializer::serializeCleanup(cleanup); };
    REQUIRE(cfg.registerTable("markdown_cleanup", cleanup_cb,
                              { "enabled", "remove_patterns", "auto_remove_domain_headings",
                                "combine_numbered_headings", "reflow_paragraphs" }));

    TableCallbacks logging_cb;
    logging_cb.load = [&](const toml::table& t) { SettingsSerializer::deserializeLogging(t, logging); };
    logging_cb.save = [&]() { return SettingsSerializer::serializeLogging(logging); };
    REQUIRE(cfg.registerTable("logging", logging_cb, { "level", "file", "append", "verbose" }));
}

} // namespace

TEST_CASE("CleanupSettings defaults enable every stage", "[config]")
{
    CleanupSettings settings;
    REQUIRE(settings.enabled);
    REQUIRE(settings.remove_patterns.empty());

    auto options = settings.toOptions();
    REQUIRE(options.autoRemoveDomainHeadings());
    REQUIRE(options.combineNumberedHeadings());
    REQUIRE(options.reflowParagraphs());
}

TEST_CASE("CleanupSettings::toOptions rejects an invalid pattern", "[config]")
{
    CleanupSettings settings;
    settings.remove_patterns = { "^ok$", "(" };
    REQUIRE_THROWS_AS(settings.toOptions(), processing::ConfigurationError);
}

TEST_CASE("SettingsSerializer reads the markdown_cleanup table", "[config][serializer]")
{
    utils::ErrorReporter::ClearErrors();

    auto table = toml::parse(R"(
enabled = false
remove_patterns = ["^Page \\d+$", 42, "Copyright"]
auto_remove_domain_headings = false
reflow_paragraphs = "yes"
)");

    CleanupSettings settings;
    SettingsSerializer::deserializeCleanup(table, settings);

    REQUIRE_FALSE(settings.enabled);
    REQUIRE(settings.remove_patterns == std::vector<std::string>{ "^Page \\d+$", "Copyright" });
    REQUIRE_FALSE(settings.auto_remove_domain_headings);
    REQUIRE(settings.combine_numbered_headings);
    // wrong type keeps the previous value
    REQUIRE(settings.reflow_paragraphs);

    // queued for replay once logging is configured
    auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Warning);
    REQUIRE(reports[0].user_message == "Ignoring non-string entry in markdown_cleanup.remove_patterns");
    REQUIRE(reports[1].user_message == "Config key 'reflow_paragraphs' must be a boolean");
    REQUIRE(reports[1].technical_details == "keeping true");
}

TEST_CASE("SettingsSerializer round-trips the logging table", "[config][serializer]")
{
    LoggingSettings in;
    in.level = 5;
    in.file = "logs/mdtidy.log";
    in.append = false;
    in.verbose = true;

    LoggingSettings out;
    SettingsSerializer::deserializeLogging(SettingsSerializer::serializeLogging(in), out);
    REQUIRE(out.level == 5);
    REQUIRE(out.file == "logs/mdtidy.log");
    REQUIRE_FALSE(out.append);
    REQUIRE(out.verbose);

    SECTION("out-of-range level is ignored")
    {
        utils::ErrorReporter::ClearErrors();
        auto table = toml::parse("level = 9");
        LoggingSettings settings;
        SettingsSerializer::deserializeLogging(table, settings);
        REQUIRE(settings.level == 3);

        auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.size() == 1);
        REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
        REQUIRE(reports[0].technical_details == "9");
    }
}

TEST_CASE("ConfigManager falls back to defaults without a file", "[config][manager]")
{
    TempConfig file("missing");
    CleanupSettings cleanup;
    LoggingSettings logging;

    ConfigManager cfg(file.path());
    registerSettings(cfg, cleanup, logging);

    REQUIRE(cfg.load());
    REQUIRE(cleanup.enabled);
    REQUIRE(logging.level == 3);
    REQUIRE(std::string(cfg.lastError()).empty());
}

TEST_CASE("ConfigManager dispatches tables to their handlers", "[config][manager]")
{
    TempConfig file("load");
    file.write(R"(
[markdown_cleanup]
enabled = true
remove_patterns = ["^Noise line$"]
combine_numbered_headings = false

[logging]
level = 4
verbose = true
)");

    CleanupSettings cleanup;
    LoggingSettings logging;
    ConfigManager cfg(file.path());
    registerSettings(cfg, cleanup, logging);

    REQUIRE(cfg.load());
    REQUIRE(cleanup.remove_patterns == std::vector<std::string>{ "^Noise line$" });
    REQUIRE_FALSE(cleanup.combine_numbered_headings);
    REQUIRE(cleanup.reflow_paragraphs);
    REQUIRE(logging.level == 4);
    REQUIRE(logging.verbose);
}

TEST_CASE("ConfigManager reports a malformed file and keeps defaults", "[config][manager]")
{
    utils::ErrorReporter::ClearErrors();

    TempConfig file("broken");
    file.write("[markdown_cleanup\nenabled = ");

    CleanupSettings cleanup;
    LoggingSettings logging;
    ConfigManager cfg(file.path());
    registerSettings(cfg, cleanup, logging);

    REQUIRE_FALSE(cfg.load());
    REQUIRE_FALSE(std::string(cfg.lastError()).empty());
    REQUIRE(cleanup.enabled);

    auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Warning);
}

TEST_CASE("ConfigManager rejects duplicate key ownership", "[config][manager]")
{
    ConfigManager cfg("unused.toml");
    TableCallbacks cb;
    cb.load = [](const toml::table&) {};
    cb.save = []() { return toml::table{}; };

    REQUIRE(cfg.registerTable("logging", cb, { "level" }));
    REQUIRE_FALSE(cfg.registerTable("logging", cb, { "file", "level" }));
    REQUIRE(cfg.registerTable("markdown_cleanup", cb, { "level" }));
}

TEST_CASE("ConfigManager saves handler tables and keeps unknown content", "[config][manager]")
{
    TempConfig file("save");
    file.write(R"(
[extra]
keep = "me"
)");

    CleanupSettings cleanup;
    LoggingSettings logging;
    ConfigManager cfg(file.path());
    registerSettings(cfg, cleanup, logging);
    REQUIRE(cfg.load());

    cleanup.remove_patterns = { "^Copyright" };
    cleanup.reflow_paragraphs = false;
    logging.level = 2;
    REQUIRE(cfg.save());

    auto saved = toml::parse(file.read());
    REQUIRE(saved["extra"]["keep"].value_or(std::string()) == "me");
    REQUIRE(saved["markdown_cleanup"]["reflow_paragraphs"].value_or(true) == false);
    REQUIRE(saved["markdown_cleanup"]["remove_patterns"][0].value_or(std::string()) == "^Copyright");
    REQUIRE(saved["logging"]["level"].value_or(int64_t{ 0 }) == 2);
    REQUIRE_FALSE(fs::exists(file.path() + ".tmp"));

    SECTION("a second manager reads back what was saved")
    {
        CleanupSettings reread;
        LoggingSettings reread_logging;
        ConfigManager again(file.path());
        registerSettings(again, reread, reread_logging);
        REQUIRE(again.load());
        REQUIRE_FALSE(reread.reflow_paragraphs);
        REQUIRE(reread.remove_patterns == cleanup.remove_patterns);
        REQUIRE(reread_logging.level == 2);
    }
}
