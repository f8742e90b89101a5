#include "Application.hpp"
#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/MarkdownCleanup.hpp"
#include "services/ResultPreparation.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

#ifndef MDTIDY_VERSION_STRING
#define MDTIDY_VERSION_STRING "0.0.0"
#endif

namespace
{

bool readAll(std::istream& in, std::string& out)
{
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return false;
    out = ss.str();
    return true;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() = default;

int Application::run()
{
    std::string usage_error;
    if (!parseCommandLineArgs(usage_error))
    {
        std::cerr << "mdtidy: " << usage_error << "\n\n";
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (cli_.show_help)
    {
        printUsage(std::cout);
        return kExitOk;
    }
    if (cli_.show_version)
    {
        std::cout << "mdtidy " << MDTIDY_VERSION_STRING << "\n";
        return kExitOk;
    }

    const bool config_ok = initializeConfig();
    applyCommandLineOverrides();

    if (!initializeLogging())
    {
        std::cerr << "mdtidy: failed to initialize logging\n";
    }
    replayEarlyReports();

    if (cli_.init_config)
    {
        // Do not overwrite a file we could not parse
        if (!config_ok)
        {
            PLOG_ERROR << "Refusing to rewrite " << config_->path() << ": " << config_->lastError();
            return kExitConfiguration;
        }
        if (!config_->save())
        {
            PLOG_ERROR << "Could not write " << config_->path() << ": " << config_->lastError();
            return kExitConfiguration;
        }
        std::cerr << "mdtidy: wrote " << config_->path() << "\n";
        return kExitOk;
    }

    if (!config_ok)
    {
        PLOG_WARNING << "Continuing with default settings after config error: " << config_->lastError();
    }

    try
    {
        preparation_ = std::make_unique<ResultPreparation>(cleanup_settings_);
    }
    catch (const processing::ConfigurationError& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Configuration, "Invalid markdown_cleanup settings",
                                          ex.what());
        return kExitConfiguration;
    }

    return processInputs();
}

bool Application::parseCommandLineArgs(std::string& error)
{
    auto next_value = [&](int& i, const std::string& flag, std::string& out) -> bool
    {
        if (i + 1 >= argc_)
        {
            error = "option " + flag + " requires a value";
            return false;
        }
        out = argv_[++i];
        return true;
    };

    bool only_files = false;
    for (int i = 1; i < argc_; ++i)
    {
        const std::string arg = argv_[i];
        std::string value;

        if (only_files || arg == "-" || arg.empty() || arg[0] != '-')
        {
            cli_.inputs.push_back(arg);
        }
        else if (arg == "--")
        {
            only_files = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            cli_.show_help = true;
        }
        else if (arg == "--version")
        {
            cli_.show_version = true;
        }
        else if (arg == "-c" || arg == "--config")
        {
            if (!next_value(i, arg, cli_.config_path))
                return false;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (!next_value(i, arg, value))
                return false;
            cli_.output_path = value;
        }
        else if (arg == "-p" || arg == "--remove-pattern")
        {
            if (!next_value(i, arg, value))
                return false;
            cli_.extra_patterns.push_back(value);
        }
        else if (arg == "-i" || arg == "--in-place")
        {
            cli_.in_place = true;
        }
        else if (arg == "--json")
        {
            cli_.json = true;
        }
        else if (arg == "--no-domain-headings")
        {
            cli_.no_domain_headings = true;
        }
        else if (arg == "--no-combine-headings")
        {
            cli_.no_combine_headings = true;
        }
        else if (arg == "--no-reflow")
        {
            cli_.no_reflow = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            cli_.verbose = true;
        }
        else if (arg == "--init-config")
        {
            cli_.init_config = true;
        }
        else
        {
            error = "unknown option " + arg;
            return false;
        }
    }

    if (cli_.in_place && cli_.output_path)
    {
        error = "--in-place and --output cannot be combined";
        return false;
    }
    if (cli_.in_place && cli_.inputs.empty())
    {
        error = "--in-place needs at least one FILE";
        return false;
    }
    if (cli_.output_path && cli_.inputs.size() > 1)
    {
        error = "--output accepts a single input";
        return false;
    }
    return true;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(cli_.config_path);

    TableCallbacks cleanup;
    cleanup.load = [this](const toml::table& section)
    {
        SettingsSerializer::deserializeCleanup(section, cleanup_settings_);
    };
    cleanup.save = [this]() -> toml::table
    {
        return SettingsSerializer::serializeCleanup(cleanup_settings_);
    };
    config_->registerTable("markdown_cleanup", std::move(cleanup),
                           { "enabled", "remove_patterns", "auto_remove_domain_headings", "combine_numbered_headings",
                             "reflow_paragraphs" });

    TableCallbacks logging;
    logging.load = [this](const toml::table& section)
    {
        SettingsSerializer::deserializeLogging(section, logging_settings_);
    };
    logging.save = [this]() -> toml::table
    {
        return SettingsSerializer::serializeLogging(logging_settings_);
    };
    config_->registerTable("logging", std::move(logging), { "level", "file", "append", "verbose" });

    return config_->load();
}

void Application::applyCommandLineOverrides()
{
    for (const auto& pattern : cli_.extra_patterns)
        cleanup_settings_.remove_patterns.push_back(pattern);
    if (cli_.no_domain_headings)
        cleanup_settings_.auto_remove_domain_headings = false;
    if (cli_.no_combine_headings)
        cleanup_settings_.combine_numbered_headings = false;
    if (cli_.no_reflow)
        cleanup_settings_.reflow_paragraphs = false;
    if (cli_.verbose)
        logging_settings_.verbose = true;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(logging_settings_))
        return false;

    const bool verbose = logging_settings_.verbose;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = logging_settings_.file,
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = 10 * 1024 * 1024,
                                                     .backup_count = 3,
                                                     .add_console_appender = true });

    ok = utils::LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(
             { .name = "diagnostics",
               .filepath = verbose ? logging_settings_.file : std::string(),
               .append_override = true,
               .level_override = verbose ? std::optional<plog::Severity>(plog::debug)
                                         : std::optional<plog::Severity>(plog::none),
               .max_file_size = 10 * 1024 * 1024,
               .backup_count = 3,
               .add_console_appender = verbose && logging_settings_.file.empty() }) &&
         ok;

#if MDTIDY_PROFILING_LEVEL >= 1
    ok = utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
             { .name = "profiling",
               .filepath = logging_settings_.file,
               .append_override = true,
               .level_override = plog::debug,
               .max_file_size = 10 * 1024 * 1024,
               .backup_count = 3,
               .add_console_appender = logging_settings_.file.empty() }) &&
         ok;
#endif

    processing::Diagnostics::SetVerbose(verbose);
    return ok;
}

void Application::replayEarlyReports()
{
    // Reports queued while loading the config were emitted before any appender existed
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
        utils::ErrorReporter::LogReport(report);
}

int Application::processInputs()
{
    PROFILE_SCOPE_FUNCTION();

    if (!preparation_->enabled())
        PLOG_INFO << "markdown_cleanup.enabled = false; documents pass through unchanged";

    if (cli_.inputs.empty())
    {
        processStdin();
    }
    else
    {
        for (const auto& path : cli_.inputs)
        {
            if (path == "-")
                processStdin();
            else
                processFile(path);
        }
    }

    return exitCodeFromReports();
}

bool Application::processStdin()
{
    std::string input;
    if (!readAll(std::cin, input))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to read standard input");
        return false;
    }

    std::string output;
    bool changed = false;
    if (!transform(input, "<stdin>", output, changed))
        return false;

    if (cli_.output_path)
        return writeOutput(*cli_.output_path, output);

    std::cout << output;
    std::cout.flush();
    return static_cast<bool>(std::cout);
}

bool Application::processFile(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Cannot open input file", path);
        return false;
    }

    std::string input;
    if (!readAll(in, input))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to read input file", path);
        return false;
    }
    in.close();

    std::string output;
    bool changed = false;
    if (!transform(input, path, output, changed))
        return false;

    if (cli_.in_place)
    {
        if (!changed)
        {
            PLOG_INFO << path << ": unchanged";
            return true;
        }
        PLOG_INFO << path << ": rewritten";
        return writeOutput(path, output);
    }

    if (cli_.output_path)
        return writeOutput(*cli_.output_path, output);

    std::cout << output;
    return static_cast<bool>(std::cout);
}

bool Application::transform(const std::string& input, const std::string& source, std::string& output, bool& changed)
{
    if (cli_.json)
    {
        nlohmann::json result;
        try
        {
            result = nlohmann::json::parse(input);
        }
        catch (const nlohmann::json::parse_error& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Input is not valid JSON",
                                              source + ": " + ex.what());
            return false;
        }

        changed = preparation_->prepareDocument(result);
        if (!changed)
        {
            output = input;
            return true;
        }

        output = result.dump(2);
        output.push_back('\n');
        return true;
    }

    if (!preparation_->enabled())
    {
        output = input;
        changed = false;
        return true;
    }

    output = processing::cleanup_markdown(input, preparation_->options());
    changed = output != input;
    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << source << ": " << processing::Diagnostics::Shape(input) << " -> "
            << processing::Diagnostics::Shape(output);
    }
    return true;
}

bool Application::writeOutput(const std::string& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Cannot open output file", path);
        return false;
    }
    out << content;
    out.close();
    if (!out)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed to write output file", path);
        return false;
    }
    return true;
}

int Application::exitCodeFromReports() const
{
    int code = kExitOk;
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity < utils::ErrorSeverity::Error)
            continue;
        if (report.category == utils::ErrorCategory::Configuration)
            return kExitConfiguration;
        code = kExitIo;
    }
    return code;
}

void Application::printUsage(std::ostream& os) const
{
    os << "Usage: mdtidy [options] [FILE...]\n"
          "\n"
          "Cleans up Markdown exported by a document converter. Without FILE,\n"
          "reads standard input and writes standard output.\n"
          "\n"
          "Options:\n"
          "  -c, --config PATH          configuration file (default: mdtidy.toml)\n"
          "  -o, --output PATH          write the result to PATH (single input)\n"
          "  -i, --in-place             rewrite each FILE when its content changed\n"
          "      --json                 inputs are conversion results with md_content\n"
          "  -p, --remove-pattern RE    drop lines matching RE (repeatable)\n"
          "      --no-domain-headings   keep repeated domain-like headings\n"
          "      --no-combine-headings  keep \"## 2\" / \"## Title\" pairs apart\n"
          "      --no-reflow            keep prose line breaks\n"
          "  -v, --verbose              trace every cleanup stage\n"
          "      --init-config          write the effective settings to the config file\n"
          "  -h, --help                 show this help\n"
          "      --version              show the version\n"
          "\n"
          "Exit status: 0 ok, 1 usage error, 2 configuration error, 3 I/O error.\n";
}
