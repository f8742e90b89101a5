#pragma once

#include "../config/CleanupSettings.hpp"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;
class ResultPreparation;

class Application
{
public:
    enum ExitCode
    {
        kExitOk = 0,
        kExitUsage = 1,
        kExitConfiguration = 2,
        kExitIo = 3
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct CommandLine
    {
        std::string config_path = "mdtidy.toml";
        std::optional<std::string> output_path;
        std::vector<std::string> inputs;
        std::vector<std::string> extra_patterns;
        bool in_place = false;
        bool json = false;
        bool no_domain_headings = false;
        bool no_combine_headings = false;
        bool no_reflow = false;
        bool verbose = false;
        bool init_config = false;
        bool show_help = false;
        bool show_version = false;
    };

    bool parseCommandLineArgs(std::string& error);
    bool initializeConfig();
    bool initializeLogging();
    void applyCommandLineOverrides();
    void replayEarlyReports();

    int processInputs();
    bool processFile(const std::string& path);
    bool processStdin();

    // Cleans one document; returns false when the input could not be handled
    bool transform(const std::string& input, const std::string& source, std::string& output, bool& changed);

    bool writeOutput(const std::string& path, const std::string& content);
    int exitCodeFromReports() const;

    void printUsage(std::ostream& os) const;

    int argc_;
    char** argv_;
    CommandLine cli_;

    CleanupSettings cleanup_settings_;
    LoggingSettings logging_settings_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<ResultPreparation> preparation_;
};
