#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../config/CleanupSettings.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::warning;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    s_append_logs = settings.append;
    if (settings.level >= plog::none && settings.level <= plog::verbose)
        s_default_level = static_cast<plog::Severity>(settings.level);

    if (!settings.file.empty() && !PrepareLogDirectory(settings.file))
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        plog::Severity level = config.level_override.value_or(s_default_level);
        plog::IAppender* first = nullptr;

        if (!config.filepath.empty())
        {
            bool append = config.append_override.value_or(s_append_logs);
            if (!append)
            {
                std::ofstream(config.filepath, std::ios::trunc).close();
            }

            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            first = file_appender.get();
            s_appenders.push_back(std::move(file_appender));
        }

        if (config.add_console_appender)
        {
            // stdout carries the cleaned documents
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (first)
            {
                plog::init<InstanceId>(level, first).addAppender(console_appender.get());
            }
            else
            {
                plog::init<InstanceId>(level, console_appender.get());
            }
            s_appenders.push_back(std::move(console_appender));
        }
        else if (first)
        {
            plog::init<InstanceId>(level, first);
        }
        else
        {
            // No sink requested: keep the instance so severity checks stay cheap
            plog::init<InstanceId>(plog::none);
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if MDTIDY_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
