// File: config.cpp
#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

void loadConfig(const std::string &path, Config &config)
{
    std::ifstream configFile(path);
    if (!configFile.is_open())
    {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json json;
    try
    {
        configFile >> json;
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
    }

    try
    {
        config.apiKey = json.value("apiKey", config.apiKey);
        config.apiRoot = json.value("apiRoot", config.apiRoot);
        config.sortFile = json.value("sortFile", config.sortFile);
        config.mountPoint = json.value("mountPoint", config.mountPoint);
        config.logFile = json.value("logFile", config.logFile);
        if (json.contains("logLevel"))
            config.logLevel = Logger::ParseLogLevel(json["logLevel"].get<std::string>());

        config.refreshInterval = std::chrono::seconds(json.value("refreshIntervalSeconds", static_cast<long>(config.refreshInterval.count())));
        config.ruleDebounce = std::chrono::seconds(json.value("ruleDebounceSeconds", static_cast<long>(config.ruleDebounce.count())));
        config.retryBackoff = std::chrono::milliseconds(json.value("retryBackoffMs", static_cast<long>(config.retryBackoff.count())));
        config.maxRetries = json.value("maxRetries", config.maxRetries);
        config.recoveryPollAttempts = json.value("recoveryPollAttempts", config.recoveryPollAttempts);
        config.recoveryPollInterval = std::chrono::milliseconds(json.value("recoveryPollIntervalMs", static_cast<long>(config.recoveryPollInterval.count())));
        config.pageSize = json.value("pageSize", config.pageSize);
        config.strictRules = json.value("strictRules", config.strictRules);
        config.backgroundRefresh = json.value("backgroundRefresh", config.backgroundRefresh);
    }
    catch (const nlohmann::json::type_error &ex)
    {
        throw std::runtime_error("Invalid value in config file " + path + ": " + ex.what());
    }

    if (config.pageSize <= 0)
        throw std::runtime_error("pageSize must be positive in " + path);
}

std::string configPathFromArgs(const std::vector<std::string> &args)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == "--config")
            return args[i + 1];
    }
    return kDefaultConfigPath;
}

std::string usageText()
{
    return "Usage: ./rdfs [options]\n"
           "--config <path>                 Path to the configuration file\n"
           "--debug                         Enable debug mode (equivalent to --log-level DEBUG)\n"
           "--log-level <level>             Set log level (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)\n"
           "--log-file <path>               Set the log file\n"
           "--apikey <key>                  Set the API key\n"
           "--api-root <url>                Set the API root URL\n"
           "--sort-file <path>              Set the sorting file\n"
           "--mount <mountpoint>            Set the FUSE mount point\n"
           "--strict-rules                  Refuse a sorting file with invalid regex rules\n";
}

bool applyArgs(const std::vector<std::string> &args, Config &config)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--help")
        {
            return false;
        }
        else if (arg == "--debug")
        {
            config.debugMode = true;
            config.logLevel = LogLevel::DEBUG;
        }
        else if (arg == "--log-level" && hasValue)
        {
            config.logLevel = Logger::ParseLogLevel(args[++i]);
        }
        else if (arg == "--log-file" && hasValue)
        {
            config.logFile = args[++i];
        }
        else if (arg == "--apikey" && hasValue)
        {
            config.apiKey = args[++i];
        }
        else if (arg == "--api-root" && hasValue)
        {
            config.apiRoot = args[++i];
        }
        else if (arg == "--sort-file" && hasValue)
        {
            config.sortFile = args[++i];
        }
        else if (arg == "--mount" && hasValue)
        {
            config.mountPoint = args[++i];
        }
        else if (arg == "--strict-rules")
        {
            config.strictRules = true;
        }
        else if (arg == "--config" && hasValue)
        {
            ++i;
        }
    }
    return true;
}

void resolveSortFile(Config &config, const std::string &configPath)
{
    if (!config.sortFile.empty())
        return;
    std::filesystem::path dir = std::filesystem::path(configPath).parent_path();
    config.sortFile = (dir / "sorting.txt").string();
}

EngineSettings toEngineSettings(const Config &config)
{
    EngineSettings settings;
    settings.apiKey = config.apiKey;
    settings.sortFile = config.sortFile;
    settings.strictRules = config.strictRules;
    settings.ruleDebounce = config.ruleDebounce;
    settings.retry.maxRetries = config.maxRetries;
    settings.retry.backoff = config.retryBackoff;
    settings.fetcher.refreshInterval = config.refreshInterval;
    settings.fetcher.pageSize = config.pageSize;
    settings.recovery.pollAttempts = config.recoveryPollAttempts;
    settings.recovery.pollInterval = config.recoveryPollInterval;
    return settings;
}
