// File: config.hpp
#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "logger.hpp"
#include "namespace_engine.hpp"

inline const std::string kDefaultConfigPath = "/etc/rdfs/rdfs.json";
inline const std::string kDefaultApiRoot = "https://api.real-debrid.com/rest/1.0";

struct Config
{
    std::string apiKey;
    std::string apiRoot = kDefaultApiRoot;
    // Empty means sorting.txt beside the config file
    std::string sortFile;
    std::string mountPoint = "/mnt/rdfs";
    std::string logFile = "/var/log/rdfs/rdfs.log";
    LogLevel logLevel = LogLevel::INFO;
    bool debugMode = false;

    std::chrono::seconds refreshInterval{900};
    std::chrono::seconds ruleDebounce{5};
    std::chrono::milliseconds retryBackoff{2000};
    int maxRetries = 5;
    int recoveryPollAttempts = 5;
    std::chrono::milliseconds recoveryPollInterval{1000};
    int pageSize = 2500;
    bool strictRules = false;
    bool backgroundRefresh = true;
};

// Reads the JSON config at path over the values already in config. Keys that
// are absent keep their current value. Throws std::runtime_error when the file
// can't be opened or parsed.
void loadConfig(const std::string &path, Config &config);

// Returns the --config argument, or kDefaultConfigPath.
std::string configPathFromArgs(const std::vector<std::string> &args);

// Applies command-line overrides. Returns false when --help was requested.
bool applyArgs(const std::vector<std::string> &args, Config &config);

std::string usageText();

// Fills sortFile from the config path when it is still empty.
void resolveSortFile(Config &config, const std::string &configPath);

EngineSettings toEngineSettings(const Config &config);
