// File: main.cpp
#include "config.hpp"
#include "curl_transport.hpp"
#include "fuse_manager.hpp"
#include "fuse_operations.hpp"
#include "logger.hpp"
#include "namespace_engine.hpp"
#include "refresh_scheduler.hpp"
#include "virtualfs.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <vector>

std::atomic<bool> exitRequested{false};

// Signal handler to gracefully exit
void handleSignal(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        exitRequested = true; // Set exit flag
    }
}

int main(int argc, char *argv[])
{
    // Register signal handler
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::vector<std::string> args(argv + 1, argv + argc);
    Config config;

    // Check for --config option and load configuration file
    std::string configFilePath = configPathFromArgs(args);
    try
    {
        loadConfig(configFilePath, config);
        Logger::Log(LogLevel::INFO, "Configuration loaded from: " + configFilePath);
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::WARN, "Failed to load config file: " + std::string(e.what()));
    }

    // Command line arguments override defaults and the config file
    if (!applyArgs(args, config))
    {
        std::cout << usageText();
        return 0;
    }
    resolveSortFile(config, configFilePath);

    // Validate required parameters
    if (config.apiKey.empty())
    {
        std::cerr << "Error: --apikey must be provided either in the config file or as a command line argument." << std::endl;
        return 1;
    }

    // Initialize Logger
    Logger::InitLogFile(config.logFile);
    Logger::SetLogLevel(config.logLevel);
    Logger::SetDebug(config.debugMode);
    Logger::Log(LogLevel::INFO, "RDFS starting...");
    Logger::Log(LogLevel::INFO, "Sorting file: " + config.sortFile);

    std::unique_ptr<NamespaceEngine> engine;
    try
    {
        engine = std::make_unique<NamespaceEngine>(std::make_shared<CurlTransport>(config.apiRoot),
                                                   toEngineSettings(config));
    }
    catch (const RuleFileError &e)
    {
        Logger::Log(LogLevel::FATAL, "Cannot prepare sorting file: " + std::string(e.what()));
        return 1;
    }

    VirtualFS fs(*engine);
    FuseContext context(fs);

    // Initialize FuseManager
    FuseManager fuseManager(config.mountPoint, context);
    if (!fuseManager.Initialize(config.debugMode))
    {
        Logger::Log(LogLevel::ERROR, "Failed to initialize FUSE.");
        return 1;
    }

    RefreshScheduler scheduler(*engine, config.refreshInterval);
    if (config.backgroundRefresh)
    {
        Logger::Log(LogLevel::INFO, "Starting background refresh...");
        scheduler.Start();
    }

    // Run the FUSE session
    fuseManager.Run();

    // Wait for shutdown
    while (!exitRequested)
    {
        if (fuseManager.WaitForExit(std::chrono::milliseconds(500)))
            break;
    }

    scheduler.Stop();

    // Stop FUSE
    fuseManager.Stop();

    Logger::Log(LogLevel::INFO, "RDFS exited cleanly.");
    return 0;
}
