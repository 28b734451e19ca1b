#pragma once

/**
 * @file app_config.h
 * @brief Shell backend application configuration
 *
 * Loaded from environment variables at startup.
 */

#include <string>
#include <spdlog/spdlog.h>

#include "config_manager.h"
#include "exceptions.h"

struct AppConfig {
    std::string bridgeHost = "127.0.0.1";
    int bridgePort = 17300;
    int bridgeThreads = 2;

    std::string logLevel = "info";
    bool logToFile = false;
    std::string logFile = "logs/tiptv-shell.log";

    static AppConfig fromEnvironment() {
        auto& cfg = common::ConfigManager::getInstance();
        AppConfig config;

        config.bridgeHost = cfg.getString(common::ConfigManager::BRIDGE_HOST, config.bridgeHost);
        config.bridgePort = cfg.getInt(common::ConfigManager::BRIDGE_PORT, config.bridgePort);
        config.bridgeThreads = cfg.getInt(common::ConfigManager::BRIDGE_THREADS, config.bridgeThreads);

        config.logLevel = cfg.getString(common::ConfigManager::LOG_LEVEL, config.logLevel);
        config.logToFile = cfg.getBool(common::ConfigManager::LOG_TO_FILE, config.logToFile);
        config.logFile = cfg.getString(common::ConfigManager::LOG_FILE, config.logFile);

        return config;
    }

    void validate() const {
        if (bridgeHost.empty()) {
            throw common::ConfigException("BRIDGE_HOST cannot be empty");
        }
        if (bridgePort < 1 || bridgePort > 65535) {
            throw common::ConfigException("BRIDGE_PORT out of range: " + std::to_string(bridgePort));
        }
        if (bridgeThreads < 1) {
            throw common::ConfigException("BRIDGE_THREADS must be at least 1");
        }
        spdlog::debug("Configuration validated");
    }
};
