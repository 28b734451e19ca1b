/**
 * @file main.cpp
 * @brief TIPTV Shell Backend - native command host
 *
 * Exposes the application commands (platform info, version, greet) to the
 * TIPTV UI layer over a loopback JSON invoke bridge.
 *
 * @date 2026-10-17
 */

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

#include <tiptv/platform/platform_info.h>

#include "logger.h"
#include "exceptions.h"
#include "infrastructure/app_config.h"
#include "commands/app_commands.h"
#include "commands/command_registry.h"
#include "handlers/invoke_handler.h"

namespace {

/**
 * @brief Print application banner
 */
void printBanner() {
    std::cout << R"(
  _____ ___ ____ _______     __
 |_   _|_ _|  _ \_   _\ \   / /
   | |  | || |_) || |  \ \ / /
   | |  | ||  __/ | |   \ V /
   |_| |___|_|    |_|    \_/

)" << std::endl;
    std::cout << "  TIPTV Shell Backend" << std::endl;
    std::cout << "  Version: " << tiptv::platform::appVersion() << std::endl;
}

} // anonymous namespace

/**
 * @brief Main entry point
 */
int main(int /* argc */, char* /* argv */[]) {
    printBanner();

    try {
        AppConfig appConfig = AppConfig::fromEnvironment();

        common::Logger::initialize("tiptv-shell", appConfig.logLevel,
                                   appConfig.logToFile, appConfig.logFile);

        appConfig.validate();

        spdlog::info("Starting TIPTV shell backend...");
        spdlog::info("Platform: {}",
                     tiptv::platform::platformToString(tiptv::platform::currentPlatform()));

        // Command table is fixed from here on
        const commands::CommandRegistry registry(commands::appCommands());
        handlers::InvokeHandler invokeHandler(&registry);

        auto& app = drogon::app();

        app.setLogLevel(trantor::Logger::kWarn)
           .addListener(appConfig.bridgeHost, appConfig.bridgePort)
           .setThreadNum(appConfig.bridgeThreads)
           .setClientMaxBodySize(64 * 1024);

        // Enable CORS for the webview origin
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
        });

        // Handle OPTIONS requests for CORS preflight (one and two path segments)
        auto preflight = [](const drogon::HttpRequestPtr& /* req */,
                            std::function<void(const drogon::HttpResponsePtr&)>&& callback,
                            const std::string& /* first */,
                            const std::string& /* second */) {
            auto resp = drogon::HttpResponse::newHttpResponse();
            resp->setStatusCode(drogon::k204NoContent);
            callback(resp);
        };
        app.registerHandler("/{first}/{second}", preflight, {drogon::Options});
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        invokeHandler.registerRoutes(app);

        spdlog::info("Invoke bridge listening on http://{}:{}",
                     appConfig.bridgeHost, appConfig.bridgePort);

        app.run();

    } catch (const common::TiptvException& e) {
        spdlog::critical("Startup failed: {}", e.what());
        common::Logger::flush();
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        common::Logger::flush();
        return 1;
    }

    spdlog::info("Shell backend stopped");
    common::Logger::flush();
    return 0;
}
