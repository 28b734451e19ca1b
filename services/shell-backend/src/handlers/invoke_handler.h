#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

#include "../commands/command_result.h"

namespace commands {
    class CommandRegistry;
}

namespace handlers {

/**
 * @brief Invoke bridge between the UI layer and the command registry
 *
 * Provides:
 * - POST /invoke/{command} - Run a command, JSON body = argument object
 * - GET /api/commands - List registered commands
 * - GET /api/health - Bridge health check
 *
 * Uses a non-owning pointer to the registry.
 */
class InvokeHandler {
public:
    /**
     * @brief Construct InvokeHandler
     *
     * @param registry Command registry (non-owning pointer, must outlive the handler)
     */
    explicit InvokeHandler(const commands::CommandRegistry* registry);

    /**
     * @brief Register bridge routes with Drogon application
     */
    void registerRoutes(drogon::HttpAppFramework& app);

    /**
     * @brief Parse a request body into a command argument object
     *
     * Empty or whitespace-only body yields {}. Trailing content after the
     * JSON value and non-object values are rejected.
     *
     * @param body Raw request body
     * @param args Parsed arguments (output)
     * @param error Parser message on failure (output)
     * @return false if the body is not a JSON object
     */
    static bool parseArguments(const std::string& body, Json::Value& args, std::string& error);

    /**
     * @brief Parse body and dispatch to the registry
     *
     * A body rejected by parseArguments() fails with COMMAND_INVALID_ARGUMENTS.
     * The result's getHttpStatus() is the response status.
     */
    static commands::CommandResult invokeWithBody(
        const commands::CommandRegistry& registry,
        const std::string& command,
        const std::string& body);

private:
    const commands::CommandRegistry* registry_;

    /**
     * @brief POST /invoke/{command}
     *
     * Response (success): {"success": true, "data": "linux"}
     * Response (failure): {"success": false, "error": {"code": "...", "numericCode": 5001, "message": "..."}}
     */
    void handleInvoke(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback,
        const std::string& command);

    /**
     * @brief GET /api/commands
     */
    void handleListCommands(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    /**
     * @brief GET /api/health
     *
     * Response:
     * {
     *   "service": "tiptv-shell",
     *   "status": "UP",
     *   "version": "0.1.0",
     *   "platform": "linux"
     * }
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace handlers
