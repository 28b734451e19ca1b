/** @file invoke_handler.cpp
 *  @brief InvokeHandler implementation
 */

#include "invoke_handler.h"

#include <memory>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include <tiptv/platform/platform_info.h>
#include <tiptv/utils/string_utils.h>

#include "../commands/command_registry.h"

namespace handlers {

InvokeHandler::InvokeHandler(const commands::CommandRegistry* registry)
    : registry_(registry) {

    if (!registry_) {
        throw std::invalid_argument("InvokeHandler: registry cannot be nullptr");
    }

    spdlog::info("[InvokeHandler] Initialized");
}

void InvokeHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /invoke/{command}
    app.registerHandler(
        "/invoke/{command}",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& command) {
            handleInvoke(req, std::move(callback), command);
        },
        {drogon::Post}
    );

    // GET /api/commands
    app.registerHandler(
        "/api/commands",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleListCommands(req, std::move(callback));
        },
        {drogon::Get}
    );

    // GET /api/health
    app.registerHandler(
        "/api/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[InvokeHandler] Routes registered");
}

bool InvokeHandler::parseArguments(const std::string& body, Json::Value& args, std::string& error) {
    if (tiptv::utils::trim(body).empty()) {
        args = Json::Value(Json::objectValue);
        return true;
    }

    Json::CharReaderBuilder builder;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(body.data(), body.data() + body.size(), &args, &error)) {
        return false;
    }

    if (!args.isObject()) {
        error = "body must be a JSON object";
        return false;
    }

    return true;
}

commands::CommandResult InvokeHandler::invokeWithBody(
    const commands::CommandRegistry& registry,
    const std::string& command,
    const std::string& body) {

    Json::Value args;
    std::string parseError;

    if (!parseArguments(body, args, parseError)) {
        spdlog::warn("[InvokeHandler] {}: malformed body: {}", command, parseError);
        return commands::CommandResult::fail(common::ErrorCode::COMMAND_INVALID_ARGUMENTS,
                                             "Request body is not valid JSON");
    }

    return registry.invoke(command, args);
}

void InvokeHandler::handleInvoke(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback,
    const std::string& command) {

    std::string body(req->body());
    commands::CommandResult result = invokeWithBody(*registry_, command, body);

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result.toJson());
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(result.getHttpStatus()));
    callback(resp);
}

void InvokeHandler::handleListCommands(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["success"] = true;
    result["commands"] = registry_->describe();

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    callback(resp);
}

void InvokeHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value result;
    result["service"] = "tiptv-shell";
    result["status"] = "UP";
    result["version"] = tiptv::platform::appVersion();
    result["platform"] = tiptv::platform::platformToString(tiptv::platform::currentPlatform());

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    callback(resp);
}

} // namespace handlers
