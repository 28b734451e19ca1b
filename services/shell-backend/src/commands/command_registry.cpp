/** @file command_registry.cpp
 *  @brief CommandRegistry implementation
 */

#include "command_registry.h"

#include <spdlog/spdlog.h>

#include "exceptions.h"

namespace commands {

CommandRegistry::CommandRegistry(std::vector<CommandDefinition> definitions) {
    for (auto& def : definitions) {
        if (def.name.empty()) {
            throw common::CommandException("command name cannot be empty");
        }
        if (!def.handler) {
            throw common::CommandException("command '" + def.name + "' has no handler");
        }

        std::string name = def.name;
        if (!commands_.emplace(name, std::move(def)).second) {
            throw common::CommandException("command '" + name + "' registered twice");
        }
    }

    spdlog::info("[CommandRegistry] {} commands registered", commands_.size());
}

bool CommandRegistry::contains(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(commands_.size());
    for (const auto& entry : commands_) {
        result.push_back(entry.first);
    }
    return result;
}

Json::Value CommandRegistry::describe() const {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : commands_) {
        Json::Value item;
        item["name"] = entry.second.name;
        item["description"] = entry.second.description;
        list.append(item);
    }
    return list;
}

CommandResult CommandRegistry::invoke(const std::string& name, const Json::Value& args) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        spdlog::warn("[CommandRegistry] Unknown command: {}", name);
        return CommandResult::fail(common::ErrorCode::COMMAND_NOT_FOUND,
                                   "Unknown command: " + name);
    }

    const Json::Value& effectiveArgs = args.isNull() ? Json::Value(Json::objectValue) : args;

    try {
        CommandResult result = it->second.handler(effectiveArgs);
        if (result.isSuccess()) {
            spdlog::debug("[CommandRegistry] {} completed", name);
        } else {
            // Raw input is never logged, only the error code
            spdlog::warn("[CommandRegistry] {} rejected: {}",
                         name, common::errorCodeToString(result.getErrorCode()));
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("[CommandRegistry] {} failed: {}", name, e.what());
        return CommandResult::fail(common::ErrorCode::SYSTEM_INTERNAL_ERROR,
                                   "Internal error");
    }
}

} // namespace commands
