#pragma once

/**
 * @file app_commands.h
 * @brief Commands exposed to the TIPTV UI layer
 *
 * - get_platform_info: host OS identifier
 * - get_app_version: build version
 * - greet: validated and sanitized greeting, args {"name": string}
 */

#include <cstddef>
#include <vector>
#include <json/json.h>

#include "command_registry.h"

namespace commands {

/// @brief Maximum accepted length of greet's name argument, in characters
constexpr size_t GREET_MAX_NAME_LENGTH = 100;

CommandResult getPlatformInfo(const Json::Value& args);

CommandResult getAppVersion(const Json::Value& args);

/**
 * @brief "Hello, <name>! Welcome to TIPTV."
 *
 * The name is length-checked (raw, max 100 characters) then reduced to the
 * allow-list. Fails with VALIDATION_LENGTH_EXCEEDED,
 * VALIDATION_EMPTY_AFTER_SANITIZATION or COMMAND_INVALID_ARGUMENTS.
 */
CommandResult greet(const Json::Value& args);

/**
 * @brief Definitions for every application command, in registration order
 */
std::vector<CommandDefinition> appCommands();

} // namespace commands
