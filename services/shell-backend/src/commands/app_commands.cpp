/** @file app_commands.cpp
 *  @brief Application command implementations
 */

#include "app_commands.h"

#include <tiptv/platform/platform_info.h>
#include <tiptv/validation/input_validator.h>

namespace commands {

namespace {

common::ErrorCode toErrorCode(tiptv::validation::InputError error) {
    switch (error) {
        case tiptv::validation::InputError::LENGTH_EXCEEDED:
            return common::ErrorCode::VALIDATION_LENGTH_EXCEEDED;
        case tiptv::validation::InputError::EMPTY_AFTER_SANITIZATION:
            return common::ErrorCode::VALIDATION_EMPTY_AFTER_SANITIZATION;
        default:
            return common::ErrorCode::SYSTEM_INTERNAL_ERROR;
    }
}

} // anonymous namespace

CommandResult getPlatformInfo(const Json::Value& /* args */) {
    using namespace tiptv::platform;
    return CommandResult::ok(platformToString(currentPlatform()));
}

CommandResult getAppVersion(const Json::Value& /* args */) {
    return CommandResult::ok(tiptv::platform::appVersion());
}

CommandResult greet(const Json::Value& args) {
    if (!args.isObject() || !args["name"].isString()) {
        return CommandResult::fail(common::ErrorCode::COMMAND_INVALID_ARGUMENTS,
                                   "Missing required argument: name");
    }

    tiptv::validation::InputPolicy policy;
    policy.maxLength = GREET_MAX_NAME_LENGTH;
    policy.fieldName = "Name";
    policy.messageTemplate = "Hello, {}! Welcome to TIPTV.";

    auto result = tiptv::validation::validateAndSanitize(args["name"].asString(), policy);
    if (!result.valid) {
        return CommandResult::fail(toErrorCode(result.error), result.message);
    }

    return CommandResult::ok(result.value);
}

std::vector<CommandDefinition> appCommands() {
    return {
        {"get_platform_info", "Host operating system identifier", getPlatformInfo},
        {"get_app_version", "Application version", getAppVersion},
        {"greet", "Greeting for a validated user name", greet},
    };
}

} // namespace commands
