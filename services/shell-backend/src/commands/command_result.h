/**
 * @file command_result.h
 * @brief Outcome of a command invocation
 */

#pragma once

#include <string>
#include <utility>
#include <json/json.h>
#include "../common/error_codes.h"

namespace commands {

/**
 * @brief Success payload or error code + message
 *
 * Serialized as {"success": true, "data": ...} or the ErrorResponse body.
 */
class CommandResult {
public:
    static CommandResult ok(const Json::Value& data) {
        return CommandResult(common::ErrorCode::SUCCESS, data, "");
    }

    static CommandResult fail(common::ErrorCode code, const std::string& message) {
        return CommandResult(code, Json::Value(), message);
    }

    bool isSuccess() const {
        return code_ == common::ErrorCode::SUCCESS;
    }

    const Json::Value& getData() const {
        return data_;
    }

    common::ErrorCode getErrorCode() const {
        return code_;
    }

    const std::string& getErrorMessage() const {
        return message_;
    }

    int getHttpStatus() const {
        return common::errorCodeToHttpStatus(code_);
    }

    Json::Value toJson() const {
        if (!isSuccess()) {
            return common::ErrorResponse(code_, message_).toJson();
        }
        Json::Value json;
        json["success"] = true;
        json["data"] = data_;
        return json;
    }

private:
    CommandResult(common::ErrorCode code, Json::Value data, std::string message)
        : code_(code), data_(std::move(data)), message_(std::move(message)) {}

    common::ErrorCode code_;
    Json::Value data_;
    std::string message_;
};

} // namespace commands
