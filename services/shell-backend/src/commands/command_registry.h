#pragma once

/**
 * @file command_registry.h
 * @brief Static command table exposed to the UI layer
 *
 * Built once at startup from a list of definitions and never mutated
 * afterwards, so a single instance can be shared by all bridge threads.
 */

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <json/json.h>

#include "command_result.h"

namespace commands {

/// @brief Handler signature: JSON argument object in, result out
using CommandHandler = std::function<CommandResult(const Json::Value& args)>;

struct CommandDefinition {
    std::string name;
    std::string description;
    CommandHandler handler;
};

class CommandRegistry {
public:
    /**
     * @brief Build the command table
     *
     * @param definitions Commands to expose
     * @throws common::CommandException on empty name, missing handler or duplicate name
     */
    explicit CommandRegistry(std::vector<CommandDefinition> definitions);

    bool contains(const std::string& name) const;

    /**
     * @brief Registered command names, sorted
     */
    std::vector<std::string> names() const;

    /**
     * @brief JSON array of {name, description}
     */
    Json::Value describe() const;

    /**
     * @brief Dispatch a command by name
     *
     * Never throws. Unknown names yield COMMAND_NOT_FOUND; a handler that
     * throws is logged and reported as SYSTEM_INTERNAL_ERROR.
     *
     * @param name Command name
     * @param args Argument object (null is treated as {})
     */
    CommandResult invoke(const std::string& name, const Json::Value& args) const;

private:
    std::map<std::string, CommandDefinition> commands_;
};

} // namespace commands
