/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Startup and configuration faults only. Expected input failures are
 * returned as result values, not thrown.
 *
 * @date 2026-10-17
 */

#pragma once

#include <stdexcept>
#include <string>

namespace common {

/**
 * @brief Base exception for all TIPTV shell exceptions
 */
class TiptvException : public std::runtime_error {
public:
    explicit TiptvException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public TiptvException {
public:
    explicit ConfigException(const std::string& message)
        : TiptvException("Configuration error: " + message) {}
};

/**
 * @brief Command table construction failed
 */
class CommandException : public TiptvException {
public:
    explicit CommandException(const std::string& message)
        : TiptvException("Command error: " + message) {}
};

} // namespace common
