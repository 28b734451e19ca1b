/**
 * @file platform_info.h
 * @brief Host platform and build identification
 *
 * Both values are fixed at compile time.
 */

#pragma once

#include <string>

namespace tiptv::platform {

/// @brief Operating systems the shell is built for
enum class Platform {
    WINDOWS,
    MACOS,
    LINUX,
    IOS,
    ANDROID
};

/**
 * @brief Platform this binary was compiled for
 */
Platform currentPlatform();

/**
 * @brief Lowercase identifier: "windows", "macos", "linux", "ios" or "android"
 */
std::string platformToString(Platform p);

/**
 * @brief Semantic version embedded by the build (TIPTV_APP_VERSION)
 */
const char* appVersion() noexcept;

} // namespace tiptv::platform
