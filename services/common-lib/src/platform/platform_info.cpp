/**
 * @file platform_info.cpp
 * @brief Compile-time platform detection and embedded version
 */

#include "tiptv/platform/platform_info.h"

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

#ifndef TIPTV_APP_VERSION
#error "TIPTV_APP_VERSION must be defined by the build"
#endif

namespace tiptv::platform {

Platform currentPlatform() {
#if defined(_WIN32)
    return Platform::WINDOWS;
#elif defined(__APPLE__) && TARGET_OS_IPHONE
    return Platform::IOS;
#elif defined(__APPLE__)
    return Platform::MACOS;
#elif defined(__ANDROID__)
    // Checked before __linux__, which Android also defines
    return Platform::ANDROID;
#elif defined(__linux__)
    return Platform::LINUX;
#else
#error "Unsupported platform: expected Windows, macOS, Linux, iOS or Android"
#endif
}

std::string platformToString(Platform p) {
    switch (p) {
        case Platform::WINDOWS: return "windows";
        case Platform::MACOS: return "macos";
        case Platform::LINUX: return "linux";
        case Platform::IOS: return "ios";
        case Platform::ANDROID: return "android";
    }
    return "unknown";
}

const char* appVersion() noexcept {
    return TIPTV_APP_VERSION;
}

} // namespace tiptv::platform
