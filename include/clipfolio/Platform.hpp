#pragma once
// Compile-time target platform selection

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace clipfolio {

enum class TargetPlatform {
    Linux,
    Windows,
    MacOS,
    Android,
    IOS
};

constexpr bool isMobile(TargetPlatform platform) {
    return platform == TargetPlatform::Android || platform == TargetPlatform::IOS;
}

#if defined(__ANDROID__)
inline constexpr TargetPlatform kTargetPlatform = TargetPlatform::Android;
#elif defined(__APPLE__) && TARGET_OS_IPHONE
inline constexpr TargetPlatform kTargetPlatform = TargetPlatform::IOS;
#elif defined(__APPLE__)
inline constexpr TargetPlatform kTargetPlatform = TargetPlatform::MacOS;
#elif defined(_WIN32)
inline constexpr TargetPlatform kTargetPlatform = TargetPlatform::Windows;
#else
inline constexpr TargetPlatform kTargetPlatform = TargetPlatform::Linux;
#endif

const char* platformName(TargetPlatform platform);

} // namespace clipfolio
