#include "clipfolio/Platform.hpp"

namespace clipfolio {

const char* platformName(TargetPlatform platform) {
    switch (platform) {
        case TargetPlatform::Linux:   return "linux";
        case TargetPlatform::Windows: return "windows";
        case TargetPlatform::MacOS:   return "macos";
        case TargetPlatform::Android: return "android";
        case TargetPlatform::IOS:     return "ios";
    }
    return "unknown";
}

} // namespace clipfolio
