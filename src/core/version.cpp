#include "core/version.h"

#ifndef SPOTTY_VERSION
#define SPOTTY_VERSION "0.0.0"
#endif

#ifndef SPOTTY_BUILD_DATE
#define SPOTTY_BUILD_DATE "unknown"
#endif

namespace spotty::core {

const char* getVersion() {
    return SPOTTY_VERSION;
}

std::string getVersionString() {
#ifdef SPOTTY_DEBUG_BUILD
    constexpr const char* kProfile = "debug";
#else
    constexpr const char* kProfile = "release";
#endif
    return std::string(SPOTTY_VERSION) + " " + SPOTTY_BUILD_DATE + " (" + kProfile + ")";
}

}  // namespace spotty::core
