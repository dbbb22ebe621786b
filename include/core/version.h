#pragma once

#include <string>

namespace spotty::core {

// "<version> <build date> (<profile>)", profile is "debug" or "release".
std::string getVersionString();

// Bare semantic version, e.g. "1.3.1".
const char* getVersion();

}  // namespace spotty::core
