#pragma once

#include <string>

namespace spotty::core {

// Stable device identifier: lowercase hex SHA-1 of the advertised device name.
std::string deviceIdFromName(const std::string& name);

}  // namespace spotty::core
