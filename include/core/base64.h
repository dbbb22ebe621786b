#ifndef SPOTTY_CORE_BASE64_H
#define SPOTTY_CORE_BASE64_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Used for the auth blob stored in the credential cache.
namespace spotty::core::base64 {

std::string encode(const std::vector<uint8_t>& data);
std::string encode(std::string_view text);

// Whitespace (line breaks in hand-edited cache files) is skipped.
// Returns std::nullopt on characters outside the RFC 4648 alphabet or bad padding.
std::optional<std::vector<uint8_t>> decode(std::string_view encoded);

}  // namespace spotty::core::base64

#endif  // SPOTTY_CORE_BASE64_H
