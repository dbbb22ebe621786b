#include "core/device_id.h"

#include <boost/uuid/detail/sha1.hpp>
#include <cstdio>

namespace spotty::core {

std::string deviceIdFromName(const std::string& name) {
    boost::uuids::detail::sha1 hasher;
    hasher.process_bytes(name.data(), name.size());

    boost::uuids::detail::sha1::digest_type digest;
    hasher.get_digest(digest);

    // digest words are big-endian 32 bit chunks of the 160 bit hash
    std::string hex;
    hex.reserve(40);
    char chunk[9];
    for (unsigned int word : digest) {
        std::snprintf(chunk, sizeof(chunk), "%08x", word);
        hex += chunk;
    }
    return hex;
}

}  // namespace spotty::core
