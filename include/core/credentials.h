#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spotty::core {

// Mirrors the authentication types understood by the streaming service.
enum class AuthType : int {
    UserPass = 0,
    StoredCredentials = 1,
    StoredFacebookCredentials = 2,
    AccessToken = 3,
};

/**
 * @brief Immutable credential set used to open a session.
 *
 * Once accepted it is never mutated; every connection attempt receives its own copy.
 */
class Credentials {
   public:
    Credentials(std::string username, AuthType authType, std::vector<uint8_t> authData);

    static Credentials withPassword(std::string username, const std::string& password);

    const std::string& username() const {
        return username_;
    }
    AuthType authType() const {
        return authType_;
    }
    const std::vector<uint8_t>& authData() const {
        return authData_;
    }

    bool operator==(const Credentials& other) const;
    bool operator!=(const Credentials& other) const {
        return !(*this == other);
    }

   private:
    std::string username_;
    AuthType authType_;
    std::vector<uint8_t> authData_;
};

/// Asks the operator for the password of the given user; std::nullopt when nothing was entered.
using PasswordPrompt = std::function<std::optional<std::string>(const std::string& username)>;

/**
 * @brief Resolve the credentials used for the first connection.
 *
 * - username and password given: use them, cached data is ignored
 * - only username given: reuse the cached credentials if they belong to that user,
 *   otherwise prompt for the password (no input => std::nullopt)
 * - no username: the cached credentials verbatim (may be std::nullopt)
 */
std::optional<Credentials> resolveCredentials(const std::optional<std::string>& username,
                                              const std::optional<std::string>& password,
                                              const std::optional<Credentials>& cached,
                                              const PasswordPrompt& prompt);

/**
 * @brief Blocking terminal prompt on stderr with echo disabled.
 */
std::optional<std::string> promptPasswordOnTerminal(const std::string& username);

}  // namespace spotty::core
