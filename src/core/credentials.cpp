#include "core/credentials.h"

#include "logging/logger.h"

#include <iostream>
#include <termios.h>
#include <unistd.h>
#include <utility>

namespace spotty::core {

Credentials::Credentials(std::string username, AuthType authType, std::vector<uint8_t> authData)
    : username_(std::move(username)), authType_(authType), authData_(std::move(authData)) {}

Credentials Credentials::withPassword(std::string username, const std::string& password) {
    return Credentials(std::move(username), AuthType::UserPass,
                       std::vector<uint8_t>(password.begin(), password.end()));
}

bool Credentials::operator==(const Credentials& other) const {
    return username_ == other.username_ && authType_ == other.authType_ &&
           authData_ == other.authData_;
}

std::optional<Credentials> resolveCredentials(const std::optional<std::string>& username,
                                              const std::optional<std::string>& password,
                                              const std::optional<Credentials>& cached,
                                              const PasswordPrompt& prompt) {
    if (!username) {
        return cached;
    }

    if (password) {
        return Credentials::withPassword(*username, *password);
    }

    if (cached && cached->username() == *username) {
        LOG_DEBUG("Using cached credentials for {}", *username);
        return cached;
    }

    if (!prompt) {
        return std::nullopt;
    }
    std::optional<std::string> entered = prompt(*username);
    if (!entered || entered->empty()) {
        return std::nullopt;
    }
    return Credentials::withPassword(*username, *entered);
}

std::optional<std::string> promptPasswordOnTerminal(const std::string& username) {
    std::cerr << "Password for " << username << ": " << std::flush;

    termios previous{};
    bool restoreEcho = false;
    if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &previous) == 0) {
        termios silent = previous;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restoreEcho = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
    }

    std::string line;
    bool ok = static_cast<bool>(std::getline(std::cin, line));

    if (restoreEcho) {
        ::tcsetattr(STDIN_FILENO, TCSANOW, &previous);
        std::cerr << std::endl;
    }

    if (!ok) {
        return std::nullopt;
    }
    return line;
}

}  // namespace spotty::core
