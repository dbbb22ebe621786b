#pragma once

#include "app/setup.h"
#include "session/one_shot.h"

#include <optional>
#include <ostream>
#include <string>

namespace spotty::app {

/**
 * @brief --check: "ok <version>" followed by a JSON capability object.
 */
void printCheck(std::ostream& out);

// {"accessToken": ..., "expiresIn": ...}
std::string tokenToJson(const session::AccessToken& token);

/**
 * @brief Print the token to @p out, or write it to @p path when given.
 */
bool writeToken(const session::AccessToken& token, const std::optional<std::string>& path,
                std::ostream& out, std::string& error);

// One-shot modes log their failures; the process exits 0 regardless.
int runGetToken(const Setup& setup, session::OneShotService& service, std::ostream& out);
int runSingleTrack(const Setup& setup, session::OneShotService& service);

}  // namespace spotty::app
