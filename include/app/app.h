#pragma once

#include "app/options.h"
#include "core/credentials.h"
#include "session/backend_registry.h"

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace spotty::app {

struct AppIo {
    EnvLookup env = systemEnv;
    core::PasswordPrompt prompt = core::promptPasswordOnTerminal;
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
    // "KEY=VALUE" entries traced at startup
    std::vector<std::string> environment;
};

class App {
   public:
    explicit App(const session::BackendRegistry& registry, AppIo io = AppIo{});

    int run(int argc, char** argv);

    // Arguments without the program name
    int run(const std::string& program, const std::vector<std::string>& args);

   private:
    void setupLogging(const OptionSet& options);

    const session::BackendRegistry& registry_;
    AppIo io_;
};

// Current process environment as "KEY=VALUE" entries
std::vector<std::string> processEnvironment();

}  // namespace spotty::app
