#include "app/app.h"
#include "logging/logger.h"

#include <utility>

int main(int argc, char* argv[]) {
    spotty::session::BackendRegistry registry;

    spotty::app::AppIo io;
    io.environment = spotty::app::processEnvironment();

    spotty::app::App app(registry, std::move(io));
    int exitCode = app.run(argc, argv);

    spotty::logging::shutdown();
    return exitCode;
}
