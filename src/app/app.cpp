#include "app/app.h"

#include "app/one_shot.h"
#include "app/setup.h"
#include "core/error_codes.h"
#include "core/version.h"
#include "daemon/shutdown_manager.h"
#include "lms/lms_notifier.h"
#include "logging/logger.h"
#include "orchestrator/orchestrator.h"

#include <utility>

extern char** environ;

namespace spotty::app {

std::vector<std::string> processEnvironment() {
    std::vector<std::string> entries;
    for (char** entry = environ; entry && *entry; ++entry) {
        entries.emplace_back(*entry);
    }
    return entries;
}

App::App(const session::BackendRegistry& registry, AppIo io)
    : registry_(registry), io_(std::move(io)) {}

int App::run(int argc, char** argv) {
    std::string program = argc > 0 ? argv[0] : "spotty";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return run(program, args);
}

void App::setupLogging(const OptionSet& options) {
    bool quiet = options.present(opt::kQuiet);
    bool verbose = options.present(opt::kVerbose);

    logging::LogConfig config;
    config.level = logging::levelFromFlags(quiet, verbose);

    auto configPath = options.value(opt::kConfig);
    bool ok = configPath ? logging::initializeFromConfig(*configPath, config)
                         : logging::initialize(config);
    if (!ok) {
        *io_.err << "Failed to initialize logging" << std::endl;
    }

    if (quiet && verbose) {
        LOG_WARN("`--verbose` / `-v` and `--quiet` / `-q` are mutually exclusive. Using verbose mode.");
    }

    if (auto envLevel = logging::levelFromEnvironment()) {
        if (verbose) {
            LOG_WARN("`--verbose` / `-v` flag overridden by {} environment variable",
                     logging::kLogLevelEnvVar);
        } else if (quiet) {
            LOG_WARN("`--quiet` / `-q` flag overridden by {} environment variable",
                     logging::kLogLevelEnvVar);
        }
        logging::setLevel(*envLevel);
    }
}

int App::run(const std::string& program, const std::vector<std::string>& args) {
    OptionSet options;
    std::string error;
    if (!collectOptions(args, io_.env, options, error)) {
        *io_.err << error << "\n\n";
        printHelp(*io_.err, program);
        return 1;
    }

    if (options.present(opt::kHelp)) {
        printHelp(*io_.out, program);
        return 0;
    }
    if (options.present(opt::kVersion)) {
        *io_.out << core::getVersionString() << std::endl;
        return 0;
    }
    if (options.present(opt::kCheck)) {
        printCheck(*io_.out);
        return 0;
    }

    setupLogging(options);

    LOG_INFO("{}", core::getVersionString());
    LOG_TRACE("Command line argument(s):");
    for (const auto& line : maskedArgumentTrace(args)) {
        LOG_TRACE("{}", line);
    }
    auto envLines = maskedEnvironmentTrace(io_.environment);
    if (!envLines.empty()) {
        LOG_TRACE("Environment variable(s):");
        for (const auto& line : envLines) {
            LOG_TRACE("{}", line);
        }
    }

    Setup setup;
    SetupError setupError;
    SetupContext ctx{io_.env, io_.prompt, io_.out};
    if (!buildSetup(options, ctx, setup, setupError)) {
        LOG_ERROR("{}", setupError.message);
        logging::flush();
        return 1;
    }

    auto backend = registry_.createBackend();
    if (!backend) {
        LOG_ERROR("[{}] No streaming backend available",
                  core::errorCodeToString(core::ErrorCode::CONFIG_NO_BACKEND));
        logging::flush();
        return 1;
    }
    LOG_DEBUG("Using backend {}", backend->name);

    if (setup.singleTrack) {
        return runSingleTrack(setup, *backend->oneShot);
    }
    if (setup.getToken) {
        return runGetToken(setup, *backend->oneShot, *io_.out);
    }

    daemon::ShutdownManager shutdownManager;
    shutdownManager.installSignalHandlers();

    lms::LmsNotifier notifier(setup.lms);
    if (!notifier.isConfigured()) {
        LOG_DEBUG("LMS notifications disabled (no --lms / --player-mac)");
    }

    orchestrator::OrchestratorConfig config;
    config.sessionConfig = setup.sessionConfig;
    config.spawnConfig.playerConfig = setup.playerConfig;
    config.spawnConfig.connectConfig = setup.connectConfig;
    config.spawnConfig.mixerConfig = setup.mixerConfig;
    config.spawnConfig.format = setup.format;
    config.authenticateOnly = setup.authenticate;
    if (setup.enableDiscovery) {
        discovery::DiscoveryConfig discoveryConfig;
        discoveryConfig.deviceId = setup.sessionConfig.deviceId;
        discoveryConfig.name = setup.connectConfig.name;
        discoveryConfig.deviceType = setup.connectConfig.deviceType;
        discoveryConfig.port = setup.zeroconfPort;
        config.discovery = discoveryConfig;
    }

    orchestrator::OrchestratorDependencies deps;
    deps.streaming = backend->streaming.get();
    deps.players = backend->players.get();
    deps.controls = backend->controls.get();
    deps.discoveryFactory = backend->discovery;
    deps.notifier = &notifier;
    deps.cache = setup.cache ? &*setup.cache : nullptr;
    deps.interrupts = &shutdownManager;
    deps.hooks.onReady = [&shutdownManager]() { shutdownManager.notifyReady(); };
    deps.hooks.onTick = [&shutdownManager]() { shutdownManager.tick(); };
    deps.hooks.onStopping = [&shutdownManager]() { shutdownManager.notifyStopping(); };

    orchestrator::Orchestrator loop(std::move(config), std::move(deps));
    if (!loop.start(setup.credentials, error)) {
        LOG_ERROR("{}", error);
        logging::flush();
        return 1;
    }

    auto outcome = loop.run();
    LOG_INFO("Exiting ({})", orchestrator::loopOutcomeToString(outcome));
    logging::flush();
    return orchestrator::exitCodeFor(outcome);
}

}  // namespace spotty::app
