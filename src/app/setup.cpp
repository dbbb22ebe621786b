#include "app/setup.h"

#include "core/device_id.h"
#include "core/version.h"
#include "logging/logger.h"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>

#ifndef SPOTTY_CLIENT_ID
#define SPOTTY_CLIENT_ID ""
#endif

namespace spotty::app {

namespace {

std::string flagName(const char* longName) {
    const OptionSpec* spec = findOption(longName);
    std::string name = std::string("`--") + longName + "`";
    if (spec && spec->shortName != '\0') {
        name += std::string(" / `-") + spec->shortName + "`";
    }
    return name;
}

bool parseUnsigned(const std::string& text, unsigned long& out) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end && !text.empty();
}

bool fail(SetupError& error, core::ErrorCode code, std::string message) {
    error.code = code;
    error.message = std::move(message);
    return false;
}

bool invalidValue(const SetupContext& ctx, SetupError& error, const char* longName,
                  const std::string& value, const std::string& valid,
                  const std::optional<std::string>& defaultValue = std::nullopt) {
    if (ctx.hints) {
        *ctx.hints << "Valid " << flagName(longName) << " values: " << valid << "\n";
        if (defaultValue) {
            *ctx.hints << "Default: " << *defaultValue << "\n";
        }
    }
    return fail(error, core::ErrorCode::CONFIG_INVALID_VALUE,
                "Invalid " + flagName(longName) + ": " + value);
}

bool parsePort(const OptionSet& options, const SetupContext& ctx, SetupError& error,
               const char* longName, std::optional<uint16_t>& out) {
    auto value = options.value(longName);
    if (!value) {
        return true;
    }
    unsigned long port = 0;
    if (!parseUnsigned(*value, port) || port == 0 || port > 65535) {
        return invalidValue(ctx, error, longName, *value, "1 - 65535");
    }
    out = static_cast<uint16_t>(port);
    return true;
}

std::optional<core::CredentialCache> openCache(const OptionSet& options) {
    auto dir = options.value(opt::kCache);
    if (!dir) {
        return std::nullopt;
    }

    std::filesystem::path root(*dir);
    std::optional<std::filesystem::path> audioDir;
    if (options.present(opt::kEnableAudioCache) && !options.present(opt::kDisableAudioCache)) {
        audioDir = root / "files";
    }

    std::string cacheError;
    auto cache = core::CredentialCache::open(root, root, audioDir, cacheError);
    if (!cache) {
        LOG_WARN("Cannot create cache: {}", cacheError);
    }
    return cache;
}

}  // namespace

bool buildSetup(const OptionSet& options, const SetupContext& ctx, Setup& out, SetupError& error) {
    Setup setup;

    setup.mixerConfig.volumeCtrl = playback::VolumeCtrl::Linear;

    setup.cache = openCache(options);

    std::optional<core::Credentials> cached;
    if (setup.cache) {
        cached = setup.cache->credentials();
    }
    setup.credentials = core::resolveCredentials(options.value(opt::kUsername),
                                                 options.value(opt::kPassword), cached, ctx.prompt);

    // No discovery while fetching tracks or tokens
    setup.enableDiscovery =
        !options.present(opt::kDisableDiscovery) && !options.present(opt::kSingleTrack) &&
        !options.present(opt::kSaveToken) && !options.present(opt::kGetToken);

    if (!setup.credentials && !setup.enableDiscovery) {
        return fail(error, core::ErrorCode::CONFIG_MISSING_CREDENTIALS,
                    "Credentials are required if discovery is disabled.");
    }

    if (!setup.enableDiscovery && options.present(opt::kZeroconfPort)) {
        LOG_WARN("With the {} flag set {} has no effect.", flagName(opt::kDisableDiscovery),
                 flagName(opt::kZeroconfPort));
    }
    if (setup.enableDiscovery) {
        std::optional<uint16_t> port;
        if (!parsePort(options, ctx, error, opt::kZeroconfPort, port)) {
            return false;
        }
        setup.zeroconfPort = port.value_or(0);
    }

    // Connect config
    setup.connectConfig.name = options.value(opt::kName).value_or(session::ConnectConfig{}.name);
    if (auto volume = options.value(opt::kInitialVolume)) {
        unsigned long percent = 0;
        if (!parseUnsigned(*volume, percent) || percent > 100) {
            return invalidValue(ctx, error, opt::kInitialVolume, *volume, "0 - 100", "50");
        }
        setup.connectConfig.initialVolume =
            playback::percentToVolume(static_cast<uint32_t>(percent));
    } else if (auto cachedVolume = setup.cache ? setup.cache->volume() : std::nullopt) {
        setup.connectConfig.initialVolume = *cachedVolume;
    }
    setup.connectConfig.deviceType = session::DeviceType::Speaker;
    setup.connectConfig.hasVolumeCtrl = setup.mixerConfig.volumeCtrl != playback::VolumeCtrl::Fixed;
    setup.connectConfig.autoplay = options.present(opt::kAutoplay);

    // Session config
    setup.sessionConfig.userAgent = std::string("spotty/") + core::getVersion();
    setup.sessionConfig.deviceId = core::deviceIdFromName(setup.connectConfig.name);

    std::optional<std::string> proxy = options.value(opt::kProxy);
    if (!proxy && ctx.env) {
        proxy = ctx.env("http_proxy");
    }
    if (proxy && !proxy->empty()) {
        session::ProxyUrl url;
        std::string proxyError;
        if (!session::parseProxyUrl(*proxy, url, proxyError)) {
            return fail(error, core::ErrorCode::CONFIG_INVALID_PROXY, proxyError);
        }
        setup.sessionConfig.proxy = url;
    }
    if (!parsePort(options, ctx, error, opt::kApPort, setup.sessionConfig.apPort)) {
        return false;
    }

    // Player config
    playback::PlayerConfig& player = setup.playerConfig;
    player.passthrough = options.present(opt::kPassthrough) || options.present(opt::kPassThrough);
    if (auto bitrate = options.value(opt::kBitrate)) {
        auto parsed = playback::parseBitrate(*bitrate);
        if (!parsed) {
            return invalidValue(ctx, error, opt::kBitrate, *bitrate, "96, 160, 320", "160");
        }
        player.bitrate = *parsed;
    }
    player.gapless = !options.present(opt::kDisableGapless);
    player.normalisation = options.present(opt::kEnableVolumeNormalisation);
    if (!player.normalisation) {
        if (options.present(opt::kNormalisationGainType)) {
            LOG_WARN("Without the {} flag normalisation options have no effect.",
                     flagName(opt::kEnableVolumeNormalisation));
        }
    } else if (auto type = options.value(opt::kNormalisationGainType)) {
        auto parsed = playback::parseNormalisationType(*type);
        if (!parsed) {
            return invalidValue(ctx, error, opt::kNormalisationGainType, *type,
                                "track, album, auto", "auto");
        }
        player.normalisationType = *parsed;
    }
    player.normalisationMethod = playback::NormalisationMethod::Basic;
    player.lmsConnectMode = !options.present(opt::kSingleTrack);

    // One-shot modes
    setup.authenticate = options.present(opt::kAuthenticate);
    setup.singleTrack = options.value(opt::kSingleTrack);
    if (auto start = options.value(opt::kStartPosition)) {
        char* end = nullptr;
        double seconds = std::strtod(start->c_str(), &end);
        if (end == start->c_str() || *end != '\0' || !std::isfinite(seconds) || seconds < 0) {
            LOG_WARN("Ignoring invalid {}: {}", flagName(opt::kStartPosition), *start);
            seconds = 0;
        }
        setup.startPositionMs = static_cast<uint32_t>(seconds * 1000.0);
    }

    auto saveToken = options.value(opt::kSaveToken).value_or("");
    setup.saveToken = saveToken.empty() ? std::nullopt : std::optional<std::string>(saveToken);
    setup.getToken = options.present(opt::kGetToken) || setup.saveToken.has_value();
    setup.clientId = options.value(opt::kClientId).value_or(SPOTTY_CLIENT_ID);
    setup.scopes = options.value(opt::kScope).value_or(kDefaultScopes);

    setup.lms.server = options.value(opt::kLms);
    setup.lms.playerMac = options.value(opt::kPlayerMac);
    setup.lms.auth = options.value(opt::kLmsAuth);

    out = std::move(setup);
    return true;
}

}  // namespace spotty::app
