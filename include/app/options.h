#pragma once

#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace spotty::app {

// Long option names
namespace opt {
constexpr const char* kHelp = "help";
constexpr const char* kVersion = "version";
constexpr const char* kVerbose = "verbose";
constexpr const char* kQuiet = "quiet";
constexpr const char* kConfig = "config";
constexpr const char* kDisableAudioCache = "disable-audio-cache";
constexpr const char* kEnableAudioCache = "enable-audio-cache";
constexpr const char* kDisableDiscovery = "disable-discovery";
constexpr const char* kDisableGapless = "disable-gapless";
constexpr const char* kAutoplay = "autoplay";
constexpr const char* kPassthrough = "passthrough";
constexpr const char* kPassThrough = "pass-through";
constexpr const char* kEnableVolumeNormalisation = "enable-volume-normalisation";
constexpr const char* kName = "name";
constexpr const char* kBitrate = "bitrate";
constexpr const char* kCache = "cache";
constexpr const char* kUsername = "username";
constexpr const char* kPassword = "password";
constexpr const char* kInitialVolume = "initial-volume";
constexpr const char* kNormalisationGainType = "normalisation-gain-type";
constexpr const char* kZeroconfPort = "zeroconf-port";
constexpr const char* kProxy = "proxy";
constexpr const char* kApPort = "ap-port";
constexpr const char* kAuthenticate = "authenticate";
constexpr const char* kSingleTrack = "single-track";
constexpr const char* kStartPosition = "start-position";
constexpr const char* kCheck = "check";
constexpr const char* kClientId = "client-id";
constexpr const char* kScope = "scope";
constexpr const char* kGetToken = "get-token";
constexpr const char* kSaveToken = "save-token";
constexpr const char* kLms = "lms";
constexpr const char* kLmsAuth = "lms-auth";
constexpr const char* kPlayerMac = "player-mac";
}  // namespace opt

struct OptionSpec {
    std::string_view longName;
    char shortName = '\0';  // '\0' = long form only
    bool takesValue = false;
    std::string_view hint;  // value placeholder in the help text
    std::string_view description;
};

const std::vector<OptionSpec>& optionTable();
const OptionSpec* findOption(std::string_view longName);
const OptionSpec* findShortOption(char shortName);

// "foo-bar" -> "LIBRESPOT_FOO_BAR"
std::string envVarName(std::string_view longName);

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// getenv() based lookup
std::optional<std::string> systemEnv(const std::string& name);

/**
 * @brief Options merged from command line, environment and config file.
 *
 * Precedence: command line > LIBRESPOT_* environment > config file. A flag is present
 * when given on the command line, when its variable is set (any value) or when the
 * config file sets it to true.
 */
class OptionSet {
   public:
    enum class Source { CommandLine, Environment, ConfigFile };

    // Ignored when the option is already set by a source of higher or equal precedence.
    void set(std::string_view name, std::optional<std::string> value, Source source);

    bool present(std::string_view name) const;
    std::optional<std::string> value(std::string_view name) const;
    std::optional<Source> source(std::string_view name) const;

   private:
    struct Entry {
        std::optional<std::string> value;
        Source source;
    };
    std::map<std::string, Entry, std::less<>> entries_;
};

/**
 * @brief Parse command line arguments (without the program name).
 *
 * Accepts --name value, --name=value, -n value, -nvalue and grouped short flags.
 * Arguments after "--" and non-option arguments are ignored.
 */
bool parseCommandLine(const std::vector<std::string>& args, OptionSet& options,
                      std::string& error);

void applyEnvironment(OptionSet& options, const EnvLookup& env);

/**
 * @brief Use a JSON object of long option names as the lowest-precedence layer.
 *
 * Values may be strings, numbers or booleans. The "logging" section is left to the
 * logger. A missing file is an error.
 */
bool applyConfigFile(OptionSet& options, const std::string& path, std::string& error);

// All three layers; the config file comes from --config / LIBRESPOT_CONFIG.
bool collectOptions(const std::vector<std::string>& args, const EnvLookup& env,
                    OptionSet& options, std::string& error);

void printHelp(std::ostream& out, const std::string& program);

// Command line trace lines with username and password values masked.
std::vector<std::string> maskedArgumentTrace(const std::vector<std::string>& args);

// LIBRESPOT_* "KEY=VALUE" entries with credential values masked.
std::vector<std::string> maskedEnvironmentTrace(const std::vector<std::string>& environment);

}  // namespace spotty::app
