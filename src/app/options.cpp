#include "app/options.h"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <utility>

namespace spotty::app {

namespace {

constexpr const char* kMask = "XXXXXXXX";

const std::vector<OptionSpec> kOptions = {
    {opt::kHelp, 'h', false, "", "Print this help menu."},
    {opt::kVersion, 'V', false, "", "Display version string."},
    {opt::kVerbose, 'v', false, "", "Enable verbose log output."},
    {opt::kQuiet, 'q', false, "", "Only log warning and error messages."},
    {opt::kConfig, '\0', true, "PATH",
     "JSON file with default option values and a \"logging\" section."},
    {opt::kDisableAudioCache, 'G', false, "",
     "(Only here for compatibility - audio cache is disabled by default)."},
    {opt::kEnableAudioCache, '\0', false, "", "Enable caching of the audio data."},
    {opt::kDisableDiscovery, 'O', false, "", "Disable zeroconf discovery mode."},
    {opt::kDisableGapless, 'g', false, "", "Disable gapless playback."},
    {opt::kAutoplay, 'A', false, "", "Automatically play similar songs when your music ends."},
    {opt::kPassthrough, 'P', false, "",
     "Pass a raw stream to the output. Only works with the pipe backend."},
    {opt::kEnableVolumeNormalisation, 'N', false, "",
     "Play all tracks at approximately the same apparent volume."},
    {opt::kName, 'n', true, "NAME", "Device name. Defaults to Spotty."},
    {opt::kBitrate, 'b', true, "BITRATE", "Bitrate (kbps) {96|160|320}. Defaults to 160."},
    {opt::kCache, 'c', true, "PATH", "Path to a directory where files will be cached."},
    {opt::kUsername, 'u', true, "USERNAME", "Username used to sign in with."},
    {opt::kPassword, 'p', true, "PASSWORD", "Password used to sign in with."},
    {opt::kInitialVolume, 'R', true, "VOLUME",
     "Initial volume in % from 0 - 100. Defaults to 50."},
    {opt::kNormalisationGainType, 'W', true, "TYPE",
     "Specify the normalisation gain type to use {track|album|auto}. Defaults to auto."},
    {opt::kZeroconfPort, 'z', true, "PORT",
     "The port the internal server advertises over zeroconf 1 - 65535. Ports <= 1024 may "
     "require root privileges."},
    {opt::kProxy, '\0', true, "URL", "HTTP proxy to use when connecting."},
    {opt::kApPort, '\0', true, "PORT",
     "Connect to an AP with a specified port 1 - 65535. Available ports are usually 80, 443 "
     "and 4070."},
    {opt::kAuthenticate, 'a', false, "",
     "Authenticate given username and password. Make sure you define a cache folder to store "
     "credentials."},
    {opt::kSingleTrack, '\0', true, "ID", "Play a single track ID and exit."},
    {opt::kStartPosition, '\0', true, "STARTPOSITION",
     "Position (in seconds) where playback should be started. Only valid with the "
     "--single-track option."},
    {opt::kCheck, 'x', false, "", "Run quick internal check."},
    {opt::kClientId, 'i', true, "CLIENT_ID",
     "A client_id to be used to get the oauth token. Required with the --get-token request."},
    {opt::kScope, '\0', true, "SCOPE", "The scopes you want to have access to with the oauth token."},
    {opt::kGetToken, 't', false, "",
     "Get oauth token to be used with the web API etc. and print it to the console."},
    {opt::kSaveToken, 'T', true, "TOKENFILE",
     "Get oauth token to be used with the web API etc. and store it in the given file."},
    {opt::kPassThrough, '\0', false, "", "Pass raw stream to output, only works for \"pipe\"."},
    {opt::kLms, '\0', true, "LMS",
     "hostname and port of Logitech Media Server instance (eg. localhost:9000)"},
    {opt::kLmsAuth, '\0', true, "LMSAUTH", "Authentication data to access Logitech Media Server"},
    {opt::kPlayerMac, '\0', true, "MAC", "MAC address of the Squeezebox to be controlled"},
};

bool isCredentialOption(const OptionSpec* spec) {
    return spec && (spec->longName == opt::kUsername || spec->longName == opt::kPassword);
}

}  // namespace

const std::vector<OptionSpec>& optionTable() {
    return kOptions;
}

const OptionSpec* findOption(std::string_view longName) {
    for (const auto& spec : kOptions) {
        if (spec.longName == longName) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* findShortOption(char shortName) {
    if (shortName == '\0') {
        return nullptr;
    }
    for (const auto& spec : kOptions) {
        if (spec.shortName == shortName) {
            return &spec;
        }
    }
    return nullptr;
}

std::string envVarName(std::string_view longName) {
    std::string name = "LIBRESPOT_";
    for (char c : longName) {
        name.push_back(c == '-' ? '_'
                                : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return name;
}

std::optional<std::string> systemEnv(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

void OptionSet::set(std::string_view name, std::optional<std::string> value, Source source) {
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        // Repeated on the command line: last one wins
        if (source == Source::CommandLine && it->second.source == Source::CommandLine) {
            it->second.value = std::move(value);
        }
        return;
    }
    entries_.emplace(std::string(name), Entry{std::move(value), source});
}

bool OptionSet::present(std::string_view name) const {
    return entries_.find(name) != entries_.end();
}

std::optional<std::string> OptionSet::value(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::optional<OptionSet::Source> OptionSet::source(std::string_view name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.source;
}

bool parseCommandLine(const std::vector<std::string>& args, OptionSet& options,
                      std::string& error) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            break;
        }

        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            std::optional<std::string> inlineValue;
            const size_t eq = name.find('=');
            if (eq != std::string::npos) {
                inlineValue = name.substr(eq + 1);
                name = name.substr(0, eq);
            }

            const OptionSpec* spec = findOption(name);
            if (!spec) {
                error = "Unrecognized option '" + name + "'";
                return false;
            }
            if (!spec->takesValue) {
                if (inlineValue) {
                    error = "Option '" + name + "' does not take an argument";
                    return false;
                }
                options.set(spec->longName, std::nullopt, OptionSet::Source::CommandLine);
                continue;
            }
            if (!inlineValue) {
                if (i + 1 >= args.size()) {
                    error = "Argument to option '" + name + "' missing";
                    return false;
                }
                inlineValue = args[++i];
            }
            options.set(spec->longName, std::move(inlineValue), OptionSet::Source::CommandLine);
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            for (size_t pos = 1; pos < arg.size(); ++pos) {
                const OptionSpec* spec = findShortOption(arg[pos]);
                if (!spec) {
                    error = std::string("Unrecognized option '") + arg[pos] + "'";
                    return false;
                }
                if (!spec->takesValue) {
                    options.set(spec->longName, std::nullopt, OptionSet::Source::CommandLine);
                    continue;
                }
                std::string value;
                if (pos + 1 < arg.size()) {
                    value = arg.substr(pos + 1);
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    error = std::string("Argument to option '") + arg[pos] + "' missing";
                    return false;
                }
                options.set(spec->longName, std::move(value), OptionSet::Source::CommandLine);
                break;
            }
        }
    }
    return true;
}

void applyEnvironment(OptionSet& options, const EnvLookup& env) {
    if (!env) {
        return;
    }
    for (const auto& spec : kOptions) {
        auto value = env(envVarName(spec.longName));
        if (!value) {
            continue;
        }
        if (spec.takesValue) {
            options.set(spec.longName, std::move(value), OptionSet::Source::Environment);
        } else {
            options.set(spec.longName, std::nullopt, OptionSet::Source::Environment);
        }
    }
}

bool applyConfigFile(OptionSet& options, const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open config file: " + path;
        return false;
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::exception& ex) {
        error = "Invalid config file " + path + ": " + ex.what();
        return false;
    }
    if (!json.is_object()) {
        error = "Invalid config file " + path + ": expected a JSON object";
        return false;
    }

    for (const auto& [key, value] : json.items()) {
        if (key == "logging" || key == opt::kConfig) {
            continue;
        }
        const OptionSpec* spec = findOption(key);
        if (!spec) {
            error = "Unknown option '" + key + "' in config file " + path;
            return false;
        }

        if (!spec->takesValue) {
            if (!value.is_boolean()) {
                error = "Option '" + key + "' in config file must be true or false";
                return false;
            }
            if (value.get<bool>()) {
                options.set(spec->longName, std::nullopt, OptionSet::Source::ConfigFile);
            }
            continue;
        }

        if (value.is_string()) {
            options.set(spec->longName, value.get<std::string>(), OptionSet::Source::ConfigFile);
        } else if (value.is_number() || value.is_boolean()) {
            options.set(spec->longName, value.dump(), OptionSet::Source::ConfigFile);
        } else {
            error = "Option '" + key + "' in config file must be a string or a number";
            return false;
        }
    }
    return true;
}

bool collectOptions(const std::vector<std::string>& args, const EnvLookup& env,
                    OptionSet& options, std::string& error) {
    if (!parseCommandLine(args, options, error)) {
        return false;
    }
    applyEnvironment(options, env);

    if (auto configPath = options.value(opt::kConfig)) {
        if (!applyConfigFile(options, *configPath, error)) {
            return false;
        }
    }
    return true;
}

void printHelp(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " [options]\n\n";
    out << "Options:\n";
    for (const auto& spec : kOptions) {
        std::string flags = "    ";
        if (spec.shortName != '\0') {
            flags = std::string("-") + spec.shortName + ", ";
        }
        flags += "--" + std::string(spec.longName);
        if (spec.takesValue) {
            flags += " " + std::string(spec.hint);
        }
        out << "    " << std::left << std::setw(40) << flags << spec.description << "\n";
    }
    out << "\nEvery option can also be set through the environment, e.g. --zeroconf-port as "
        << envVarName(opt::kZeroconfPort) << ".\n";
    out << std::flush;
}

std::vector<std::string> maskedArgumentTrace(const std::vector<std::string>& args) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& key = args[i];
        if (key.empty() || key[0] != '-') {
            continue;
        }

        const OptionSpec* spec = nullptr;
        if (key.rfind("--", 0) == 0) {
            spec = findOption(key.substr(2, key.find('=') - 2));
        } else if (key.size() >= 2) {
            spec = findShortOption(key[1]);
        }

        if (isCredentialOption(spec)) {
            std::string name =
                key.rfind("--", 0) == 0 ? key.substr(0, key.find('=')) : key.substr(0, 2);
            lines.push_back("\t\t" + name + " " + kMask);
            continue;
        }

        std::string value;
        if (i + 1 < args.size() && !args[i + 1].empty() && args[i + 1][0] != '-') {
            value = args[i + 1];
        }
        lines.push_back("\t\t" + key + " " + value);
    }
    return lines;
}

std::vector<std::string> maskedEnvironmentTrace(const std::vector<std::string>& environment) {
    const std::string userVar = envVarName(opt::kUsername);
    const std::string passVar = envVarName(opt::kPassword);

    std::vector<std::string> lines;
    for (const auto& entry : environment) {
        if (entry.rfind("LIBRESPOT_", 0) != 0) {
            continue;
        }
        const size_t eq = entry.find('=');
        const std::string key = entry.substr(0, eq);
        if (key == userVar || key == passVar) {
            lines.push_back("\t\t" + key + "=" + kMask);
        } else {
            lines.push_back("\t\t" + entry);
        }
    }
    return lines;
}

}  // namespace spotty::app
