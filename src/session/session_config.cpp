#include "session/session_config.h"

#include <cctype>
#include <charconv>
#include <utility>

namespace spotty::session {

std::string ProxyUrl::toString() const {
    return "http://" + host + ":" + std::to_string(port);
}

bool parseProxyUrl(std::string_view url, ProxyUrl& out, std::string& error) {
    constexpr std::string_view kScheme = "http://";

    const size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        error = "Invalid proxy URL: " + std::string(url) + " (missing scheme)";
        return false;
    }
    std::string scheme(url.substr(0, schemeEnd));
    for (char& c : scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (scheme + "://" != kScheme) {
        error = "Invalid proxy URL: " + std::string(url) +
                ", only URLs on the format \"http://host:port\" are allowed";
        return false;
    }

    std::string_view authority = url.substr(schemeEnd + 3);
    const size_t slash = authority.find('/');
    if (slash != std::string_view::npos) {
        authority = authority.substr(0, slash);
    }
    if (authority.empty()) {
        error = "Invalid proxy URL: " + std::string(url) + " (missing host)";
        return false;
    }

    ProxyUrl parsed;
    const size_t colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        parsed.host = std::string(authority);
    } else {
        parsed.host = std::string(authority.substr(0, colon));
        std::string_view portText = authority.substr(colon + 1);
        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc() || ptr != portText.data() + portText.size() || port == 0 ||
            port > 65535) {
            error = "Invalid proxy URL: " + std::string(url) + " (bad port)";
            return false;
        }
        parsed.port = static_cast<uint16_t>(port);
    }
    if (parsed.host.empty()) {
        error = "Invalid proxy URL: " + std::string(url) + " (missing host)";
        return false;
    }

    out = std::move(parsed);
    return true;
}

const char* deviceTypeToString(DeviceType type) {
    switch (type) {
    case DeviceType::Unknown:
        return "Unknown";
    case DeviceType::Computer:
        return "Computer";
    case DeviceType::Tablet:
        return "Tablet";
    case DeviceType::Smartphone:
        return "Smartphone";
    case DeviceType::Speaker:
        return "Speaker";
    case DeviceType::Tv:
        return "TV";
    case DeviceType::Avr:
        return "AVR";
    case DeviceType::Stb:
        return "STB";
    case DeviceType::AudioDongle:
        return "AudioDongle";
    }
    return "Unknown";
}

}  // namespace spotty::session
