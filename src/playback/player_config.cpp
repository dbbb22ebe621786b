#include "playback/player_config.h"

#include <algorithm>
#include <cctype>

namespace spotty::playback {

namespace {

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

}  // namespace

std::optional<Bitrate> parseBitrate(std::string_view value) {
    if (value == "96") {
        return Bitrate::Bitrate96;
    }
    if (value == "160") {
        return Bitrate::Bitrate160;
    }
    if (value == "320") {
        return Bitrate::Bitrate320;
    }
    return std::nullopt;
}

std::optional<NormalisationType> parseNormalisationType(std::string_view value) {
    std::string lower = toLower(value);
    if (lower == "album") {
        return NormalisationType::Album;
    }
    if (lower == "track") {
        return NormalisationType::Track;
    }
    if (lower == "auto") {
        return NormalisationType::Auto;
    }
    return std::nullopt;
}

std::optional<AudioFormat> parseAudioFormat(std::string_view value) {
    std::string lower = toLower(value);
    if (lower == "f32") {
        return AudioFormat::F32;
    }
    if (lower == "s32") {
        return AudioFormat::S32;
    }
    if (lower == "s16") {
        return AudioFormat::S16;
    }
    return std::nullopt;
}

const char* bitrateToString(Bitrate bitrate) {
    switch (bitrate) {
    case Bitrate::Bitrate96:
        return "96";
    case Bitrate::Bitrate160:
        return "160";
    case Bitrate::Bitrate320:
        return "320";
    }
    return "160";
}

const char* normalisationTypeToString(NormalisationType type) {
    switch (type) {
    case NormalisationType::Album:
        return "album";
    case NormalisationType::Track:
        return "track";
    case NormalisationType::Auto:
        return "auto";
    }
    return "auto";
}

const char* audioFormatToString(AudioFormat format) {
    switch (format) {
    case AudioFormat::F32:
        return "F32";
    case AudioFormat::S32:
        return "S32";
    case AudioFormat::S16:
        return "S16";
    }
    return "S16";
}

size_t bytesPerSample(AudioFormat format) {
    switch (format) {
    case AudioFormat::F32:
    case AudioFormat::S32:
        return 4;
    case AudioFormat::S16:
        return 2;
    }
    return 2;
}

}  // namespace spotty::playback
