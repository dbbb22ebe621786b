#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace spotty::playback {

enum class Bitrate : uint16_t {
    Bitrate96 = 96,
    Bitrate160 = 160,
    Bitrate320 = 320,
};

enum class NormalisationType {
    Album,
    Track,
    Auto,
};

enum class NormalisationMethod {
    Basic,
    Dynamic,
};

// Sample format written by the sink.
enum class AudioFormat {
    F32,
    S32,
    S16,
};

std::optional<Bitrate> parseBitrate(std::string_view value);
std::optional<NormalisationType> parseNormalisationType(std::string_view value);
std::optional<AudioFormat> parseAudioFormat(std::string_view value);

const char* bitrateToString(Bitrate bitrate);
const char* normalisationTypeToString(NormalisationType type);
const char* audioFormatToString(AudioFormat format);

size_t bytesPerSample(AudioFormat format);

struct PlayerConfig {
    Bitrate bitrate = Bitrate::Bitrate160;
    bool gapless = true;
    bool passthrough = false;

    bool normalisation = false;
    NormalisationType normalisationType = NormalisationType::Auto;
    NormalisationMethod normalisationMethod = NormalisationMethod::Basic;
    double normalisationPregainDb = 0.0;
    double normalisationThresholdDbfs = -2.0;
    uint32_t normalisationAttackMs = 5;
    uint32_t normalisationReleaseMs = 100;
    double normalisationKneeDb = 1.0;

    // When acting as the controller of an LMS player no local audio is produced.
    bool lmsConnectMode = true;
};

}  // namespace spotty::playback
