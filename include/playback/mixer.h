#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spotty::playback {

enum class VolumeCtrl {
    Linear,
    Log,
    Fixed,
};

constexpr uint16_t kMaxVolume = 0xFFFF;
constexpr double kDefaultDbRange = 60.0;

struct MixerConfig {
    std::string device = "default";
    std::string control = "PCM";
    uint32_t index = 0;
    VolumeCtrl volumeCtrl = VolumeCtrl::Linear;
    double dbRange = kDefaultDbRange;
};

/**
 * @brief Map a protocol volume (0..65535) to a linear amplitude factor in [0, 1].
 *
 * Log maps onto a dbRange-wide logarithmic curve, Fixed always yields unity gain.
 */
double volumeToFactor(uint16_t volume, VolumeCtrl ctrl, double dbRange = kDefaultDbRange);

// Percent (0..100) <-> protocol volume (0..65535)
uint16_t percentToVolume(uint32_t percent);
uint32_t volumeToPercent(uint16_t volume);

// Applied by the player to decoded samples before they reach the sink.
class AudioFilter {
   public:
    virtual ~AudioFilter() = default;
    virtual void modify(std::vector<double>& samples) const = 0;
};

class Mixer {
   public:
    virtual ~Mixer() = default;

    virtual void setVolume(uint16_t volume) = 0;
    virtual uint16_t volume() const = 0;

    // nullptr when the mixer controls volume outside the sample path
    virtual std::shared_ptr<AudioFilter> audioFilter() const = 0;
};

/**
 * @brief Software volume: scales samples in the player's audio filter.
 */
class SoftMixer : public Mixer {
   public:
    static constexpr const char* kName = "softvol";

    explicit SoftMixer(const MixerConfig& config);

    void setVolume(uint16_t volume) override;
    uint16_t volume() const override;
    std::shared_ptr<AudioFilter> audioFilter() const override;

   private:
    struct State {
        VolumeCtrl ctrl;
        double dbRange;
        std::atomic<uint16_t> volume{kMaxVolume};
        std::atomic<double> factor{1.0};
    };

    class Filter : public AudioFilter {
       public:
        explicit Filter(std::shared_ptr<const State> state) : state_(std::move(state)) {}
        void modify(std::vector<double>& samples) const override;

       private:
        std::shared_ptr<const State> state_;
    };

    std::shared_ptr<State> state_;
    std::shared_ptr<AudioFilter> filter_;
};

using MixerFactory = std::function<std::shared_ptr<Mixer>(const MixerConfig&)>;

/**
 * @brief Look up a mixer implementation by name.
 *
 * An empty name selects the default (softvol). Unknown names yield std::nullopt.
 */
std::optional<MixerFactory> findMixer(std::string_view name = {});

}  // namespace spotty::playback
