#include "playback/mixer.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>

namespace spotty::playback {

double volumeToFactor(uint16_t volume, VolumeCtrl ctrl, double dbRange) {
    const double normalized = static_cast<double>(volume) / kMaxVolume;
    switch (ctrl) {
    case VolumeCtrl::Fixed:
        return 1.0;
    case VolumeCtrl::Linear:
        return normalized;
    case VolumeCtrl::Log: {
        if (volume == 0) {
            return 0.0;
        }
        const double ratio = std::pow(10.0, dbRange / 20.0);
        return (std::pow(ratio, normalized) - 1.0) / (ratio - 1.0);
    }
    }
    return normalized;
}

uint16_t percentToVolume(uint32_t percent) {
    percent = std::min<uint32_t>(percent, 100);
    return static_cast<uint16_t>(static_cast<double>(percent) / 100.0 * kMaxVolume);
}

uint32_t volumeToPercent(uint16_t volume) {
    return static_cast<uint32_t>(volume) * 100 / kMaxVolume;
}

SoftMixer::SoftMixer(const MixerConfig& config) : state_(std::make_shared<State>()) {
    state_->ctrl = config.volumeCtrl;
    state_->dbRange = config.dbRange;
    state_->factor.store(volumeToFactor(kMaxVolume, config.volumeCtrl, config.dbRange));
    filter_ = std::make_shared<Filter>(state_);
    LOG_DEBUG("Mixing with softvol and volume control {}",
              config.volumeCtrl == VolumeCtrl::Linear ? "linear"
              : config.volumeCtrl == VolumeCtrl::Log  ? "log"
                                                      : "fixed");
}

void SoftMixer::setVolume(uint16_t volume) {
    state_->volume.store(volume);
    state_->factor.store(volumeToFactor(volume, state_->ctrl, state_->dbRange));
}

uint16_t SoftMixer::volume() const {
    return state_->volume.load();
}

std::shared_ptr<AudioFilter> SoftMixer::audioFilter() const {
    return filter_;
}

void SoftMixer::Filter::modify(std::vector<double>& samples) const {
    const double factor = state_->factor.load();
    if (factor >= 1.0) {
        return;
    }
    for (double& sample : samples) {
        sample *= factor;
    }
}

std::optional<MixerFactory> findMixer(std::string_view name) {
    if (name.empty() || name == SoftMixer::kName) {
        return MixerFactory(
            [](const MixerConfig& config) { return std::make_shared<SoftMixer>(config); });
    }
    return std::nullopt;
}

}  // namespace spotty::playback
