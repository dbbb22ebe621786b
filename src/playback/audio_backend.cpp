#include "playback/audio_backend.h"

#include "logging/logger.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

namespace spotty::playback {

namespace {

void appendLittleEndian(std::vector<uint8_t>& out, uint32_t value, size_t bytes) {
    for (size_t i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

}  // namespace

PipeSink::PipeSink(std::optional<std::string> device, AudioFormat format)
    : device_(device.value_or("")), format_(format) {}

PipeSink::~PipeSink() {
    stop();
}

bool PipeSink::usesStdout() const {
    return device_.empty() || device_ == "-";
}

bool PipeSink::start() {
    if (file_) {
        return true;
    }
    if (usesStdout()) {
        file_ = stdout;
        return true;
    }
    file_ = std::fopen(device_.c_str(), "wb");
    if (!file_) {
        LOG_ERROR("Cannot open pipe sink {}: {}", device_, std::strerror(errno));
        return false;
    }
    LOG_DEBUG("Pipe sink opened {} ({})", device_, audioFormatToString(format_));
    return true;
}

void PipeSink::stop() {
    if (!file_) {
        return;
    }
    std::fflush(file_);
    if (file_ != stdout) {
        std::fclose(file_);
    }
    file_ = nullptr;
}

std::vector<uint8_t> PipeSink::encode(const std::vector<double>& samples, AudioFormat format) {
    std::vector<uint8_t> out;
    out.reserve(samples.size() * bytesPerSample(format));

    for (double sample : samples) {
        const double clamped = std::clamp(sample, -1.0, 1.0);
        switch (format) {
        case AudioFormat::S16: {
            auto value = static_cast<int16_t>(std::lround(clamped * 32767.0));
            appendLittleEndian(out, static_cast<uint16_t>(value), 2);
            break;
        }
        case AudioFormat::S32: {
            auto value = static_cast<int32_t>(std::llround(clamped * 2147483647.0));
            appendLittleEndian(out, static_cast<uint32_t>(value), 4);
            break;
        }
        case AudioFormat::F32: {
            float value = static_cast<float>(clamped);
            uint32_t bits = 0;
            std::memcpy(&bits, &value, sizeof(bits));
            appendLittleEndian(out, bits, 4);
            break;
        }
        }
    }
    return out;
}

bool PipeSink::write(const std::vector<double>& samples) {
    return writeRaw(encode(samples, format_));
}

bool PipeSink::writeRaw(const std::vector<uint8_t>& bytes) {
    if (!file_) {
        return false;
    }
    if (bytes.empty()) {
        return true;
    }
    if (std::fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
        LOG_ERROR("Pipe sink write failed: {}", std::strerror(errno));
        return false;
    }
    return true;
}

std::optional<SinkBuilder> findSink(std::string_view name) {
    if (name.empty() || name == PipeSink::kName) {
        return SinkBuilder([](std::optional<std::string> device, AudioFormat format) {
            return std::make_unique<PipeSink>(std::move(device), format);
        });
    }
    return std::nullopt;
}

}  // namespace spotty::playback
