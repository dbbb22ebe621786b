#pragma once

#include "playback/player_config.h"

#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace spotty::playback {

// Sink target used when the device only controls a remote player.
constexpr const char* kNullDevice = "/dev/null";

class Sink {
   public:
    virtual ~Sink() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;

    // Interleaved samples in [-1.0, 1.0]
    virtual bool write(const std::vector<double>& samples) = 0;
    // Encoded stream bytes, used in passthrough mode
    virtual bool writeRaw(const std::vector<uint8_t>& bytes) = 0;
};

/**
 * @brief Raw PCM (little endian) to a file, a fifo or stdout.
 *
 * An empty device or "-" selects stdout.
 */
class PipeSink : public Sink {
   public:
    static constexpr const char* kName = "pipe";

    PipeSink(std::optional<std::string> device, AudioFormat format);
    ~PipeSink() override;

    PipeSink(const PipeSink&) = delete;
    PipeSink& operator=(const PipeSink&) = delete;

    bool start() override;
    void stop() override;
    bool write(const std::vector<double>& samples) override;
    bool writeRaw(const std::vector<uint8_t>& bytes) override;

    const std::string& device() const {
        return device_;
    }
    AudioFormat format() const {
        return format_;
    }

    // Exposed for tests: converts samples to the configured wire format.
    static std::vector<uint8_t> encode(const std::vector<double>& samples, AudioFormat format);

   private:
    bool usesStdout() const;

    std::string device_;
    AudioFormat format_;
    FILE* file_ = nullptr;
};

using SinkBuilder =
    std::function<std::unique_ptr<Sink>(std::optional<std::string> device, AudioFormat format)>;

/**
 * @brief Look up a sink implementation by name; empty selects the default (pipe).
 */
std::optional<SinkBuilder> findSink(std::string_view name = {});

}  // namespace spotty::playback
