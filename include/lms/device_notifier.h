#pragma once

#include "playback/player_event.h"

namespace spotty::lms {

/**
 * @brief Receiver of playback state transitions on the external media server.
 *
 * Implementations absorb every delivery failure; the return value is informational.
 */
class DeviceNotifier {
   public:
    virtual ~DeviceNotifier() = default;
    virtual bool signalEvent(const playback::PlayerEvent& event) = 0;
};

}  // namespace spotty::lms
