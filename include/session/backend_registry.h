#pragma once

#include "discovery/discovery_service.h"
#include "session/one_shot.h"
#include "session/streaming.h"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spotty::session {

// Collaborators implementing the streaming protocol for one service.
struct Backend {
    std::string name;
    std::shared_ptr<StreamingService> streaming;
    std::shared_ptr<PlayerFactory> players;
    std::shared_ptr<ControlSurfaceFactory> controls;
    discovery::DiscoveryFactory discovery;
    std::shared_ptr<OneShotService> oneShot;

    bool isComplete() const;
};

using BackendFactory = std::function<Backend()>;

class BackendRegistry {
   public:
    /**
     * @return false if a backend with that name is already registered
     */
    bool registerBackend(const std::string& name, BackendFactory factory);

    /**
     * @brief Instantiate a backend.
     *
     * An empty name selects the first registered backend (in name order).
     * Incomplete backends are rejected.
     */
    std::optional<Backend> createBackend(const std::string& name = {}) const;

    std::vector<std::string> names() const;
    size_t size() const {
        return factories_.size();
    }

   private:
    std::map<std::string, BackendFactory> factories_;
};

}  // namespace spotty::session
