#include "session/backend_registry.h"

#include "logging/logger.h"

#include <utility>

namespace spotty::session {

bool Backend::isComplete() const {
    return streaming && players && controls && discovery && oneShot;
}

bool BackendRegistry::registerBackend(const std::string& name, BackendFactory factory) {
    if (name.empty() || !factory) {
        return false;
    }
    auto [it, inserted] = factories_.emplace(name, std::move(factory));
    if (!inserted) {
        LOG_WARN("Backend {} already registered", name);
    }
    return inserted;
}

std::optional<Backend> BackendRegistry::createBackend(const std::string& name) const {
    if (factories_.empty()) {
        return std::nullopt;
    }

    auto it = name.empty() ? factories_.begin() : factories_.find(name);
    if (it == factories_.end()) {
        LOG_ERROR("Unknown backend: {}", name);
        return std::nullopt;
    }

    Backend backend = it->second();
    if (backend.name.empty()) {
        backend.name = it->first;
    }
    if (!backend.isComplete()) {
        LOG_ERROR("Backend {} is missing required components", it->first);
        return std::nullopt;
    }
    return backend;
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& entry : factories_) {
        result.push_back(entry.first);
    }
    return result;
}

}  // namespace spotty::session
