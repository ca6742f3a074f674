// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "device_session_registry.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <custos/infra/common/log.hpp>

namespace custos {

std::string DeviceManifest::key() const {
    return email + ":" + app_url + ":" + app_name;
}

void DeviceSessionRegistry::ensure_initialized(const DeviceManifest& manifest, const Initializer& initializer) {
    const std::string key{manifest.key()};

    std::shared_ptr<Session> session;
    bool initiator{false};
    {
        std::scoped_lock lock{mutex_};
        auto it = sessions_.find(key);
        if (it == sessions_.end()) {
            it = sessions_.emplace(key, std::make_shared<Session>(manifest)).first;
            initiator = true;
        }
        session = it->second;
    }

    if (!initiator) {
        session->ready.get();
        return;
    }

    CUSTOS_DEBUG << "Initializing device session" << log::Args{"manifest", key};
    try {
        initializer(manifest);
    } catch (...) {
        {
            std::scoped_lock lock{mutex_};
            const auto it = sessions_.find(key);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
        }
        CUSTOS_WARN << "Device session initialization failed" << log::Args{"manifest", key};
        session->promise.set_exception(std::current_exception());
        throw;
    }
    session->initialized = true;
    session->promise.set_value();
}

void DeviceSessionRegistry::teardown(const Finalizer& finalizer) {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::scoped_lock lock{mutex_};
        sessions.swap(sessions_);
    }
    for (const auto& [key, session] : sessions) {
        session->ready.wait();
        if (session->initialized && finalizer) {
            CUSTOS_DEBUG << "Finalizing device session" << log::Args{"manifest", key};
            finalizer(session->manifest);
        }
    }
}

bool DeviceSessionRegistry::is_initialized(const DeviceManifest& manifest) const {
    std::shared_ptr<Session> session;
    {
        std::scoped_lock lock{mutex_};
        const auto it = sessions_.find(manifest.key());
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
    }
    return session->ready.wait_for(std::chrono::seconds{0}) == std::future_status::ready && session->initialized;
}

size_t DeviceSessionRegistry::size() const {
    std::scoped_lock lock{mutex_};
    return sessions_.size();
}

}  // namespace custos
