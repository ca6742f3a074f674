// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace custos {

//! Application identity a hardware wallet bridge asks for before its first use
struct DeviceManifest {
    std::string email;
    std::string app_url;
    std::string app_name;

    //! "email:app_url:app_name"
    std::string key() const;
};

//! Tracks one session initialization per manifest.
//! Callers racing on the same manifest share a single initialization and all observe its outcome.
//! A failed initialization is forgotten so that a later call retries it.
class DeviceSessionRegistry {
  public:
    using Initializer = std::function<void(const DeviceManifest&)>;
    using Finalizer = std::function<void(const DeviceManifest&)>;

    DeviceSessionRegistry() = default;
    ~DeviceSessionRegistry() = default;

    DeviceSessionRegistry(const DeviceSessionRegistry&) = delete;
    DeviceSessionRegistry& operator=(const DeviceSessionRegistry&) = delete;

    //! Runs initializer unless a session for manifest is already initialized or initializing,
    //! in which case waits for that one
    //! \throws whatever initializer threw, to the initiating caller and to every waiter
    void ensure_initialized(const DeviceManifest& manifest, const Initializer& initializer);

    //! Forgets every session, calling finalizer on each one that was initialized successfully
    void teardown(const Finalizer& finalizer = {});

    bool is_initialized(const DeviceManifest& manifest) const;

    size_t size() const;

  private:
    struct Session {
        explicit Session(DeviceManifest m) : manifest{std::move(m)}, ready{promise.get_future().share()} {}

        DeviceManifest manifest;
        std::promise<void> promise;
        std::shared_future<void> ready;
        bool initialized{false};
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace custos
