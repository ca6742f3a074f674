// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <custos/provider/device_session_registry.hpp>
#include <custos/provider/signing_provider.hpp>

namespace custos {

inline constexpr std::string_view kDefaultDerivationPath{"m/44'/60'/0'/0/0"};

struct DeviceSettings {
    //! BIP-44 derivation path of the signing key
    std::string derivation_path{kDefaultDerivationPath};
    //! Set for devices requiring a one-time session initialization
    std::optional<DeviceManifest> manifest;
};

//! Signature as reported by a device; v may be a recovery id, 27/28 or an EIP-155 value
struct DeviceSignature {
    evmc::bytes32 r;
    evmc::bytes32 s;
    intx::uint256 v;
};

class DeviceException : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! Transport to a hardware wallet or a remote key service holding an HD wallet
class DeviceClient {
  public:
    virtual ~DeviceClient() = default;

    //! One-time session setup for the given manifest
    virtual void initialize(const DeviceManifest& manifest) = 0;

    virtual evmc::address get_address(std::string_view derivation_path) = 0;

    virtual DeviceSignature sign_hash(std::string_view derivation_path, const evmc::bytes32& digest) = 0;

    //! Releases the transport
    virtual void close() = 0;
};

//! Signs through a device which already returns (r, s, v)
class DeviceProvider : public SigningProvider {
  public:
    //! \param registry : required when settings carry a manifest, must outlive the provider
    DeviceProvider(DeviceSettings settings, std::shared_ptr<DeviceClient> client,
                   DeviceSessionRegistry* registry = nullptr);

    evmc::address address() override;

    //! \throws DeviceException if the device returns an out of range signature or an unusable v
    NormalizedSignature sign_digest(const evmc::bytes32& digest) override;

    void close();

  private:
    void ensure_session();

    DeviceSettings settings_;
    std::shared_ptr<DeviceClient> client_;
    DeviceSessionRegistry* registry_;
    std::mutex address_mutex_;
    std::optional<evmc::address> address_;
};

//! Maps a device signature to canonical low-S form with v in {27, 28}
//! \throws DeviceException as DeviceProvider::sign_digest
NormalizedSignature canonicalize_device_signature(const DeviceSignature& signature);

}  // namespace custos
