// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "device_provider.hpp"

#include <utility>

#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>
#include <custos/infra/common/ensure.hpp>
#include <custos/infra/common/log.hpp>

namespace custos {

NormalizedSignature canonicalize_device_signature(const DeviceSignature& signature) {
    const auto parity{v_to_y_parity_and_chain_id(signature.v)};
    if (!parity) {
        throw DeviceException{"Device: unsupported v " + intx::to_string(signature.v)};
    }

    const intx::uint256 r{to_uint256(signature.r)};
    intx::uint256 s{to_uint256(signature.s)};
    if (!is_valid_signature(r, s)) {
        throw DeviceException{"Device: r or s out of range"};
    }

    bool odd{parity->odd};
    if (!is_low_s(s)) {
        s = normalize_s(s);
        odd = !odd;
    }
    return {signature.r, to_bytes32(s), static_cast<uint8_t>(kRecoveryIdOffset + (odd ? 1 : 0))};
}

DeviceProvider::DeviceProvider(DeviceSettings settings, std::shared_ptr<DeviceClient> client,
                               DeviceSessionRegistry* registry)
    : settings_{std::move(settings)}, client_{std::move(client)}, registry_{registry} {
    ensure(client_ != nullptr, "Device: null client");
    ensure_pre_condition(!settings_.manifest || registry_ != nullptr,
                         [] { return std::string{"Device: manifest given without session registry"}; });
}

void DeviceProvider::ensure_session() {
    if (!settings_.manifest) {
        return;
    }
    registry_->ensure_initialized(*settings_.manifest, [this](const DeviceManifest& manifest) {
        client_->initialize(manifest);
    });
}

evmc::address DeviceProvider::address() {
    {
        std::scoped_lock lock{address_mutex_};
        if (address_) {
            return *address_;
        }
    }

    ensure_session();
    const evmc::address address{client_->get_address(settings_.derivation_path)};

    std::scoped_lock lock{address_mutex_};
    if (!address_) {
        address_ = address;
        log::Info("Device key resolved", {"path", settings_.derivation_path, "address", address_to_hex(*address_)});
    }
    return *address_;
}

NormalizedSignature DeviceProvider::sign_digest(const evmc::bytes32& digest) {
    ensure_session();
    const DeviceSignature signature{client_->sign_hash(settings_.derivation_path, digest)};
    NormalizedSignature normalized{canonicalize_device_signature(signature)};
    CUSTOS_DEBUG << "Device signed" << log::Args{"digest", to_hex(digest, true), "v", std::to_string(normalized.v)};
    return normalized;
}

void DeviceProvider::close() {
    client_->close();
}

}  // namespace custos
