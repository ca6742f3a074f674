// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <custos/core/common/bytes.hpp>
#include <custos/provider/device_provider.hpp>
#include <custos/provider/kms_provider.hpp>

namespace custos::test_util {

//! SubjectPublicKeyInfo (id-ecPublicKey, secp256k1) wrapping the uncompressed public key of private_key
Bytes spki_of(const evmc::bytes32& private_key);

//! PEM armour of a DER blob, 64 characters per line
std::string to_pem(ByteView der);

//! In-memory KMS signing with libsecp256k1 and answering in DER like a cloud service
class FakeKmsClient : public KmsClient {
  public:
    explicit FakeKmsClient(const evmc::bytes32& private_key);

    std::optional<Bytes> get_public_key(const KmsSettings& settings) override;
    std::optional<Bytes> sign_digest(const KmsSettings& settings, const evmc::bytes32& digest) override;

    //! Reported public key; std::nullopt simulates a key without public part
    std::optional<Bytes> public_key;
    //! Whether to return the high-S twin of each signature
    bool high_s{false};
    //! Whether to return no signature at all
    bool fail_signing{false};
    //! When set, returned instead of the real signature
    std::optional<Bytes> forced_signature;

    //! Runs inside get_public_key, before answering
    std::function<void()> on_get_public_key;

    size_t public_key_calls{0};
    std::vector<std::string> signing_key_ids;

  private:
    evmc::bytes32 private_key_;
};

//! In-memory device signing with libsecp256k1 and reporting v in a configurable convention
class FakeDeviceClient : public DeviceClient {
  public:
    enum class VStyle {
        kRecoveryId,  // 0 or 1
        kLegacy,      // 27 or 28
        kEip155,      // chain_id * 2 + 35 + parity
    };

    explicit FakeDeviceClient(const evmc::bytes32& private_key);

    void initialize(const DeviceManifest& manifest) override;
    evmc::address get_address(std::string_view derivation_path) override;
    DeviceSignature sign_hash(std::string_view derivation_path, const evmc::bytes32& digest) override;
    void close() override { closed = true; }

    VStyle v_style{VStyle::kLegacy};
    intx::uint256 chain_id{1};
    bool high_s{false};

    //! Runs inside get_address, before answering
    std::function<void()> on_get_address;

    std::vector<std::string> initialized_apps;
    std::vector<std::string> requested_paths;
    bool closed{false};

  private:
    evmc::bytes32 private_key_;
    evmc::address address_;
};

}  // namespace custos::test_util
