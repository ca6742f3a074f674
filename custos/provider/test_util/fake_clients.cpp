// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_clients.hpp"

#include <stdexcept>

#include <absl/strings/escaping.h>

#include <custos/core/common/bytes_to_string.hpp>
#include <custos/core/common/util.hpp>
#include <custos/core/crypto/secp256k1n.hpp>
#include <custos/core/test_util/der.hpp>
#include <custos/core/test_util/signer.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/core/types/y_parity_and_chain_id.hpp>
#include <custos/infra/common/secp256k1_context.hpp>

namespace custos::test_util {

// SEQUENCE { SEQUENCE { id-ecPublicKey, secp256k1 }, BIT STRING (66 bytes) }
static constexpr std::string_view kSpkiPrefix{"3056301006072a8648ce3d020106052b8104000a034200"};

static Bytes public_key_of(const evmc::bytes32& private_key) {
    const auto public_key{SecP256K1Context{}.public_key_of(ByteView{private_key.bytes})};
    if (!public_key) {
        throw std::runtime_error("invalid test private key");
    }
    return *public_key;
}

static intx::uint256 device_v(bool odd, FakeDeviceClient::VStyle style, const intx::uint256& chain_id) {
    const unsigned parity{odd ? 1u : 0u};
    switch (style) {
        case FakeDeviceClient::VStyle::kRecoveryId:
            return parity;
        case FakeDeviceClient::VStyle::kLegacy:
            return kRecoveryIdOffset + parity;
        case FakeDeviceClient::VStyle::kEip155:
            break;
    }
    return chain_id * 2 + 35 + parity;
}

Bytes spki_of(const evmc::bytes32& private_key) {
    Bytes spki{*from_hex(kSpkiPrefix)};
    spki.append(public_key_of(private_key));
    return spki;
}

std::string to_pem(ByteView der) {
    const std::string base64{absl::Base64Escape(byte_view_to_string_view(der))};
    std::string pem{"-----BEGIN PUBLIC KEY-----\n"};
    for (size_t i{0}; i < base64.size(); i += 64) {
        pem += base64.substr(i, 64);
        pem += '\n';
    }
    pem += "-----END PUBLIC KEY-----\n";
    return pem;
}

FakeKmsClient::FakeKmsClient(const evmc::bytes32& private_key)
    : public_key{spki_of(private_key)}, private_key_{private_key} {}

std::optional<Bytes> FakeKmsClient::get_public_key(const KmsSettings&) {
    ++public_key_calls;
    if (on_get_public_key) {
        on_get_public_key();
    }
    return public_key;
}

std::optional<Bytes> FakeKmsClient::sign_digest(const KmsSettings& settings, const evmc::bytes32& digest) {
    signing_key_ids.push_back(settings.key_id);
    if (fail_signing) {
        return std::nullopt;
    }
    if (forced_signature) {
        return forced_signature;
    }

    const TestSignature signature{sign(digest, private_key_)};
    if (high_s) {
        return encode_der_signature(signature.r, kSecp256k1n - signature.s);
    }
    return signature.der;
}

FakeDeviceClient::FakeDeviceClient(const evmc::bytes32& private_key)
    : private_key_{private_key}, address_{*public_key_to_address(public_key_of(private_key))} {}

void FakeDeviceClient::initialize(const DeviceManifest& manifest) {
    initialized_apps.push_back(manifest.app_name);
}

evmc::address FakeDeviceClient::get_address(std::string_view derivation_path) {
    requested_paths.emplace_back(derivation_path);
    if (on_get_address) {
        on_get_address();
    }
    return address_;
}

DeviceSignature FakeDeviceClient::sign_hash(std::string_view derivation_path, const evmc::bytes32& digest) {
    requested_paths.emplace_back(derivation_path);

    const TestSignature signature{sign(digest, private_key_)};
    intx::uint256 s{signature.s};
    bool odd{signature.recovery_id == 1};
    if (high_s) {
        s = kSecp256k1n - s;
        odd = !odd;
    }
    return {to_bytes32(signature.r), to_bytes32(s), device_v(odd, v_style, chain_id)};
}

}  // namespace custos::test_util
