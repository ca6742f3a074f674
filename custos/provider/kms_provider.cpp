// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "kms_provider.hpp"

#include <utility>

#include <absl/strings/escaping.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/strip.h>
#include <magic_enum.hpp>

#include <custos/core/common/bytes_to_string.hpp>
#include <custos/core/types/address.hpp>
#include <custos/core/types/evmc_bytes32.hpp>
#include <custos/infra/common/ensure.hpp>
#include <custos/infra/common/log.hpp>

namespace custos {

static constexpr std::string_view kPemHeader{"-----BEGIN PUBLIC KEY-----"};
static constexpr std::string_view kPemFooter{"-----END PUBLIC KEY-----"};

// 64 bytes of X || Y
static constexpr size_t kRawPublicKeyLength{64};

std::optional<Bytes> spki_from_pem(std::string_view pem) {
    pem = absl::StripAsciiWhitespace(pem);
    if (!absl::ConsumePrefix(&pem, kPemHeader) || !absl::ConsumeSuffix(&pem, kPemFooter)) {
        return std::nullopt;
    }
    const std::string base64{absl::StrReplaceAll(pem, {{"\r", ""}, {"\n", ""}, {" ", ""}})};
    std::string der;
    if (base64.empty() || !absl::Base64Unescape(base64, &der)) {
        return std::nullopt;
    }
    return string_to_bytes(der);
}

std::optional<evmc::address> spki_to_address(ByteView spki) noexcept {
    if (spki.size() < kRawPublicKeyLength) {
        return std::nullopt;
    }
    return public_key_to_address(spki.substr(spki.size() - kRawPublicKeyLength));
}

KmsProvider::KmsProvider(KmsSettings settings, std::shared_ptr<KmsClient> client)
    : settings_{std::move(settings)}, client_{std::move(client)} {
    ensure(client_ != nullptr, "KMS: null client");
    ensure_pre_condition(!settings_.key_id.empty(), [] { return std::string{"KMS: empty key id"}; });
}

evmc::address KmsProvider::address() {
    {
        std::scoped_lock lock{address_mutex_};
        if (address_) {
            return *address_;
        }
    }

    // The service is queried unlocked; concurrent first calls may both fetch, the first one wins
    const auto public_key{client_->get_public_key(settings_)};
    if (!public_key) {
        throw KmsException{"KMS: Unable to retrieve Public Key"};
    }
    const auto address{spki_to_address(*public_key)};
    if (!address) {
        throw KmsException{"KMS: Public Key too short"};
    }

    std::scoped_lock lock{address_mutex_};
    if (!address_) {
        address_ = *address;
        log::Info("KMS key resolved", {"key", settings_.key_id, "region", settings_.region, "address", address_to_hex(*address_)});
    }
    return *address_;
}

NormalizedSignature KmsProvider::sign_digest(const evmc::bytes32& digest) {
    const evmc::address signer{address()};

    const auto der{client_->sign_digest(settings_, digest)};
    if (!der) {
        throw KmsException{"KMS: Signing failed"};
    }

    try {
        NormalizedSignature signature{normalize_signature(*der, digest, signer)};
        CUSTOS_DEBUG << "KMS signed" << log::Args{"digest", to_hex(digest, true), "v", std::to_string(signature.v)};
        return signature;
    } catch (const MalformedSignatureException& ex) {
        CUSTOS_WARN << "KMS returned malformed signature"
                    << log::Args{"key", settings_.key_id, "error", std::string{magic_enum::enum_name(ex.err())}};
        throw;
    } catch (const SignatureException& ex) {
        CUSTOS_WARN << "KMS signature normalization failed" << log::Args{"key", settings_.key_id, "what", ex.what()};
        throw;
    }
}

}  // namespace custos
