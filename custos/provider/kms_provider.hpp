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

#include <custos/core/common/bytes.hpp>
#include <custos/provider/signing_provider.hpp>

namespace custos {

struct KmsSettings {
    //! Key identifier: AWS key id/ARN or GCP CryptoKeyVersion resource name
    std::string key_id;
    std::string region{"us-east-1"};
};

class KmsException : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! Transport to a cloud key management service
class KmsClient {
  public:
    virtual ~KmsClient() = default;

    //! X.509 SubjectPublicKeyInfo of the key in DER, std::nullopt when the service returns none
    virtual std::optional<Bytes> get_public_key(const KmsSettings& settings) = 0;

    //! ASN.1 DER ECDSA signature of digest, std::nullopt when the service returns none
    virtual std::optional<Bytes> sign_digest(const KmsSettings& settings, const evmc::bytes32& digest) = 0;
};

//! Decodes the DER body of a "-----BEGIN PUBLIC KEY-----" PEM block
std::optional<Bytes> spki_from_pem(std::string_view pem);

//! Address of the uncompressed secp256k1 point closing a SubjectPublicKeyInfo
std::optional<evmc::address> spki_to_address(ByteView spki) noexcept;

//! Signs through a cloud KMS; DER signatures are normalized to (r, low s, v)
class KmsProvider : public SigningProvider {
  public:
    KmsProvider(KmsSettings settings, std::shared_ptr<KmsClient> client);

    //! \throws KmsException if the service returns no usable public key
    evmc::address address() override;

    //! \throws KmsException if the service returns no signature
    //! \throws SignatureException subclasses if the signature cannot be normalized
    NormalizedSignature sign_digest(const evmc::bytes32& digest) override;

    const KmsSettings& settings() const { return settings_; }

  private:
    KmsSettings settings_;
    std::shared_ptr<KmsClient> client_;
    std::mutex address_mutex_;
    std::optional<evmc::address> address_;
};

}  // namespace custos
