/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/bbs/bbs_provider.hpp"
#include "key/fingerprint.hpp"
#include "key/key_pair_options.hpp"
#include "key/signer.hpp"
#include "key/verifier.hpp"

namespace blskey::key {

  /**
   * BLS12-381 G2 key pair for BBS+ signatures.
   * Public key is always present, private key is optional (verify-only
   * key pair). Immutable once created.
   */
  class Bls12381G2KeyPair {
   public:
    static constexpr std::string_view kType = "Bls12381G2Key2020";

    /**
     * Decode base58 key material
     * @return decoder error if text is not base58, KeyPairError if public
     * key is missing or key lengths are wrong
     */
    static outcome::result<Bls12381G2KeyPair> from(
        qtils::SharedRef<crypto::bbs::BbsProvider> provider,
        const KeyPairOptions &options);

    static outcome::result<Bls12381G2KeyPair> generate(
        qtils::SharedRef<crypto::bbs::BbsProvider> provider,
        const GenerateKeyPairOptions &options = {});

    const std::optional<std::string> &id() const {
      return id_;
    }

    const std::optional<std::string> &controller() const {
      return controller_;
    }

    std::string_view type() const {
      return kType;
    }

    const crypto::bbs::BlsPublicKey &publicKeyBytes() const {
      return public_key_;
    }

    const std::optional<crypto::bbs::BlsSecretKey> &privateKeyBytes() const {
      return private_key_;
    }

    /// Base58 encoded public key
    std::string publicKey() const;

    /// Base58 encoded private key
    std::optional<std::string> privateKey() const;

    std::shared_ptr<KeyPairSigner> signer() const;

    std::shared_ptr<KeyPairVerifier> verifier() const;

    /// Set `public_key_base58` of node to own public key
    PublicKeyNode addEncodedPublicKey(PublicKeyNode node) const;

    static outcome::result<std::string> fingerprintFromPublicKey(
        std::string_view public_key_base58);

    std::string fingerprint() const;

    /// Never throws, every failure is reported in result
    fingerprint::FingerprintVerification verifyFingerprint(
        std::string_view fingerprint) const noexcept;

   private:
    Bls12381G2KeyPair(qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                      std::optional<std::string> id,
                      std::optional<std::string> controller,
                      crypto::bbs::BlsPublicKey public_key,
                      std::optional<crypto::bbs::BlsSecretKey> private_key);

    qtils::SharedRef<crypto::bbs::BbsProvider> provider_;
    std::optional<std::string> id_;
    std::optional<std::string> controller_;
    crypto::bbs::BlsPublicKey public_key_;
    std::optional<crypto::bbs::BlsSecretKey> private_key_;
  };

}  // namespace blskey::key
