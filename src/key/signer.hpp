/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/bbs/bbs_provider.hpp"
#include "key/key_pair_message.hpp"

namespace blskey::key {

  /// Capability to produce BBS+ signatures, handed to signature suites
  class KeyPairSigner {
   public:
    virtual ~KeyPairSigner() = default;

    /// @return signature as padded base64 text
    virtual outcome::result<std::string> sign(
        const KeyPairMessage &message) const = 0;
  };

  class BbsSigner final : public KeyPairSigner {
   public:
    BbsSigner(qtils::SharedRef<crypto::bbs::BbsProvider> provider,
              crypto::bbs::BlsKeypair keypair);

    outcome::result<std::string> sign(
        const KeyPairMessage &message) const override;

   private:
    qtils::SharedRef<crypto::bbs::BbsProvider> provider_;
    crypto::bbs::BlsKeypair keypair_;
  };

  /// Signer of key pair without private key, fails on every call
  class NoKeySigner final : public KeyPairSigner {
   public:
    outcome::result<std::string> sign(
        const KeyPairMessage &message) const override;
  };

  std::shared_ptr<KeyPairSigner> makeSigner(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::optional<crypto::bbs::BlsSecretKey> &secret_key,
      const crypto::bbs::BlsPublicKey &public_key);

}  // namespace blskey::key
