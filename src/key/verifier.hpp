/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "crypto/bbs/bbs_provider.hpp"
#include "key/key_pair_message.hpp"

namespace blskey::key {

  /// Capability to check BBS+ signatures, handed to signature suites
  class KeyPairVerifier {
   public:
    virtual ~KeyPairVerifier() = default;

    /**
     * @param message must equal signed message, same count and order
     * @param signature_base64 padded base64 text
     * @return false if signature doesn't match, error if it can't be parsed
     */
    virtual outcome::result<bool> verify(
        const KeyPairMessage &message,
        std::string_view signature_base64) const = 0;
  };

  class BbsVerifier final : public KeyPairVerifier {
   public:
    BbsVerifier(qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                crypto::bbs::BlsPublicKey public_key);

    outcome::result<bool> verify(
        const KeyPairMessage &message,
        std::string_view signature_base64) const override;

   private:
    qtils::SharedRef<crypto::bbs::BbsProvider> provider_;
    crypto::bbs::BlsPublicKey public_key_;
  };

  class NoKeyVerifier final : public KeyPairVerifier {
   public:
    outcome::result<bool> verify(
        const KeyPairMessage &message,
        std::string_view signature_base64) const override;
  };

  std::shared_ptr<KeyPairVerifier> makeVerifier(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::optional<crypto::bbs::BlsPublicKey> &public_key);

}  // namespace blskey::key
