/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/verifier.hpp"

#include "codec/base64.hpp"
#include "crypto/bbs/bbs_error.hpp"
#include "key/key_pair_error.hpp"

namespace blskey::key {

  BbsVerifier::BbsVerifier(qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                           crypto::bbs::BlsPublicKey public_key)
      : provider_{std::move(provider)}, public_key_{std::move(public_key)} {}

  outcome::result<bool> BbsVerifier::verify(
      const KeyPairMessage &message, std::string_view signature_base64) const {
    BOOST_OUTCOME_TRY(auto signature, codec::decodeBase64(signature_base64));

    auto verified =
        provider_->verify(toBbsMessages(message), public_key_, signature);
    if (verified.has_error()) {
      using crypto::bbs::BbsError;
      auto &error = verified.error();
      if (error == BbsError::MALFORMED_SIGNATURE
          or error == BbsError::VERIFICATION_FAILED) {
        return KeyPairError::VERIFICATION_ERROR;
      }
      return error;
    }
    return verified.value();
  }

  outcome::result<bool> NoKeyVerifier::verify(const KeyPairMessage &,
                                              std::string_view) const {
    return KeyPairError::NO_VERIFICATION_KEY;
  }

  std::shared_ptr<KeyPairVerifier> makeVerifier(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::optional<crypto::bbs::BlsPublicKey> &public_key) {
    if (not public_key.has_value()) {
      return std::make_shared<NoKeyVerifier>();
    }
    return std::make_shared<BbsVerifier>(std::move(provider), *public_key);
  }

}  // namespace blskey::key
