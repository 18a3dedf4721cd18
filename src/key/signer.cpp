/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/signer.hpp"

#include "codec/base64.hpp"
#include "key/key_pair_error.hpp"

namespace blskey::key {

  BbsSigner::BbsSigner(qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                       crypto::bbs::BlsKeypair keypair)
      : provider_{std::move(provider)}, keypair_{std::move(keypair)} {}

  outcome::result<std::string> BbsSigner::sign(
      const KeyPairMessage &message) const {
    BOOST_OUTCOME_TRY(auto signature,
                      provider_->sign(toBbsMessages(message), keypair_));
    return codec::encodeBase64(signature);
  }

  outcome::result<std::string> NoKeySigner::sign(const KeyPairMessage &) const {
    return KeyPairError::NO_SIGNING_KEY;
  }

  std::shared_ptr<KeyPairSigner> makeSigner(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::optional<crypto::bbs::BlsSecretKey> &secret_key,
      const crypto::bbs::BlsPublicKey &public_key) {
    if (not secret_key.has_value()) {
      return std::make_shared<NoKeySigner>();
    }
    return std::make_shared<BbsSigner>(
        std::move(provider),
        crypto::bbs::BlsKeypair{
            .secret_key = *secret_key,
            .public_key = public_key,
        });
  }

}  // namespace blskey::key
