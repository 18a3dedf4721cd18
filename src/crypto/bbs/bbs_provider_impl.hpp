/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "crypto/bbs/bbs_provider.hpp"
#include "log/logger.hpp"

namespace blskey::crypto::bbs {

  /**
   * BBS+ over BLS12-381 backed by ffi-bbs-signatures.
   * G2 public key is expanded to BBS public key for exact message count on
   * every call, so one keypair signs message lists of any length.
   */
  class BbsProviderImpl : public BbsProvider {
   public:
    explicit BbsProviderImpl(qtils::SharedRef<log::LoggingSystem> logsys);

    outcome::result<BlsKeypair> generateKeypair(
        const std::optional<qtils::ByteVec> &seed) override;

    outcome::result<BbsSignature> sign(const BbsMessages &messages,
                                       const BlsKeypair &keypair) override;

    outcome::result<bool> verify(const BbsMessages &messages,
                                 const BlsPublicKey &public_key,
                                 qtils::BytesIn signature) override;

   private:
    outcome::result<qtils::ByteVec> bbsPublicKey(
        const BlsPublicKey &public_key, size_t message_count) const;

    log::Logger logger_;
  };

}  // namespace blskey::crypto::bbs
