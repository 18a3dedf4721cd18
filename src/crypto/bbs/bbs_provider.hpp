/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

#include "crypto/bbs/types.hpp"

namespace blskey::crypto::bbs {

  class BbsProvider {
   public:
    virtual ~BbsProvider() = default;

    /**
     * Generate BLS12-381 G2 keypair
     * @param seed deterministic seed, random keypair if absent or empty
     */
    virtual outcome::result<BlsKeypair> generateKeypair(
        const std::optional<qtils::ByteVec> &seed) = 0;

    virtual outcome::result<BbsSignature> sign(const BbsMessages &messages,
                                               const BlsKeypair &keypair) = 0;

    /**
     * @return true if signature is valid for messages in given order,
     * error if signature bytes can't be parsed
     */
    virtual outcome::result<bool> verify(const BbsMessages &messages,
                                         const BlsPublicKey &public_key,
                                         qtils::BytesIn signature) = 0;
  };
}  // namespace blskey::crypto::bbs
