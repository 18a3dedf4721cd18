/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "crypto/bbs/bbs_provider.hpp"

namespace blskey::crypto::bbs {
  class BbsProviderMock : public BbsProvider {
   public:
    MOCK_METHOD(outcome::result<BlsKeypair>,
                generateKeypair,
                (const std::optional<qtils::ByteVec> &),
                (override));
    MOCK_METHOD(outcome::result<BbsSignature>,
                sign,
                (const BbsMessages &, const BlsKeypair &),
                (override));
    MOCK_METHOD(outcome::result<bool>,
                verify,
                (const BbsMessages &, const BlsPublicKey &, qtils::BytesIn),
                (override));
  };
}  // namespace blskey::crypto::bbs
