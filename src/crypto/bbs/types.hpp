/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <qtils/byte_arr.hpp>
#include <qtils/byte_vec.hpp>

namespace blskey::crypto::bbs {
  /// Compressed G2 point of BLS12-381
  constexpr size_t kBlsPublicKeySize = 96;
  /// Scalar of the BLS12-381 field
  constexpr size_t kBlsSecretKeySize = 32;

  using BlsPublicKey = qtils::ByteArr<kBlsPublicKeySize>;
  using BlsSecretKey = qtils::ByteArr<kBlsSecretKeySize>;
  struct BlsKeypair {
    BlsSecretKey secret_key;
    BlsPublicKey public_key;
  };

  using BbsSignature = qtils::ByteVec;

  /// Ordered list of signed statements, each signed as one message
  using BbsMessages = std::vector<std::string>;
}  // namespace blskey::crypto::bbs
