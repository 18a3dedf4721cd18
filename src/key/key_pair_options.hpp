/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <qtils/byte_vec.hpp>

namespace blskey::key {

  struct KeyPairOptions {
    std::optional<std::string> id;
    std::optional<std::string> controller;
    std::string public_key_base58;
    std::optional<std::string> private_key_base58;
  };

  struct GenerateKeyPairOptions {
    std::optional<std::string> id;
    std::optional<std::string> controller;
    /// Same seed gives same keypair
    std::optional<qtils::ByteVec> seed;
  };

  /// Verification method node of DID document
  struct PublicKeyNode {
    std::string id;
    std::string type;
    std::string controller;
    std::string public_key_base58;
  };

}  // namespace blskey::key
