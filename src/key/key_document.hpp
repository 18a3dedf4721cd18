/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "key/bls12381_g2_key_pair.hpp"
#include "serde/json_fwd.hpp"

namespace blskey::key {

  enum class KeyDocumentError : uint8_t {
    FILE_NOT_FOUND = 1,
    JSON_PARSE_FAILED,
    UNSUPPORTED_KEY_TYPE,
  };

  /// JSON form of key pair, as exported by linked-data key tooling
  struct KeyPairDocument {
    std::optional<std::string> id;
    std::optional<std::string> controller;
    std::string type;
    std::string public_key_base58;
    std::optional<std::string> private_key_base58;

    JSON_CAMEL(id, controller, type, public_key_base58, private_key_base58)
  };

  KeyPairDocument toDocument(const Bls12381G2KeyPair &keypair,
                             bool include_private);

  std::string toJson(const KeyPairDocument &document);

  outcome::result<KeyPairDocument> documentFromJson(std::string_view json);

  outcome::result<Bls12381G2KeyPair> keyPairFromDocument(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const KeyPairDocument &document);

  /**
   * Load key pair from JSON document file
   * @param path file with document, private key is optional
   */
  outcome::result<Bls12381G2KeyPair> loadKeyPairFromFile(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::filesystem::path &path);

}  // namespace blskey::key

OUTCOME_HPP_DECLARE_ERROR(blskey::key, KeyDocumentError);
