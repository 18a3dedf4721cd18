/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/key_document.hpp"

#include <qtils/read_file.hpp>

#include "serde/json.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blskey::key, KeyDocumentError, e) {
  using E = blskey::key::KeyDocumentError;
  switch (e) {
    case E::FILE_NOT_FOUND:
      return "Key document file not found";
    case E::JSON_PARSE_FAILED:
      return "Failed to parse JSON key document";
    case E::UNSUPPORTED_KEY_TYPE:
      return "Key document type is not Bls12381G2Key2020";
  }
  return "Unknown KeyDocumentError";
}

namespace blskey::key {

  KeyPairDocument toDocument(const Bls12381G2KeyPair &keypair,
                             bool include_private) {
    return {
        .id = keypair.id(),
        .controller = keypair.controller(),
        .type = std::string{keypair.type()},
        .public_key_base58 = keypair.publicKey(),
        .private_key_base58 =
            include_private ? keypair.privateKey() : std::nullopt,
    };
  }

  std::string toJson(const KeyPairDocument &document) {
    return json::encode(document);
  }

  outcome::result<KeyPairDocument> documentFromJson(std::string_view json) {
    KeyPairDocument document;
    try {
      json::decode(document, json);
    } catch (const std::runtime_error &) {
      return KeyDocumentError::JSON_PARSE_FAILED;
    }
    return document;
  }

  outcome::result<Bls12381G2KeyPair> keyPairFromDocument(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const KeyPairDocument &document) {
    if (document.type != Bls12381G2KeyPair::kType) {
      return KeyDocumentError::UNSUPPORTED_KEY_TYPE;
    }
    return Bls12381G2KeyPair::from(
        std::move(provider),
        {
            .id = document.id,
            .controller = document.controller,
            .public_key_base58 = document.public_key_base58,
            .private_key_base58 = document.private_key_base58,
        });
  }

  outcome::result<Bls12381G2KeyPair> loadKeyPairFromFile(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const std::filesystem::path &path) {
    if (not std::filesystem::exists(path)) {
      return KeyDocumentError::FILE_NOT_FOUND;
    }
    BOOST_OUTCOME_TRY(auto json, qtils::readText(path));
    BOOST_OUTCOME_TRY(auto document, documentFromJson(json));
    return keyPairFromDocument(std::move(provider), document);
  }

}  // namespace blskey::key
