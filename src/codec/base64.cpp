/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/base64.hpp"

#include <cppcodec/base64_rfc4648.hpp>

namespace blskey::codec {

  std::string encodeBase64(qtils::BytesIn bytes) {
    return cppcodec::base64_rfc4648::encode(bytes.data(), bytes.size());
  }

  outcome::result<qtils::ByteVec> decodeBase64(std::string_view text) {
    try {
      return qtils::ByteVec{
          cppcodec::base64_rfc4648::decode(text.data(), text.size())};
    } catch (const cppcodec::parse_error &) {
      return Base64Error::INVALID_BASE64;
    }
  }

}  // namespace blskey::codec
