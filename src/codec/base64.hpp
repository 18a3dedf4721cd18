/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace blskey::codec {

  enum class Base64Error : uint8_t {
    INVALID_BASE64 = 1,
  };
  Q_ENUM_ERROR_CODE(Base64Error) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_BASE64:
        return "Invalid base64 text";
    }
    return "Unknown Base64Error";
  }

  /// RFC 4648 alphabet with padding
  std::string encodeBase64(qtils::BytesIn bytes);

  outcome::result<qtils::ByteVec> decodeBase64(std::string_view text);

}  // namespace blskey::codec
