/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

/**
 * Fingerprint is self-describing text form of public key:
 *   "z" + base58btc(0xeb | 0x01 | public key bytes)
 * where "z" is multibase prefix of base58btc, 0xeb is multicodec identifier
 * of BLS12-381 G2 public key and 0x01 is varint trailing byte.
 */
namespace blskey::key::fingerprint {

  constexpr char kMultibaseBase58Prefix = 'z';
  constexpr uint8_t kBls12381G2Multicodec = 0xeb;
  constexpr uint8_t kVarintTrailingByte = 0x01;
  constexpr size_t kMulticodecPrefixSize = 2;

  /// Outcome of fingerprint check, error is set iff not valid
  struct FingerprintVerification {
    bool valid = false;
    std::optional<std::error_code> error;

    static FingerprintVerification success() {
      return {.valid = true, .error = std::nullopt};
    }

    static FingerprintVerification failure(std::error_code error) {
      return {.valid = false, .error = error};
    }

    explicit operator bool() const {
      return valid;
    }
  };

  std::string encode(qtils::BytesIn public_key);

  /// Fails only if text is not base58
  outcome::result<std::string> fromPublicKeyBase58(
      std::string_view public_key_base58);

  FingerprintVerification verify(std::string_view fingerprint,
                                 qtils::BytesIn public_key) noexcept;

}  // namespace blskey::key::fingerprint
