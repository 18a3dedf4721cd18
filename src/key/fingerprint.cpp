/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/fingerprint.hpp"

#include <algorithm>

#include "codec/base58.hpp"
#include "key/key_pair_error.hpp"

namespace blskey::key::fingerprint {

  std::string encode(qtils::BytesIn public_key) {
    qtils::ByteVec buffer;
    buffer.reserve(kMulticodecPrefixSize + public_key.size());
    buffer.push_back(kBls12381G2Multicodec);
    buffer.push_back(kVarintTrailingByte);
    buffer.insert(buffer.end(), public_key.begin(), public_key.end());

    std::string fingerprint{kMultibaseBase58Prefix};
    fingerprint += codec::encodeBase58(buffer);
    return fingerprint;
  }

  outcome::result<std::string> fromPublicKeyBase58(
      std::string_view public_key_base58) {
    BOOST_OUTCOME_TRY(auto public_key, codec::decodeBase58(public_key_base58));
    return encode(public_key);
  }

  FingerprintVerification verify(std::string_view fingerprint,
                                 qtils::BytesIn public_key) noexcept {
    if (fingerprint.empty() or fingerprint.front() != kMultibaseBase58Prefix) {
      return FingerprintVerification::failure(
          make_error_code(KeyPairError::FINGERPRINT_NOT_MULTIBASE));
    }

    auto decoded_res = codec::decodeBase58(fingerprint.substr(1));
    if (decoded_res.has_error()) {
      return FingerprintVerification::failure(decoded_res.error());
    }
    qtils::BytesIn decoded = decoded_res.value();

    if (decoded.size() < kMulticodecPrefixSize
        or decoded[0] != kBls12381G2Multicodec
        or decoded[1] != kVarintTrailingByte) {
      return FingerprintVerification::failure(
          make_error_code(KeyPairError::FINGERPRINT_WRONG_MULTICODEC));
    }

    if (not std::ranges::equal(decoded.subspan(kMulticodecPrefixSize),
                               public_key)) {
      return FingerprintVerification::failure(
          make_error_code(KeyPairError::FINGERPRINT_KEY_MISMATCH));
    }

    return FingerprintVerification::success();
  }

}  // namespace blskey::key::fingerprint
