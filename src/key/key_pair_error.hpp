/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace blskey::key {

  enum class KeyPairError : uint8_t {
    MISSING_PUBLIC_KEY = 1,
    INVALID_PUBLIC_KEY_LENGTH,
    INVALID_PRIVATE_KEY_LENGTH,
    NO_SIGNING_KEY,
    NO_VERIFICATION_KEY,
    VERIFICATION_ERROR,
    FINGERPRINT_NOT_MULTIBASE,
    FINGERPRINT_WRONG_MULTICODEC,
    FINGERPRINT_KEY_MISMATCH,
  };

}  // namespace blskey::key

OUTCOME_HPP_DECLARE_ERROR(blskey::key, KeyPairError);
