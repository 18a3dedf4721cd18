/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace blskey::crypto::bbs {

  enum class BbsError : uint8_t {
    KEY_GENERATION_FAILED = 1,
    INVALID_KEY,
    SIGNING_FAILED,
    MALFORMED_SIGNATURE,
    VERIFICATION_FAILED,
  };

}  // namespace blskey::crypto::bbs

OUTCOME_HPP_DECLARE_ERROR(blskey::crypto::bbs, BbsError);
