/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bbs/bbs_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blskey::crypto::bbs, BbsError, e) {
  using E = blskey::crypto::bbs::BbsError;
  switch (e) {
    case E::KEY_GENERATION_FAILED:
      return "BLS12-381 G2 key generation failed";
    case E::INVALID_KEY:
      return "Key was rejected by BBS+ library";
    case E::SIGNING_FAILED:
      return "BBS+ signing failed";
    case E::MALFORMED_SIGNATURE:
      return "BBS+ signature bytes are malformed";
    case E::VERIFICATION_FAILED:
      return "BBS+ verification could not be completed";
  }
  return "Unknown BbsError";
}
