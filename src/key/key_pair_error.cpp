/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/key_pair_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blskey::key, KeyPairError, e) {
  using E = blskey::key::KeyPairError;
  switch (e) {
    case E::MISSING_PUBLIC_KEY:
      return "Public key is required";
    case E::INVALID_PUBLIC_KEY_LENGTH:
      return "Public key has wrong length for BLS12-381 G2 point";
    case E::INVALID_PRIVATE_KEY_LENGTH:
      return "Private key has wrong length for BLS12-381 scalar";
    case E::NO_SIGNING_KEY:
      return "No private key to sign with";
    case E::NO_VERIFICATION_KEY:
      return "No public key to verify with";
    case E::VERIFICATION_ERROR:
      return "Signature is structurally invalid";
    case E::FINGERPRINT_NOT_MULTIBASE:
      return "Fingerprint must be a multibase base58btc encoded string";
    case E::FINGERPRINT_WRONG_MULTICODEC:
      return "Fingerprint is not a Bls12381G2 multicodec key";
    case E::FINGERPRINT_KEY_MISMATCH:
      return "The fingerprint does not match the public key";
  }
  return "Unknown KeyPairError";
}
