/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bbs/bbs_provider_impl.hpp"

#include <algorithm>

#include <bbs.h>

#include "crypto/bbs/bbs_error.hpp"
#include "crypto/bbs/ffi.hpp"

namespace blskey::crypto::bbs {

  BbsProviderImpl::BbsProviderImpl(qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("BbsProvider", "crypto")} {}

  outcome::result<BlsKeypair> BbsProviderImpl::generateKeypair(
      const std::optional<qtils::ByteVec> &seed) {
    // Empty seed makes library use its own secure random source
    qtils::BytesIn seed_bytes;
    if (seed.has_value()) {
      seed_bytes = *seed;
    }

    ffi::Buffer public_key;
    ffi::Buffer secret_key;
    ffi::Error error;
    bls_generate_g2_key(ffi::asByteArray(seed_bytes),
                        public_key.out(),
                        secret_key.out(),
                        error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Can't generate keypair: {}", error.message());
      return BbsError::KEY_GENERATION_FAILED;
    }

    if (public_key.view().size() != kBlsPublicKeySize
        or secret_key.view().size() != kBlsSecretKeySize) {
      SL_WARN(logger_,
              "Generated keypair has unexpected size: public {}, secret {}",
              public_key.view().size(),
              secret_key.view().size());
      return BbsError::KEY_GENERATION_FAILED;
    }

    BlsKeypair keypair;
    std::ranges::copy(public_key.view(), keypair.public_key.begin());
    std::ranges::copy(secret_key.view(), keypair.secret_key.begin());

    SL_DEBUG(logger_,
             "Generated {} keypair",
             seed_bytes.empty() ? "random" : "seeded");
    return keypair;
  }

  outcome::result<BbsSignature> BbsProviderImpl::sign(
      const BbsMessages &messages, const BlsKeypair &keypair) {
    BOOST_OUTCOME_TRY(auto bbs_public_key,
                      bbsPublicKey(keypair.public_key, messages.size()));

    ffi::Error error;
    auto handle = bbs_sign_context_init(error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Can't init sign context: {}", error.message());
      return BbsError::SIGNING_FAILED;
    }
    ffi::SignContext context{handle};

    for (auto &message : messages) {
      bbs_sign_context_add_message_bytes(
          context.handle(), ffi::asByteArray(message), error.out());
      if (error.failed()) {
        SL_WARN(logger_, "Can't add message to sign: {}", error.message());
        return BbsError::SIGNING_FAILED;
      }
    }

    bbs_sign_context_set_secret_key(
        context.handle(), ffi::asByteArray(keypair.secret_key), error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Secret key rejected: {}", error.message());
      return BbsError::INVALID_KEY;
    }

    bbs_sign_context_set_public_key(
        context.handle(), ffi::asByteArray(bbs_public_key), error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Public key rejected: {}", error.message());
      return BbsError::INVALID_KEY;
    }

    ffi::Buffer signature;
    bbs_sign_context_finish(context.handle(), signature.out(), error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Can't sign: {}", error.message());
      return BbsError::SIGNING_FAILED;
    }
    context.finished();

    SL_TRACE(logger_, "Signed {} messages", messages.size());
    return BbsSignature{signature.view()};
  }

  outcome::result<bool> BbsProviderImpl::verify(const BbsMessages &messages,
                                                const BlsPublicKey &public_key,
                                                qtils::BytesIn signature) {
    BOOST_OUTCOME_TRY(auto bbs_public_key,
                      bbsPublicKey(public_key, messages.size()));

    ffi::Error error;
    auto handle = bbs_verify_context_init(error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Can't init verify context: {}", error.message());
      return BbsError::VERIFICATION_FAILED;
    }
    ffi::VerifyContext context{handle};

    for (auto &message : messages) {
      bbs_verify_context_add_message_bytes(
          context.handle(), ffi::asByteArray(message), error.out());
      if (error.failed()) {
        SL_WARN(logger_, "Can't add message to verify: {}", error.message());
        return BbsError::VERIFICATION_FAILED;
      }
    }

    bbs_verify_context_set_public_key(
        context.handle(), ffi::asByteArray(bbs_public_key), error.out());
    if (error.failed()) {
      SL_WARN(logger_, "Public key rejected: {}", error.message());
      return BbsError::INVALID_KEY;
    }

    bbs_verify_context_set_signature(
        context.handle(), ffi::asByteArray(signature), error.out());
    if (error.failed()) {
      SL_DEBUG(logger_,
               "Signature of {} bytes rejected: {}",
               signature.size(),
               error.message());
      return BbsError::MALFORMED_SIGNATURE;
    }

    // Zero means signature is valid
    auto result = bbs_verify_context_finish(context.handle(), error.out());
    if (error.failed()) {
      SL_DEBUG(logger_, "Verification failed: {}", error.message());
      return BbsError::VERIFICATION_FAILED;
    }
    context.finished();

    SL_TRACE(logger_,
             "Verified {} messages: {}",
             messages.size(),
             result == 0 ? "valid" : "invalid");
    return result == 0;
  }

  outcome::result<qtils::ByteVec> BbsProviderImpl::bbsPublicKey(
      const BlsPublicKey &public_key, size_t message_count) const {
    ffi::Buffer bbs_public_key;
    ffi::Error error;
    bls_public_key_to_bbs_key(ffi::asByteArray(public_key),
                              static_cast<uint32_t>(message_count),
                              bbs_public_key.out(),
                              error.out());
    if (error.failed()) {
      SL_WARN(logger_,
              "Can't derive BBS key for {} messages: {}",
              message_count,
              error.message());
      return BbsError::INVALID_KEY;
    }
    return qtils::ByteVec{bbs_public_key.view()};
  }

}  // namespace blskey::crypto::bbs
