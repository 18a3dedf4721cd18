/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/bls12381_g2_key_pair.hpp"

#include <algorithm>

#include "codec/base58.hpp"
#include "key/key_pair_error.hpp"

namespace blskey::key {

  namespace {
    template <size_t N>
    outcome::result<qtils::ByteArr<N>> decodeKey(std::string_view base58,
                                                 KeyPairError wrong_length) {
      BOOST_OUTCOME_TRY(auto bytes, codec::decodeBase58(base58));
      if (bytes.size() != N) {
        return wrong_length;
      }
      qtils::ByteArr<N> key;
      std::ranges::copy(bytes, key.begin());
      return key;
    }
  }  // namespace

  Bls12381G2KeyPair::Bls12381G2KeyPair(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      std::optional<std::string> id,
      std::optional<std::string> controller,
      crypto::bbs::BlsPublicKey public_key,
      std::optional<crypto::bbs::BlsSecretKey> private_key)
      : provider_{std::move(provider)},
        id_{std::move(id)},
        controller_{std::move(controller)},
        public_key_{std::move(public_key)},
        private_key_{std::move(private_key)} {}

  outcome::result<Bls12381G2KeyPair> Bls12381G2KeyPair::from(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const KeyPairOptions &options) {
    if (options.public_key_base58.empty()) {
      return KeyPairError::MISSING_PUBLIC_KEY;
    }

    std::optional<crypto::bbs::BlsSecretKey> private_key;
    if (options.private_key_base58.has_value()
        and not options.private_key_base58->empty()) {
      BOOST_OUTCOME_TRY(private_key,
                        decodeKey<crypto::bbs::kBlsSecretKeySize>(
                            *options.private_key_base58,
                            KeyPairError::INVALID_PRIVATE_KEY_LENGTH));
    }

    BOOST_OUTCOME_TRY(auto public_key,
                      decodeKey<crypto::bbs::kBlsPublicKeySize>(
                          options.public_key_base58,
                          KeyPairError::INVALID_PUBLIC_KEY_LENGTH));

    return Bls12381G2KeyPair{std::move(provider),
                             options.id,
                             options.controller,
                             public_key,
                             private_key};
  }

  outcome::result<Bls12381G2KeyPair> Bls12381G2KeyPair::generate(
      qtils::SharedRef<crypto::bbs::BbsProvider> provider,
      const GenerateKeyPairOptions &options) {
    BOOST_OUTCOME_TRY(auto keypair, provider->generateKeypair(options.seed));
    return from(std::move(provider),
                {
                    .id = options.id,
                    .controller = options.controller,
                    .public_key_base58 = codec::encodeBase58(keypair.public_key),
                    .private_key_base58 =
                        codec::encodeBase58(keypair.secret_key),
                });
  }

  std::string Bls12381G2KeyPair::publicKey() const {
    return codec::encodeBase58(public_key_);
  }

  std::optional<std::string> Bls12381G2KeyPair::privateKey() const {
    if (not private_key_.has_value()) {
      return std::nullopt;
    }
    return codec::encodeBase58(*private_key_);
  }

  std::shared_ptr<KeyPairSigner> Bls12381G2KeyPair::signer() const {
    return makeSigner(provider_, private_key_, public_key_);
  }

  std::shared_ptr<KeyPairVerifier> Bls12381G2KeyPair::verifier() const {
    return makeVerifier(provider_, public_key_);
  }

  PublicKeyNode Bls12381G2KeyPair::addEncodedPublicKey(
      PublicKeyNode node) const {
    node.public_key_base58 = publicKey();
    return node;
  }

  outcome::result<std::string> Bls12381G2KeyPair::fingerprintFromPublicKey(
      std::string_view public_key_base58) {
    return fingerprint::fromPublicKeyBase58(public_key_base58);
  }

  std::string Bls12381G2KeyPair::fingerprint() const {
    return fingerprint::encode(public_key_);
  }

  fingerprint::FingerprintVerification Bls12381G2KeyPair::verifyFingerprint(
      std::string_view fingerprint) const noexcept {
    return fingerprint::verify(fingerprint, public_key_);
  }

}  // namespace blskey::key
