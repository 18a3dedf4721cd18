/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "key/fingerprint.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>

#include <qtils/test/outcome.hpp>

#include "codec/base58.hpp"
#include "key/bls12381_g2_key_pair.hpp"
#include "key/key_pair_error.hpp"
#include "tests/mock/crypto/bbs_provider_mock.hpp"

using blskey::codec::decodeBase58;
using blskey::crypto::bbs::BbsProviderMock;
using blskey::key::Bls12381G2KeyPair;
using blskey::key::KeyPairError;
namespace fingerprint = blskey::key::fingerprint;

// Reference key of did:key test suite
constexpr std::string_view kPublicKeyBase58 =
    "oqpWYKaZD9M1Kbe94BVXpr8WTdFBNZyKv48cziTiQUeuhm7sBhCABMyYG4kcMrseC68YTFF"
    "gyhiNeBKjzdKk9MiRWuLv5H4FFujQsQK2KTAtzU8qTBiZqBHMmnLF4PL7Ytu";
constexpr std::string_view kFingerprint =
    "zUC73gNPc1EnZmDDjYJzE8Bk89VRhuZPQYXFnSiSUZvX9N1i7N5VtMbJyowDR46rtARHLJY"
    "RVf7WMbGLb43s9tfTyKF9KFF22vBjXZRomcwtoQJmMNUSY7tfzyhLEy58dwUz3WD";
// Same key behind 0xed 0x01 tag
constexpr std::string_view kFingerprintWrongTag =
    "zURXWgwMhPWJEbFh4e9i2T2Hh7VFEKTE2bmm9rwyoJmVQh1Q94Q8hoyQqKRVN7rZM3uW9Co"
    "XXfwQWBzrJAyPdsgqzaM67DBfzwxVgjshwtjfrsNL3bESdaoVBT9VBZjwRkzGR81";
// Payload byte 10 flipped
constexpr std::string_view kFingerprintTampered =
    "zUC73gNPc1EnZmDDGUfWsLxjQdjNTjurPq5RGNT3xCKNwL2eRpCEdCP11Bjho8SRYeAywLj"
    "xgYb8QU34gX6tpJqwKNvVeFdWi4GHVfwxMM73MLScvbqAQHfQnBpwxgQzYFxe45s";
// Key with last byte dropped
constexpr std::string_view kFingerprintTruncated =
    "z7AK8rheHzbqqf7PphdFKqJPTYNr6eHQCgKBbmLp1MbnM28s6X9itWb4AhYKDhaVyT9g3Z"
    "XEFedpS4ESjc8Ss3eGB3KcR58i1tUMWadS6aX7JJy8nPzRN6e5kwzAoDFXjMVznR";

class FingerprintTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto keypair_res = Bls12381G2KeyPair::from(
        provider, {.public_key_base58 = std::string{kPublicKeyBase58}});
    ASSERT_TRUE(keypair_res.has_value()) << keypair_res.error();
    keypair.emplace(std::move(keypair_res.value()));
  }

  qtils::SharedRef<BbsProviderMock> provider =
      std::make_shared<BbsProviderMock>();
  std::optional<Bls12381G2KeyPair> keypair;
};

/**
 * @given reference public key
 * @when fingerprint is made
 * @then it matches reference fingerprint byte for byte
 */
TEST_F(FingerprintTest, ReferenceVector) {
  ASSERT_OUTCOME_SUCCESS(
      fp, Bls12381G2KeyPair::fingerprintFromPublicKey(kPublicKeyBase58));
  EXPECT_EQ(fp, kFingerprint);
  EXPECT_EQ(keypair->fingerprint(), kFingerprint);
}

TEST_F(FingerprintTest, EncodeAddsMulticodecTag) {
  ASSERT_OUTCOME_SUCCESS(public_key, decodeBase58(kPublicKeyBase58));
  auto fp = fingerprint::encode(public_key);
  ASSERT_FALSE(fp.empty());
  EXPECT_EQ(fp.front(), fingerprint::kMultibaseBase58Prefix);

  ASSERT_OUTCOME_SUCCESS(decoded, decodeBase58(std::string_view{fp}.substr(1)));
  ASSERT_EQ(decoded.size(), public_key.size() + 2);
  EXPECT_EQ(decoded[0], 0xeb);
  EXPECT_EQ(decoded[1], 0x01);
  EXPECT_TRUE(std::ranges::equal(qtils::BytesIn{decoded}.subspan(2), public_key));
}

/**
 * @given key pair
 * @when own fingerprint is verified
 * @then it is valid and no error is set
 */
TEST_F(FingerprintTest, RoundTrip) {
  auto result = keypair->verifyFingerprint(keypair->fingerprint());
  EXPECT_TRUE(result.valid);
  EXPECT_FALSE(result.error.has_value());

  EXPECT_TRUE(keypair->verifyFingerprint(kFingerprint));
}

TEST_F(FingerprintTest, TamperedPayloadIsInvalid) {
  auto result = keypair->verifyFingerprint(kFingerprintTampered);
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, KeyPairError::FINGERPRINT_KEY_MISMATCH);
}

TEST_F(FingerprintTest, TruncatedKeyIsInvalid) {
  auto result = keypair->verifyFingerprint(kFingerprintTruncated);
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, KeyPairError::FINGERPRINT_KEY_MISMATCH);
}

/**
 * @given fingerprint without multibase prefix
 * @when it is verified
 * @then format error is reported, nothing is thrown
 */
TEST_F(FingerprintTest, MissingPrefixIsInvalid) {
  auto no_prefix = kFingerprint.substr(1);
  auto result = keypair->verifyFingerprint(no_prefix);
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, KeyPairError::FINGERPRINT_NOT_MULTIBASE);

  auto wrong_prefix = "f" + std::string{no_prefix};
  result = keypair->verifyFingerprint(wrong_prefix);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, KeyPairError::FINGERPRINT_NOT_MULTIBASE);
}

TEST_F(FingerprintTest, EmptyIsInvalid) {
  auto result = keypair->verifyFingerprint("");
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, KeyPairError::FINGERPRINT_NOT_MULTIBASE);

  EXPECT_FALSE(keypair->verifyFingerprint("z"));
}

/**
 * @given fingerprint of same key bytes behind other multicodec tag
 * @when it is verified
 * @then it is invalid
 */
TEST_F(FingerprintTest, WrongTagIsInvalid) {
  auto result = keypair->verifyFingerprint(kFingerprintWrongTag);
  EXPECT_FALSE(result.valid);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(*result.error, KeyPairError::FINGERPRINT_WRONG_MULTICODEC);
}

TEST_F(FingerprintTest, NotBase58IsInvalid) {
  // '0', 'O', 'I' and 'l' are out of alphabet
  auto result = keypair->verifyFingerprint("z0OIl");
  EXPECT_FALSE(result.valid);
  EXPECT_TRUE(result.error.has_value());
}

TEST_F(FingerprintTest, OtherKeyIsInvalid) {
  blskey::crypto::bbs::BlsPublicKey other_key{};
  auto result = fingerprint::verify(kFingerprint, other_key);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, KeyPairError::FINGERPRINT_KEY_MISMATCH);
}

TEST(FingerprintFromPublicKeyTest, RejectsNotBase58) {
  EXPECT_FALSE(Bls12381G2KeyPair::fingerprintFromPublicKey("0OIl").has_value());
}
