/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bbs/bbs_provider_impl.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "crypto/bbs/bbs_error.hpp"
#include "key/bls12381_g2_key_pair.hpp"
#include "key/key_pair_error.hpp"
#include "tests/testutil/prepare_loggers.hpp"

using blskey::crypto::bbs::BbsError;
using blskey::crypto::bbs::BbsMessages;
using blskey::crypto::bbs::BbsProviderImpl;
using blskey::crypto::bbs::BlsKeypair;
using blskey::key::Bls12381G2KeyPair;
using blskey::key::KeyPairError;

class BbsProviderTest : public ::testing::Test {
 protected:
  static void SetUpTestSuite() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto keypair_res = provider->generateKeypair(seed);
    ASSERT_TRUE(keypair_res.has_value()) << keypair_res.error();
    keypair = keypair_res.value();
  }

  qtils::SharedRef<BbsProviderImpl> provider =
      std::make_shared<BbsProviderImpl>(testutil::prepareLoggers());
  qtils::ByteVec seed{qtils::ByteVec(32, 0x42)};
  BlsKeypair keypair{};
};

TEST_F(BbsProviderTest, SignAndVerify) {
  BbsMessages messages{"hello"};
  ASSERT_OUTCOME_SUCCESS(signature, provider->sign(messages, keypair));
  EXPECT_FALSE(signature.empty());

  ASSERT_OUTCOME_SUCCESS(valid,
                         provider->verify(messages, keypair.public_key, signature));
  EXPECT_TRUE(valid);
}

TEST_F(BbsProviderTest, VerifyFailsWithWrongMessage) {
  ASSERT_OUTCOME_SUCCESS(signature, provider->sign({"hello"}, keypair));

  auto res = provider->verify({"world"}, keypair.public_key, signature);
  EXPECT_FALSE(res.has_value() and res.value());
}

TEST_F(BbsProviderTest, VerifyFailsWithOtherKey) {
  ASSERT_OUTCOME_SUCCESS(other, provider->generateKeypair(std::nullopt));
  ASSERT_OUTCOME_SUCCESS(signature, provider->sign({"hello"}, keypair));

  auto res = provider->verify({"hello"}, other.public_key, signature);
  EXPECT_FALSE(res.has_value() and res.value());
}

/**
 * @given signature over ["a", "b"]
 * @when it is verified against same list, reordered list and shorter list
 * @then only same list in same order is valid
 */
TEST_F(BbsProviderTest, MultiMessageOrderAndCount) {
  ASSERT_OUTCOME_SUCCESS(signature, provider->sign({"a", "b"}, keypair));

  ASSERT_OUTCOME_SUCCESS(
      same, provider->verify({"a", "b"}, keypair.public_key, signature));
  EXPECT_TRUE(same);

  auto reordered = provider->verify({"b", "a"}, keypair.public_key, signature);
  EXPECT_FALSE(reordered.has_value() and reordered.value());

  auto shorter = provider->verify({"a"}, keypair.public_key, signature);
  EXPECT_FALSE(shorter.has_value() and shorter.value());
}

/**
 * @given same seed twice and no seed twice
 * @when keypairs are generated
 * @then seeded keypairs are equal, random ones differ
 */
TEST_F(BbsProviderTest, GenerationDeterminism) {
  ASSERT_OUTCOME_SUCCESS(again, provider->generateKeypair(seed));
  EXPECT_EQ(again.public_key, keypair.public_key);
  EXPECT_EQ(again.secret_key, keypair.secret_key);

  ASSERT_OUTCOME_SUCCESS(random1, provider->generateKeypair(std::nullopt));
  ASSERT_OUTCOME_SUCCESS(random2, provider->generateKeypair(std::nullopt));
  EXPECT_NE(random1.public_key, random2.public_key);
  EXPECT_NE(random1.secret_key, random2.secret_key);
  EXPECT_NE(random1.public_key, keypair.public_key);
}

TEST_F(BbsProviderTest, MalformedSignatureIsError) {
  qtils::ByteVec garbage(3, 0x01);
  ASSERT_OUTCOME_ERROR(provider->verify({"hello"}, keypair.public_key, garbage),
                       BbsError::MALFORMED_SIGNATURE);
}

/**
 * @given many verifications aborted on malformed signature
 * @when valid signature is verified afterwards
 * @then library still verifies it
 */
TEST_F(BbsProviderTest, AbortedVerificationsDontAffectNextOnes) {
  qtils::ByteVec garbage(3, 0x01);
  for (auto i = 0; i < 100; ++i) {
    ASSERT_OUTCOME_ERROR(
        provider->verify({"hello"}, keypair.public_key, garbage),
        BbsError::MALFORMED_SIGNATURE);
  }

  ASSERT_OUTCOME_SUCCESS(signature, provider->sign({"hello"}, keypair));
  ASSERT_OUTCOME_SUCCESS(
      valid, provider->verify({"hello"}, keypair.public_key, signature));
  EXPECT_TRUE(valid);
}

/**
 * @given key pair over real provider
 * @when message list is signed and verified through capabilities
 * @then signature is valid for same list, malformed one is an error
 */
TEST_F(BbsProviderTest, KeyPairCapabilities) {
  ASSERT_OUTCOME_SUCCESS(
      key, Bls12381G2KeyPair::generate(provider, {.seed = seed}));
  EXPECT_EQ(key.publicKeyBytes(), keypair.public_key);

  std::vector<std::string> statements{"name: Alice", "age: 42"};
  ASSERT_OUTCOME_SUCCESS(signature, key.signer()->sign(statements));

  ASSERT_OUTCOME_SUCCESS(valid, key.verifier()->verify(statements, signature));
  EXPECT_TRUE(valid);

  ASSERT_OUTCOME_ERROR(key.verifier()->verify(statements, "AQID"),
                       KeyPairError::VERIFICATION_ERROR);
}
