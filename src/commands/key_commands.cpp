/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "commands/key_commands.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "app/configuration.hpp"
#include "key/bls12381_g2_key_pair.hpp"
#include "key/key_document.hpp"

namespace blskey::commands {

  namespace {
    key::KeyPairMessage makeMessage(const std::vector<std::string> &args) {
      if (args.size() == 1) {
        return args.front();
      }
      return args;
    }
  }  // namespace

  int runCommand(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                 const app::Configuration &config) {
    auto logger = logsys->getLogger("Commands", "cli");
    const auto &name = config.command();

    if (name == "generate") {
      return cmdGenerate(logger, std::move(provider), config);
    }
    if (name == "fingerprint") {
      return cmdFingerprint(logger, config);
    }
    if (name == "verify-fingerprint") {
      return cmdVerifyFingerprint(logger, std::move(provider), config);
    }
    if (name == "sign") {
      return cmdSign(logger, std::move(provider), config);
    }
    if (name == "verify") {
      return cmdVerify(logger, std::move(provider), config);
    }

    SL_ERROR(logger, "Unknown command: {}", name);
    return EXIT_FAILURE;
  }

  int cmdGenerate(const log::Logger &logger,
                  qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                  const app::Configuration &config) {
    const auto &key_cfg = config.key();
    auto keypair_res = key::Bls12381G2KeyPair::generate(
        std::move(provider),
        {
            .id = key_cfg.id,
            .controller = key_cfg.controller,
            .seed = key_cfg.seed,
        });
    if (not keypair_res) {
      SL_ERROR(logger, "Can't generate key pair: {}", keypair_res.error());
      return EXIT_FAILURE;
    }
    auto &keypair = keypair_res.value();

    SL_DEBUG(logger,
             "Key pair generated{}",
             key_cfg.seed.has_value() ? " from seed" : "");

    fmt::println(
        "{}",
        key::toJson(key::toDocument(keypair, key_cfg.include_private)));
    fmt::println("{}", keypair.fingerprint());
    return EXIT_SUCCESS;
  }

  int cmdFingerprint(const log::Logger &logger,
                     const app::Configuration &config) {
    const auto &public_key = config.arguments().front();
    auto fingerprint_res =
        key::Bls12381G2KeyPair::fingerprintFromPublicKey(public_key);
    if (not fingerprint_res) {
      SL_ERROR(logger,
               "Can't make fingerprint of public key: {}",
               fingerprint_res.error());
      return EXIT_FAILURE;
    }
    fmt::println("{}", fingerprint_res.value());
    return EXIT_SUCCESS;
  }

  int cmdVerifyFingerprint(const log::Logger &logger,
                           qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                           const app::Configuration &config) {
    auto keypair_res =
        key::loadKeyPairFromFile(std::move(provider), config.key().file);
    if (not keypair_res) {
      SL_ERROR(logger,
               "Can't load key pair from {}: {}",
               config.key().file.string(),
               keypair_res.error());
      return EXIT_FAILURE;
    }

    auto verification =
        keypair_res.value().verifyFingerprint(config.arguments().front());
    if (not verification) {
      SL_WARN(logger, "Fingerprint is invalid: {}", verification.error.value());
      fmt::println("invalid: {}", verification.error->message());
      return EXIT_FAILURE;
    }
    fmt::println("valid");
    return EXIT_SUCCESS;
  }

  int cmdSign(const log::Logger &logger,
              qtils::SharedRef<crypto::bbs::BbsProvider> provider,
              const app::Configuration &config) {
    auto keypair_res =
        key::loadKeyPairFromFile(std::move(provider), config.key().file);
    if (not keypair_res) {
      SL_ERROR(logger,
               "Can't load key pair from {}: {}",
               config.key().file.string(),
               keypair_res.error());
      return EXIT_FAILURE;
    }

    auto message = makeMessage(config.arguments());
    auto signature_res = keypair_res.value().signer()->sign(message);
    if (not signature_res) {
      SL_ERROR(logger, "Can't sign: {}", signature_res.error());
      return EXIT_FAILURE;
    }
    SL_DEBUG(logger, "Signed {} message(s)", config.arguments().size());

    fmt::println("{}", signature_res.value());
    return EXIT_SUCCESS;
  }

  int cmdVerify(const log::Logger &logger,
                qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                const app::Configuration &config) {
    auto keypair_res =
        key::loadKeyPairFromFile(std::move(provider), config.key().file);
    if (not keypair_res) {
      SL_ERROR(logger,
               "Can't load key pair from {}: {}",
               config.key().file.string(),
               keypair_res.error());
      return EXIT_FAILURE;
    }

    auto message = makeMessage(config.arguments());
    auto verified_res = keypair_res.value().verifier()->verify(
        message, config.signature().value());
    if (not verified_res) {
      SL_ERROR(logger, "Can't verify: {}", verified_res.error());
      fmt::println("invalid: {}", verified_res.error().message());
      return EXIT_FAILURE;
    }
    if (not verified_res.value()) {
      fmt::println("invalid");
      return EXIT_FAILURE;
    }
    fmt::println("valid");
    return EXIT_SUCCESS;
  }

}  // namespace blskey::commands
