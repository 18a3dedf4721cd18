/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "crypto/bbs/bbs_provider.hpp"
#include "log/logger.hpp"

namespace blskey::app {
  class Configuration;
}  // namespace blskey::app

namespace blskey::commands {

  /**
   * Run command chosen by configuration.
   * Output goes to stdout, diagnostics go to log.
   * @return EXIT_SUCCESS if command succeeded (signature or fingerprint is
   * valid for verifying commands), EXIT_FAILURE otherwise
   */
  int runCommand(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                 const app::Configuration &config);

  int cmdGenerate(const log::Logger &logger,
                  qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                  const app::Configuration &config);

  int cmdFingerprint(const log::Logger &logger,
                     const app::Configuration &config);

  int cmdVerifyFingerprint(const log::Logger &logger,
                           qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                           const app::Configuration &config);

  int cmdSign(const log::Logger &logger,
              qtils::SharedRef<crypto::bbs::BbsProvider> provider,
              const app::Configuration &config);

  int cmdVerify(const log::Logger &logger,
                qtils::SharedRef<crypto::bbs::BbsProvider> provider,
                const app::Configuration &config);

}  // namespace blskey::commands
