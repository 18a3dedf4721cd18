/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "commands/key_commands.hpp"
#include "crypto/bbs/bbs_provider_impl.hpp"
#include "log/logger.hpp"

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }
}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("blskey");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    // Abnormal run or run without arguments
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<blskey::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<blskey::log::LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator", "cli");

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto provider =
      std::make_shared<blskey::crypto::bbs::BbsProviderImpl>(logging_system);

  auto exit_code = blskey::commands::runCommand(
      logging_system, provider, *app_configuration);

  auto logger =
      logging_system->getLogger("Main", blskey::log::defaultGroupName);
  SL_DEBUG(logger, "Command '{}' finished", app_configuration->command());
  logger->flush();

  return exit_code;
}
