/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <print>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <qtils/unhex.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blskey::app, Configurator::Error, e) {
  using E = blskey::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  BOOST_UNREACHABLE_RETURN("Unknown Configurator::Error");
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  struct CommandArity {
    std::string_view name;
    size_t min_args;
    size_t max_args;
    bool needs_key_file;
  };

  // clang-format off
  constexpr std::array kCommands{
      CommandArity{"generate",           0, 0,          false},
      CommandArity{"fingerprint",        1, 1,          false},
      CommandArity{"verify-fingerprint", 1, 1,          true},
      CommandArity{"sign",               1, SIZE_MAX,   true},
      CommandArity{"verify",             1, SIZE_MAX,   true},
  };
  // clang-format on

  void printCommands() {
    // clang-format off
    std::println(std::cout, "Commands:");
    std::println(std::cout, "  generate [--seed <hex>] [--id <id>] [--controller <did>] [--include-private]");
    std::println(std::cout, "  fingerprint <publicKeyBase58>");
    std::println(std::cout, "  verify-fingerprint <fingerprint> --key-file <path>");
    std::println(std::cout, "  sign <message>... --key-file <path>");
    std::println(std::cout, "  verify <message>... --key-file <path> --signature <base64>");
    // clang-format on
  }
}  // namespace

namespace blskey::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lcrypto=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description key_options("Key options");
    key_options.add_options()
        ("key-file", po::value<std::string>(), "Path to key document (JSON) to sign, verify or check fingerprint with.")
        ("id", po::value<std::string>(), "Key identifier for generated key document.")
        ("controller", po::value<std::string>(), "Controller of generated key document.")
        ("seed", po::value<std::string>(), "Hex seed (with or without 0x prefix) for deterministic key generation.")
        ("include-private", "Include private key into generated key document.")
        ("signature", po::value<std::string>(), "Base64 signature for `verify` command.")
        ;

    po::options_description hidden_options;
    hidden_options.add_options()
        ("command", po::value<std::string>())
        ("args", po::value<std::vector<std::string>>())
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(key_options);
    cli_hidden_options_.add(hidden_options);

    cli_positional_.add("command", 1).add("args", -1);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "blskey version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      printCommands();
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "blskey version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    po::options_description all_options;
    all_options.add(cli_options_).add(cli_hidden_options_);

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(all_options)
                                      .positional(cli_positional_)
                                      .run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          for (auto &value : values) {
            logger_cli_args_.emplace_back(value);
          }
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stderr
    thread: none
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: blskey
        children:
          - name: crypto
          - name: cli
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initKeyConfig());

    return config_;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    find_argument<std::string>(
        cli_values_map_, "command", [&](const std::string &value) {
          config_->command_ = value;
        });
    find_argument<std::vector<std::string>>(
        cli_values_map_, "args", [&](const std::vector<std::string> &values) {
          config_->arguments_ = values;
        });

    // Check values
    if (config_->command_.empty()) {
      SL_ERROR(logger_, "No command specified; run with '--help' for usage");
      return Error::InvalidValue;
    }

    auto it = std::ranges::find(
        kCommands, std::string_view{config_->command_}, &CommandArity::name);
    if (it == kCommands.end()) {
      SL_ERROR(logger_, "Unknown command: {}", config_->command_);
      return Error::InvalidValue;
    }

    auto count = config_->arguments_.size();
    if (count < it->min_args or count > it->max_args) {
      SL_ERROR(logger_,
               "Command '{}' got {} argument(s); run with '--help' for usage",
               config_->command_,
               count);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initKeyConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["key"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto file = section["file"];
          if (file.IsDefined()) {
            if (file.IsScalar()) {
              config_->key_.file = file.as<std::string>();
            } else {
              file_errors_ << "E: Value 'key.file' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto id = section["id"];
          if (id.IsDefined()) {
            if (id.IsScalar()) {
              config_->key_.id = id.as<std::string>();
            } else {
              file_errors_ << "E: Value 'key.id' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto controller = section["controller"];
          if (controller.IsDefined()) {
            if (controller.IsScalar()) {
              config_->key_.controller = controller.as<std::string>();
            } else {
              file_errors_ << "E: Value 'key.controller' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'key' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    if (file_has_error_) {
      std::string path;
      find_argument<std::string>(
          cli_values_map_, "config", [&](const std::string &value) {
            path = value;
          });
      SL_ERROR(logger_, "Config file `{}` has some problems:", path);
      std::istringstream iss(file_errors_.str());
      std::string line;
      while (std::getline(iss, line)) {
        SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
      }
      return Error::ConfigFileParseFailed;
    }

    // Adjust by CLI arguments
    bool fail = false;

    find_argument<std::string>(
        cli_values_map_, "key-file", [&](const std::string &value) {
          config_->key_.file = value;
        });
    find_argument<std::string>(
        cli_values_map_, "id", [&](const std::string &value) {
          config_->key_.id = value;
        });
    find_argument<std::string>(
        cli_values_map_, "controller", [&](const std::string &value) {
          config_->key_.controller = value;
        });
    find_argument<std::string>(
        cli_values_map_, "seed", [&](const std::string &value) {
          auto trimmed = value;
          boost::trim(trimmed);
          qtils::ByteVec seed;
          if (not qtils::unhex0x(seed, trimmed, true).has_value()
              or seed.empty()) {
            std::cerr << "Option --seed has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
            return;
          }
          config_->key_.seed = std::move(seed);
        });
    find_argument<std::string>(
        cli_values_map_, "signature", [&](const std::string &value) {
          config_->signature_ = value;
        });
    if (find_argument(cli_values_map_, "include-private")) {
      config_->key_.include_private = true;
    }
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    auto it = std::ranges::find(
        kCommands, std::string_view{config_->command_}, &CommandArity::name);
    if (it != kCommands.end() and it->needs_key_file) {
      if (config_->key_.file.empty()) {
        SL_ERROR(logger_,
                 "Command '{}' requires a key document; use --key-file",
                 config_->command_);
        return Error::InvalidValue;
      }
      config_->key_.file = weakly_canonical(config_->key_.file);
      if (not is_regular_file(config_->key_.file)) {
        SL_ERROR(logger_,
                 "The 'key-file' does not exist or is not a file: {}",
                 config_->key_.file.c_str());
        return Error::InvalidValue;
      }
    }

    if (config_->command_ == "verify" and not config_->signature_.has_value()) {
      SL_ERROR(logger_, "Command 'verify' requires --signature");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

}  // namespace blskey::app
