/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <qtils/byte_vec.hpp>
#include <utils/ctor_limiters.hpp>

namespace blskey::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct KeyConfig {
      std::filesystem::path file;
      std::optional<std::string> id;
      std::optional<std::string> controller;
      std::optional<qtils::ByteVec> seed;
      bool include_private = false;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::string &command() const;
    [[nodiscard]] virtual const std::vector<std::string> &arguments() const;
    [[nodiscard]] virtual const std::optional<std::string> &signature() const;

    [[nodiscard]] virtual const KeyConfig &key() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string command_;
    std::vector<std::string> arguments_;
    std::optional<std::string> signature_;

    KeyConfig key_;
  };

}  // namespace blskey::app
