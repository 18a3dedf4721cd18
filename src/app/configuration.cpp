/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace blskey::app {

  Configuration::Configuration()
      : version_("undefined"),
        key_{
            .file{},
            .id{},
            .controller{},
            .seed{},
            .include_private = false,
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::string &Configuration::command() const {
    return command_;
  }

  const std::vector<std::string> &Configuration::arguments() const {
    return arguments_;
  }

  const std::optional<std::string> &Configuration::signature() const {
    return signature_;
  }

  const Configuration::KeyConfig &Configuration::key() const {
    return key_;
  }

}  // namespace blskey::app
