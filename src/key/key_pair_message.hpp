/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <qtils/visit_in_place.hpp>

#include "crypto/bbs/types.hpp"

namespace blskey::key {

  /// Single statement or ordered list of statements
  using KeyPairMessage = std::variant<std::string, std::vector<std::string>>;

  inline crypto::bbs::BbsMessages toBbsMessages(const KeyPairMessage &message) {
    return qtils::visit_in_place(
        message,
        [](const std::string &single) {
          return crypto::bbs::BbsMessages{single};
        },
        [](const std::vector<std::string> &list) {
          return crypto::bbs::BbsMessages{list};
        });
  }

}  // namespace blskey::key
