/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace blskey {
  /**
   * @returns String indicating current build version.
   * @note Value is provided by cmake as BLSKEY_BUILD_VERSION
   */
  const std::string &buildVersion();
}  // namespace blskey
