/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef BLSKEY_BUILD_VERSION
#define BLSKEY_BUILD_VERSION "undefined"
#endif

namespace blskey {
  const std::string &buildVersion() {
    static const std::string version(BLSKEY_BUILD_VERSION);
    return version;
  }
}  // namespace blskey
