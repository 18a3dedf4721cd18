/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <libp2p/multi/multibase_codec/codecs/base58.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/bytes.hpp>
#include <qtils/outcome.hpp>

namespace blskey::codec {

  /// Bitcoin alphabet, no multibase prefix
  inline std::string encodeBase58(qtils::BytesIn bytes) {
    return libp2p::multi::detail::encodeBase58(qtils::ByteVec{bytes});
  }

  /// Decoder error is returned as is
  inline outcome::result<qtils::ByteVec> decodeBase58(std::string_view text) {
    BOOST_OUTCOME_TRY(auto bytes, libp2p::multi::detail::decodeBase58(text));
    return qtils::ByteVec{std::move(bytes)};
  }

}  // namespace blskey::codec
