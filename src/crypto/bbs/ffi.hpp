/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <bbs.h>
#include <qtils/bytes.hpp>

namespace blskey::crypto::bbs::ffi {

  inline ByteArray asByteArray(qtils::BytesIn bytes) {
    return ByteArray{.length = bytes.size(), .data = bytes.data()};
  }

  inline ByteArray asByteArray(std::string_view str) {
    return asByteArray(qtils::BytesIn{
        reinterpret_cast<const uint8_t *>(str.data()), str.size()});
  }

  /// Error out-parameter of library calls, owns the message string
  class Error {
   public:
    Error() = default;
    Error(const Error &) = delete;
    Error &operator=(const Error &) = delete;
    ~Error() {
      if (error_.message != nullptr) {
        bbs_string_free(error_.message);
      }
    }

    ExternError *out() {
      return &error_;
    }

    bool failed() const {
      return error_.code != 0;
    }

    std::string_view message() const {
      return error_.message != nullptr ? std::string_view{error_.message}
                                       : std::string_view{"no message"};
    }

   private:
    ExternError error_{.code = 0, .message = nullptr};
  };

  /// Buffer allocated by library, released with `bbs_byte_buffer_free`
  class Buffer {
   public:
    Buffer() = default;
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;
    ~Buffer() {
      if (buffer_.data != nullptr) {
        bbs_byte_buffer_free(buffer_);
      }
    }

    ByteBuffer *out() {
      return &buffer_;
    }

    qtils::BytesIn view() const {
      if (buffer_.data == nullptr or buffer_.len <= 0) {
        return {};
      }
      return {buffer_.data, static_cast<size_t>(buffer_.len)};
    }

   private:
    ByteBuffer buffer_{.len = 0, .data = nullptr};
  };

  using ContextFree = void (*)(uint64_t, ExternError *);

  /**
   * Sign or verify context handle of the library. Successful finish consumes
   * handle inside the library and must be marked with `finished()`, any
   * other exit releases it with `Free`.
   */
  template <ContextFree Free>
  class Context {
   public:
    explicit Context(uint64_t handle) : handle_{handle} {}
    Context(const Context &) = delete;
    Context &operator=(const Context &) = delete;
    ~Context() {
      if (handle_.has_value()) {
        Error error;
        Free(*handle_, error.out());
      }
    }

    uint64_t handle() const {
      return handle_.value();
    }

    void finished() {
      handle_.reset();
    }

   private:
    std::optional<uint64_t> handle_;
  };

  using SignContext = Context<bbs_sign_context_free>;
  using VerifyContext = Context<bbs_verify_context_free>;

}  // namespace blskey::crypto::bbs::ffi
