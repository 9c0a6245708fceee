// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace torgate
{
namespace crypto
{

/// \brief Cryptographically secure random numbers from OpenSSL RAND_bytes().
///
/// Used for the transaction IDs of every query torgate sends upstream, so an
/// off-path observer cannot forge replies by guessing them.
class SecureRng
{
public:
  /// \brief Fill a buffer with random bytes.
  /// \throws std::runtime_error if RAND_bytes fails
  static void fill(std::uint8_t *dst, std::size_t len)
  {
    if (len == 0)
    {
      return;
    }
    if (RAND_bytes(dst, static_cast<int>(len)) != 1)
    {
      throw std::runtime_error("SecureRng: RAND_bytes failed: " + lastError());
    }
  }

  /// \brief Fill a byte container with random bytes.
  template <typename Container> static void fill(Container &c)
  {
    static_assert(sizeof(typename Container::value_type) == 1, "byte container required");
    fill(reinterpret_cast<std::uint8_t *>(c.data()), c.size());
  }

  /// \brief Non-zero 16-bit DNS transaction identifier.
  static std::uint16_t queryId()
  {
    std::uint8_t bytes[2];
    std::uint16_t id = 0;
    while (id == 0)
    {
      fill(bytes, sizeof(bytes));
      id = static_cast<std::uint16_t>((bytes[0] << 8) | bytes[1]);
    }
    return id;
  }

private:
  static std::string lastError()
  {
    unsigned long code = ERR_peek_last_error(); // NOLINT(google-runtime-int)
    if (code == 0UL)
    {
      return "no OpenSSL error available";
    }
    char buf[256] = {0};
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(buf);
  }
};

} // namespace crypto
} // namespace torgate
