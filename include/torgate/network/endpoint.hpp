// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

#include "torgate/network/ip_utils.hpp"

namespace torgate
{
namespace network
{

/// \brief Numeric UDP endpoint, written "1.2.3.4:53" or "[::1]:53"
struct Endpoint
{
  std::string host;
  std::uint16_t port = 0;

  Endpoint() = default;
  Endpoint(std::string h, std::uint16_t p) : host(std::move(h)), port(p) {}

  /// \brief Parse "host:port". Port 0 is accepted (ephemeral bind).
  static std::optional<Endpoint> parse(const std::string &text)
  {
    std::string hostPart;
    std::string portPart;
    if (!text.empty() && text.front() == '[')
    {
      auto close = text.find(']');
      if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':')
      {
        return std::nullopt;
      }
      hostPart = text.substr(1, close - 1);
      portPart = text.substr(close + 2);
      if (!IPv6::isValid(hostPart))
      {
        return std::nullopt;
      }
    }
    else
    {
      auto colon = text.rfind(':');
      if (colon == std::string::npos)
      {
        return std::nullopt;
      }
      hostPart = text.substr(0, colon);
      portPart = text.substr(colon + 1);
      if (!IPv4::isValid(hostPart))
      {
        return std::nullopt;
      }
    }

    if (portPart.empty() || portPart.size() > 5)
    {
      return std::nullopt;
    }
    std::uint32_t port = 0;
    for (char c : portPart)
    {
      if (c < '0' || c > '9')
      {
        return std::nullopt;
      }
      port = port * 10 + static_cast<std::uint32_t>(c - '0');
    }
    if (port > 65535)
    {
      return std::nullopt;
    }
    return Endpoint(hostPart, static_cast<std::uint16_t>(port));
  }

  bool isIPv6() const { return isIPv6Address(host); }

  std::string toString() const
  {
    if (isIPv6())
    {
      return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
  }

  /// \brief Fill a sockaddr for this endpoint
  /// \return false when host is not a numeric address
  bool toSockaddr(sockaddr_storage &ss, socklen_t &len) const
  {
    std::memset(&ss, 0, sizeof(ss));
    in6_addr t6{};
    if (::inet_pton(AF_INET6, host.c_str(), &t6) == 1)
    {
      sockaddr_in6 sa6{};
      sa6.sin6_family = AF_INET6;
      sa6.sin6_port = htons(port);
      sa6.sin6_addr = t6;
      std::memcpy(&ss, &sa6, sizeof(sa6));
      len = sizeof(sa6);
      return true;
    }
    in_addr t4{};
    if (::inet_pton(AF_INET, host.c_str(), &t4) != 1)
    {
      return false;
    }
    sockaddr_in sa4{};
    sa4.sin_family = AF_INET;
    sa4.sin_port = htons(port);
    sa4.sin_addr = t4;
    std::memcpy(&ss, &sa4, sizeof(sa4));
    len = sizeof(sa4);
    return true;
  }

  bool operator==(const Endpoint &other) const
  {
    return host == other.host && port == other.port;
  }
};

} // namespace network
} // namespace torgate
