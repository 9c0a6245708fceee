// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0

/// \file ip_utils.hpp
/// \brief IP address parsing and CIDR block arithmetic
///
/// Provides:
/// - IPv4 parsing, formatting and network membership on 32-bit values
/// - IPv6 parsing and membership through inet_pton/inet_ntop
/// - CidrNetwork, a parsed address block of either family, with the host
///   range helpers used by the synthetic address allocator

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace torgate
{
namespace network
{

/// \brief IPv4 helpers on host-byte-order 32-bit values
class IPv4
{
public:
  /// \brief Parse dotted-quad notation.
  /// \note Leading zeros ("010") are rejected to avoid octal ambiguity.
  static bool parse(const std::string &ip, std::uint32_t &result)
  {
    std::uint32_t value = 0;
    std::size_t pos = 0;
    for (int octetIndex = 0; octetIndex < 4; ++octetIndex)
    {
      if (octetIndex > 0)
      {
        if (pos >= ip.size() || ip[pos] != '.')
        {
          return false;
        }
        ++pos;
      }
      std::size_t start = pos;
      std::uint32_t octet = 0;
      while (pos < ip.size() && std::isdigit(static_cast<unsigned char>(ip[pos])))
      {
        octet = octet * 10 + static_cast<std::uint32_t>(ip[pos] - '0');
        if (octet > 255 || pos - start >= 3)
        {
          return false;
        }
        ++pos;
      }
      if (pos == start || (pos - start > 1 && ip[start] == '0'))
      {
        return false;
      }
      value = (value << 8) | octet;
    }
    if (pos != ip.size())
    {
      return false;
    }
    result = value;
    return true;
  }

  static std::optional<std::uint32_t> parse(const std::string &ip)
  {
    std::uint32_t value = 0;
    if (!parse(ip, value))
    {
      return std::nullopt;
    }
    return value;
  }

  static std::string toString(std::uint32_t ip)
  {
    return std::to_string((ip >> 24) & 0xFF) + "." + std::to_string((ip >> 16) & 0xFF) + "." +
           std::to_string((ip >> 8) & 0xFF) + "." + std::to_string(ip & 0xFF);
  }

  static std::uint32_t prefixToNetmask(std::uint32_t prefixLength)
  {
    if (prefixLength == 0)
    {
      return 0;
    }
    if (prefixLength >= 32)
    {
      return 0xFFFFFFFFu;
    }
    return ~((1u << (32 - prefixLength)) - 1);
  }

  static bool inNetwork(std::uint32_t ip, std::uint32_t network, std::uint32_t prefixLength)
  {
    std::uint32_t mask = prefixToNetmask(prefixLength);
    return (ip & mask) == (network & mask);
  }

  static bool isValid(const std::string &ip) { return parse(ip).has_value(); }
};

/// \brief IPv6 helpers on 16-byte network-order arrays
class IPv6
{
public:
  using Address = std::array<std::uint8_t, 16>;

  static bool parse(const std::string &ip, Address &result)
  {
    in6_addr addr{};
    if (::inet_pton(AF_INET6, ip.c_str(), &addr) != 1)
    {
      return false;
    }
    std::memcpy(result.data(), &addr, result.size());
    return true;
  }

  static std::string toString(const Address &addr)
  {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET6, addr.data(), buf, sizeof(buf)) == nullptr)
    {
      return {};
    }
    return buf;
  }

  static bool inNetwork(const Address &ip, const Address &network, std::uint32_t prefixLength)
  {
    std::uint32_t fullBytes = prefixLength / 8;
    std::uint32_t remainingBits = prefixLength % 8;
    if (fullBytes > 16)
    {
      return false;
    }
    if (std::memcmp(ip.data(), network.data(), fullBytes) != 0)
    {
      return false;
    }
    if (remainingBits == 0 || fullBytes == 16)
    {
      return true;
    }
    std::uint8_t mask = static_cast<std::uint8_t>(0xFF << (8 - remainingBits));
    return (ip[fullBytes] & mask) == (network[fullBytes] & mask);
  }

  static bool isValid(const std::string &ip)
  {
    Address addr{};
    return parse(ip, addr);
  }

  /// \brief True for addresses in ::ffff:0:0/96
  static bool isV4Mapped(const Address &addr)
  {
    static const std::uint8_t prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
    return std::memcmp(addr.data(), prefix, sizeof(prefix)) == 0;
  }

  /// \brief Low 32 bits of a mapped address in host byte order
  static std::uint32_t mappedV4(const Address &addr)
  {
    return (static_cast<std::uint32_t>(addr[12]) << 24) |
           (static_cast<std::uint32_t>(addr[13]) << 16) |
           (static_cast<std::uint32_t>(addr[14]) << 8) | static_cast<std::uint32_t>(addr[15]);
  }
};

enum class AddressFamily
{
  IPv4,
  IPv6
};

inline bool isIPv6Address(const std::string &ip) { return ip.find(':') != std::string::npos; }

inline bool isValidIpAddress(const std::string &ip)
{
  return isIPv6Address(ip) ? IPv6::isValid(ip) : IPv4::isValid(ip);
}

/// \brief Parsed address block of either family, e.g. "198.18.0.0/15" or
/// "fd00::/8". A bare address is taken as a single-host block.
struct CidrNetwork
{
  std::string address;                       ///< Address part as written
  std::uint32_t prefixLength{32};            ///< 0-32 (IPv4) or 0-128 (IPv6)
  std::uint32_t addressNum{0};               ///< IPv4 address, host byte order
  IPv6::Address addressV6{};                 ///< IPv6 address, network byte order
  AddressFamily family{AddressFamily::IPv4}; ///< Address family
  bool valid{false};                         ///< Set once parse() succeeds

  CidrNetwork() = default;

  bool isValid() const { return valid; }
  bool isIPv6() const { return family == AddressFamily::IPv6; }

  bool parse(const std::string &cidr)
  {
    valid = false;
    auto slashPos = cidr.find('/');
    std::string addrPart = cidr.substr(0, slashPos);
    bool v6 = isIPv6Address(addrPart);
    std::uint32_t maxPrefix = v6 ? 128 : 32;
    std::uint32_t prefix = maxPrefix;

    if (slashPos != std::string::npos)
    {
      std::string prefixPart = cidr.substr(slashPos + 1);
      if (prefixPart.empty() || prefixPart.size() > 3)
      {
        return false;
      }
      prefix = 0;
      for (char c : prefixPart)
      {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
          return false;
        }
        prefix = prefix * 10 + static_cast<std::uint32_t>(c - '0');
      }
      if (prefix > maxPrefix)
      {
        return false;
      }
    }

    if (v6)
    {
      if (!IPv6::parse(addrPart, addressV6))
      {
        return false;
      }
      family = AddressFamily::IPv6;
    }
    else
    {
      if (!IPv4::parse(addrPart, addressNum))
      {
        return false;
      }
      family = AddressFamily::IPv4;
    }
    address = addrPart;
    prefixLength = prefix;
    valid = true;
    return true;
  }

  static std::optional<CidrNetwork> fromString(const std::string &cidr)
  {
    CidrNetwork net;
    if (!net.parse(cidr))
    {
      return std::nullopt;
    }
    return net;
  }

  std::string toString() const
  {
    return address + "/" + std::to_string(prefixLength);
  }

  bool contains(const std::string &ip) const
  {
    if (!valid)
    {
      return false;
    }
    if (isIPv6Address(ip))
    {
      IPv6::Address v6{};
      return IPv6::parse(ip, v6) && contains(v6);
    }
    std::uint32_t v4 = 0;
    return IPv4::parse(ip, v4) && contains(v4);
  }

  bool contains(std::uint32_t ip) const
  {
    return valid && family == AddressFamily::IPv4 &&
           IPv4::inNetwork(ip, addressNum, prefixLength);
  }

  /// \brief IPv4-mapped addresses (::ffff:a.b.c.d) are tested against IPv4
  /// blocks by their embedded address
  bool contains(const IPv6::Address &ip) const
  {
    if (!valid)
    {
      return false;
    }
    if (family == AddressFamily::IPv4)
    {
      return IPv6::isV4Mapped(ip) && contains(IPv6::mappedV4(ip));
    }
    return IPv6::inNetwork(ip, addressV6, prefixLength);
  }

  /// \brief First address of an IPv4 block (host bits cleared)
  std::uint32_t networkAddress() const
  {
    return addressNum & IPv4::prefixToNetmask(prefixLength);
  }

  /// \brief Last address of an IPv4 block (host bits set)
  std::uint32_t lastAddress() const
  {
    return networkAddress() | ~IPv4::prefixToNetmask(prefixLength);
  }
};

} // namespace network
} // namespace torgate
