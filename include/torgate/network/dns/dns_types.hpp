// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace torgate
{
namespace network
{
namespace dns
{

/// \brief DNS message opcodes (RFC 1035)
enum class DnsOpcode : std::uint8_t
{
  Query = 0,  ///< Standard query
  IQuery = 1, ///< Inverse query (obsolete)
  Status = 2, ///< Server status request
  Notify = 4, ///< Zone change notification (RFC 1996)
  Update = 5  ///< Dynamic update (RFC 2136)
};

/// \brief DNS response codes (RFC 1035, RFC 2136)
enum class DnsResponseCode : std::uint8_t
{
  NOERROR = 0,  ///< No error
  FORMERR = 1,  ///< Format error
  SERVFAIL = 2, ///< Server failure
  NXDOMAIN = 3, ///< Name does not exist
  NOTIMP = 4,   ///< Not implemented
  REFUSED = 5   ///< Query refused
};

/// \brief Record types the gateway inspects or answers
enum class DnsType : std::uint16_t
{
  A = 1,      ///< IPv4 address
  NS = 2,     ///< Name server
  CNAME = 5,  ///< Canonical name
  SOA = 6,    ///< Start of authority
  PTR = 12,   ///< Pointer record (reverse lookup)
  MX = 15,    ///< Mail exchange
  TXT = 16,   ///< Text record
  AAAA = 28,  ///< IPv6 address
  SRV = 33,   ///< Service location
  OPT = 41,   ///< EDNS(0) pseudo record
  HTTPS = 65, ///< HTTPS binding
  ANY = 255   ///< All records
};

/// \brief DNS record class (RFC 1035)
enum class DnsClass : std::uint16_t
{
  IN = 1,   ///< Internet class
  CH = 3,   ///< CHAOS class
  ANY = 255 ///< Any class
};

/// \brief DNS message header
struct DnsHeader
{
  std::uint16_t id = 0;                               ///< Transaction identifier
  bool qr = false;                                    ///< Response flag
  DnsOpcode opcode = DnsOpcode::Query;                ///< Operation code
  bool aa = false;                                    ///< Authoritative answer
  bool tc = false;                                    ///< Truncated
  bool rd = true;                                     ///< Recursion desired
  bool ra = false;                                    ///< Recursion available
  std::uint8_t z = 0;                                 ///< Reserved bits
  DnsResponseCode rcode = DnsResponseCode::NOERROR;   ///< Response code
  std::uint16_t qdcount = 0;                          ///< Question count
  std::uint16_t ancount = 0;                          ///< Answer count
  std::uint16_t nscount = 0;                          ///< Authority count
  std::uint16_t arcount = 0;                          ///< Additional count
};

/// \brief DNS question section entry
struct DnsQuestion
{
  std::string qname; ///< Domain name, dot separated, no trailing dot
  DnsType qtype;     ///< Query type
  DnsClass qclass;   ///< Query class

  DnsQuestion(const std::string &name = "", DnsType type = DnsType::A,
              DnsClass cls = DnsClass::IN)
      : qname(name), qtype(type), qclass(cls)
  {
  }
};

/// \brief Resource record with raw RDATA
struct DnsResourceRecord
{
  std::string name;                ///< Owner name
  DnsType type;                    ///< Record type
  DnsClass cls;                    ///< Record class
  std::uint32_t ttl;               ///< Time to live (seconds)
  std::vector<std::uint8_t> rdata; ///< Resource data as on the wire

  DnsResourceRecord(const std::string &n = "", DnsType t = DnsType::A, DnsClass c = DnsClass::IN,
                    std::uint32_t ttlValue = 0)
      : name(n), type(t), cls(c), ttl(ttlValue)
  {
  }
};

/// \brief A complete DNS message
struct DnsPacket
{
  DnsHeader header;
  std::vector<DnsQuestion> questions;
  std::vector<DnsResourceRecord> answers;
  std::vector<DnsResourceRecord> authority;
  std::vector<DnsResourceRecord> additional;
};

inline std::string responseCodeToString(DnsResponseCode rcode)
{
  switch (rcode)
  {
  case DnsResponseCode::NOERROR:
    return "NOERROR";
  case DnsResponseCode::FORMERR:
    return "FORMERR";
  case DnsResponseCode::SERVFAIL:
    return "SERVFAIL";
  case DnsResponseCode::NXDOMAIN:
    return "NXDOMAIN";
  case DnsResponseCode::NOTIMP:
    return "NOTIMP";
  case DnsResponseCode::REFUSED:
    return "REFUSED";
  }
  return "RCODE" + std::to_string(static_cast<unsigned>(rcode));
}

inline std::string typeToString(DnsType type)
{
  switch (type)
  {
  case DnsType::A:
    return "A";
  case DnsType::NS:
    return "NS";
  case DnsType::CNAME:
    return "CNAME";
  case DnsType::SOA:
    return "SOA";
  case DnsType::PTR:
    return "PTR";
  case DnsType::MX:
    return "MX";
  case DnsType::TXT:
    return "TXT";
  case DnsType::AAAA:
    return "AAAA";
  case DnsType::SRV:
    return "SRV";
  case DnsType::OPT:
    return "OPT";
  case DnsType::HTTPS:
    return "HTTPS";
  case DnsType::ANY:
    return "ANY";
  }
  return "TYPE" + std::to_string(static_cast<unsigned>(type));
}

/// \brief DNS protocol constants
namespace constants
{
  constexpr std::uint16_t DNS_PORT = 53;
  constexpr std::size_t DNS_HEADER_SIZE = 12;
  constexpr std::size_t DNS_MAX_UDP_SIZE = 512;
  constexpr std::size_t DNS_RECEIVE_BUFFER_SIZE = 65535;
  constexpr std::size_t DNS_MAX_LABEL_SIZE = 63;
  constexpr std::size_t DNS_MAX_NAME_SIZE = 255;
  constexpr std::uint8_t DNS_COMPRESSION_MASK = 0xC0;
  constexpr std::uint16_t DNS_COMPRESSION_POINTER_MASK = 0x3FFF;
} // namespace constants

} // namespace dns
} // namespace network
} // namespace torgate
