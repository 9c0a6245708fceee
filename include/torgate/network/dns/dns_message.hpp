// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_types.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace torgate
{
namespace network
{
namespace dns
{

/// \brief DNS parsing exceptions
class DnsParseException : public std::runtime_error
{
public:
  explicit DnsParseException(const std::string &message)
      : std::runtime_error("DNS Parse Error: " + message)
  {
  }
};

/// \brief DNS message parsing and construction utilities.
///
/// Records are kept with their RDATA as received; only the record types the
/// gateway synthesizes (A, PTR) have builders. Serialization writes names
/// uncompressed.
class DnsMessage
{
public:
  /// \brief Parse DNS message from binary data
  /// \throws DnsParseException on truncated or malformed input
  static DnsPacket parse(const std::uint8_t *data, std::size_t size);

  static DnsPacket parse(const std::vector<std::uint8_t> &data)
  {
    return parse(data.data(), data.size());
  }

  /// \brief Parse only the fixed 12 byte header
  static DnsHeader parseHeaderOnly(const std::uint8_t *data, std::size_t size)
  {
    DnsHeader header;
    parseHeader(data, 0, size, header);
    return header;
  }

  /// \brief Serialize a message. Section counts are taken from the vectors,
  /// not from the header fields.
  static std::vector<std::uint8_t> serialize(const DnsPacket &packet);

  /// \brief Build a single question query with the RD flag set
  static std::vector<std::uint8_t> buildQuery(const DnsQuestion &question, std::uint16_t id,
                                              bool recursionDesired = true);

  /// \brief Reply skeleton for \p request: same ID, opcode, RD flag and
  /// question section, QR set, NOERROR.
  static DnsPacket makeReply(const DnsPacket &request);

  /// \brief Reply skeleton carrying \p rcode and no records
  static DnsPacket makeFailure(const DnsPacket &request, DnsResponseCode rcode);

  /// \brief Header-only reply for a datagram that could not be decoded.
  /// Returns an empty vector when the input is shorter than a header.
  static std::vector<std::uint8_t> makeFormatError(const std::uint8_t *data, std::size_t size);

  /// \brief A record with a host-byte-order address
  static DnsResourceRecord makeARecord(const std::string &name, std::uint32_t address,
                                       std::uint32_t ttl);

  /// \brief PTR record pointing at \p target
  static DnsResourceRecord makePtrRecord(const std::string &name, const std::string &target,
                                         std::uint32_t ttl);

  /// \brief Address carried by an A record, or empty when RDATA is not 4 bytes
  static std::string aRecordAddress(const DnsResourceRecord &rr);

  /// \brief Target of a PTR record built by makePtrRecord (uncompressed RDATA)
  static std::string ptrRecordTarget(const DnsResourceRecord &rr);

  /// \brief Transaction ID of a raw message
  static std::uint16_t readId(const std::vector<std::uint8_t> &message);

  /// \brief Overwrite the transaction ID of a raw message in place
  static void setId(std::vector<std::uint8_t> &message, std::uint16_t id);

  /// \brief Convert domain name to DNS wire format
  /// \param name Domain name (e.g., "example.com" or "example.com.")
  static std::vector<std::uint8_t> encodeName(const std::string &name);

  /// \brief Parse domain name from DNS wire format
  /// \return New offset after parsing name
  static std::size_t decodeName(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                std::string &name);

  /// \brief Parse domain name with loop detection
  static std::size_t
  decodeNameWithLoopDetection(const std::uint8_t *data, std::size_t offset, std::size_t size,
                              std::string &name,
                              std::unordered_set<std::uint16_t> &visitedPointers);

private:
  static std::size_t parseHeader(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                 DnsHeader &header);
  static std::size_t parseQuestion(const std::uint8_t *data, std::size_t offset, std::size_t size,
                                   DnsQuestion &question);
  static std::size_t parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                         std::size_t size, DnsResourceRecord &rr);

  static void writeHeader(std::vector<std::uint8_t> &buffer, const DnsHeader &header,
                          std::size_t qdcount, std::size_t ancount, std::size_t nscount,
                          std::size_t arcount);
  static void writeRecord(std::vector<std::uint8_t> &buffer, const DnsResourceRecord &rr);

  static void writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value);
  static void writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value);
  static std::uint16_t readUint16(const std::uint8_t *data, std::size_t offset);
  static std::uint32_t readUint32(const std::uint8_t *data, std::size_t offset);
  static void checkBounds(std::size_t offset, std::size_t needed, std::size_t total);
};

// ==================== Implementation ====================

inline void DnsMessage::writeUint16(std::vector<std::uint8_t> &buffer, std::uint16_t value)
{
  std::uint16_t netValue = htons(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 2);
}

inline void DnsMessage::writeUint32(std::vector<std::uint8_t> &buffer, std::uint32_t value)
{
  std::uint32_t netValue = htonl(value);
  const std::uint8_t *bytes = reinterpret_cast<const std::uint8_t *>(&netValue);
  buffer.insert(buffer.end(), bytes, bytes + 4);
}

inline std::uint16_t DnsMessage::readUint16(const std::uint8_t *data, std::size_t offset)
{
  std::uint16_t netValue;
  std::memcpy(&netValue, data + offset, 2);
  return ntohs(netValue);
}

inline std::uint32_t DnsMessage::readUint32(const std::uint8_t *data, std::size_t offset)
{
  std::uint32_t netValue;
  std::memcpy(&netValue, data + offset, 4);
  return ntohl(netValue);
}

inline void DnsMessage::checkBounds(std::size_t offset, std::size_t needed, std::size_t total)
{
  if (offset + needed > total)
  {
    throw DnsParseException("Insufficient data at offset " + std::to_string(offset) + ", needed " +
                            std::to_string(needed) + ", total " + std::to_string(total));
  }
}

inline std::vector<std::uint8_t> DnsMessage::encodeName(const std::string &name)
{
  std::vector<std::uint8_t> encoded;

  if (name.empty() || name == ".")
  {
    encoded.push_back(0); // Root domain
    return encoded;
  }

  std::istringstream iss(name);
  std::string label;

  while (std::getline(iss, label, '.'))
  {
    if (label.empty())
      continue;

    if (label.length() > constants::DNS_MAX_LABEL_SIZE)
    {
      throw DnsParseException("Label too long: " + label + " (max " +
                              std::to_string(constants::DNS_MAX_LABEL_SIZE) + ")");
    }

    encoded.push_back(static_cast<std::uint8_t>(label.length()));
    encoded.insert(encoded.end(), label.begin(), label.end());
  }

  encoded.push_back(0);

  if (encoded.size() > constants::DNS_MAX_NAME_SIZE)
  {
    throw DnsParseException("Domain name too long: " + name);
  }

  return encoded;
}

inline std::size_t DnsMessage::decodeName(const std::uint8_t *data, std::size_t offset,
                                          std::size_t size, std::string &name)
{
  std::unordered_set<std::uint16_t> visitedPointers;
  return decodeNameWithLoopDetection(data, offset, size, name, visitedPointers);
}

inline std::size_t
DnsMessage::decodeNameWithLoopDetection(const std::uint8_t *data, std::size_t offset,
                                        std::size_t size, std::string &name,
                                        std::unordered_set<std::uint16_t> &visitedPointers)
{
  name.clear();
  std::size_t originalOffset = offset;
  bool jumped = false;
  bool terminated = false;
  std::size_t totalLength = 0;

  while (offset < size)
  {
    std::uint8_t length = data[offset];

    if ((length & constants::DNS_COMPRESSION_MASK) == constants::DNS_COMPRESSION_MASK)
    {
      checkBounds(offset, 2, size);
      if (!jumped)
      {
        originalOffset = offset + 2;
        jumped = true;
      }

      std::uint16_t pointer = readUint16(data, offset) & constants::DNS_COMPRESSION_POINTER_MASK;
      if (pointer >= size)
      {
        throw DnsParseException("Invalid compression pointer: " + std::to_string(pointer) +
                                ", message size: " + std::to_string(size));
      }
      if (!visitedPointers.insert(pointer).second)
      {
        throw DnsParseException("Compression pointer loop detected at offset: " +
                                std::to_string(pointer));
      }

      offset = pointer;
      continue;
    }

    if ((length & constants::DNS_COMPRESSION_MASK) != 0)
    {
      throw DnsParseException("Unsupported label type at offset " + std::to_string(offset));
    }

    if (length == 0)
    {
      offset++;
      terminated = true;
      break;
    }

    checkBounds(offset + 1, length, size);

    if (!name.empty())
    {
      name += ".";
    }

    name.append(reinterpret_cast<const char *>(data + offset + 1), length);
    offset += length + 1;

    totalLength += length + 1;
    if (totalLength > constants::DNS_MAX_NAME_SIZE)
    {
      throw DnsParseException("Domain name too long: " + std::to_string(totalLength) + " (max " +
                              std::to_string(constants::DNS_MAX_NAME_SIZE) + ")");
    }
  }

  if (!terminated)
  {
    throw DnsParseException("Unterminated domain name");
  }

  return jumped ? originalOffset : offset;
}

inline std::size_t DnsMessage::parseHeader(const std::uint8_t *data, std::size_t offset,
                                           std::size_t size, DnsHeader &header)
{
  checkBounds(offset, constants::DNS_HEADER_SIZE, size);

  header.id = readUint16(data, offset);
  offset += 2;

  std::uint16_t flags = readUint16(data, offset);
  header.qr = (flags & 0x8000) != 0;
  header.opcode = static_cast<DnsOpcode>((flags >> 11) & 0x0F);
  header.aa = (flags & 0x0400) != 0;
  header.tc = (flags & 0x0200) != 0;
  header.rd = (flags & 0x0100) != 0;
  header.ra = (flags & 0x0080) != 0;
  header.z = static_cast<std::uint8_t>((flags >> 4) & 0x07);
  header.rcode = static_cast<DnsResponseCode>(flags & 0x0F);
  offset += 2;

  header.qdcount = readUint16(data, offset);
  offset += 2;
  header.ancount = readUint16(data, offset);
  offset += 2;
  header.nscount = readUint16(data, offset);
  offset += 2;
  header.arcount = readUint16(data, offset);
  offset += 2;

  return offset;
}

inline std::size_t DnsMessage::parseQuestion(const std::uint8_t *data, std::size_t offset,
                                             std::size_t size, DnsQuestion &question)
{
  offset = decodeName(data, offset, size, question.qname);

  checkBounds(offset, 4, size);
  question.qtype = static_cast<DnsType>(readUint16(data, offset));
  question.qclass = static_cast<DnsClass>(readUint16(data, offset + 2));
  return offset + 4;
}

inline std::size_t DnsMessage::parseResourceRecord(const std::uint8_t *data, std::size_t offset,
                                                   std::size_t size, DnsResourceRecord &rr)
{
  offset = decodeName(data, offset, size, rr.name);

  checkBounds(offset, 10, size);
  rr.type = static_cast<DnsType>(readUint16(data, offset));
  rr.cls = static_cast<DnsClass>(readUint16(data, offset + 2));
  rr.ttl = readUint32(data, offset + 4);
  std::uint16_t rdlength = readUint16(data, offset + 8);
  offset += 10;

  checkBounds(offset, rdlength, size);
  rr.rdata.assign(data + offset, data + offset + rdlength);
  return offset + rdlength;
}

inline DnsPacket DnsMessage::parse(const std::uint8_t *data, std::size_t size)
{
  if (size < constants::DNS_HEADER_SIZE)
  {
    throw DnsParseException("Message too short for DNS header: " + std::to_string(size) +
                            " bytes, minimum " + std::to_string(constants::DNS_HEADER_SIZE) +
                            " required");
  }

  DnsPacket packet;
  std::size_t offset = parseHeader(data, 0, size, packet.header);

  packet.questions.reserve(packet.header.qdcount);
  for (std::uint16_t i = 0; i < packet.header.qdcount; ++i)
  {
    DnsQuestion question;
    offset = parseQuestion(data, offset, size, question);
    packet.questions.push_back(question);
  }

  auto parseSection = [&](std::uint16_t count, std::vector<DnsResourceRecord> &section)
  {
    section.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i)
    {
      DnsResourceRecord rr;
      offset = parseResourceRecord(data, offset, size, rr);
      section.push_back(std::move(rr));
    }
  };
  parseSection(packet.header.ancount, packet.answers);
  parseSection(packet.header.nscount, packet.authority);
  parseSection(packet.header.arcount, packet.additional);

  return packet;
}

inline void DnsMessage::writeHeader(std::vector<std::uint8_t> &buffer, const DnsHeader &header,
                                    std::size_t qdcount, std::size_t ancount,
                                    std::size_t nscount, std::size_t arcount)
{
  std::uint16_t flags = 0;
  if (header.qr)
    flags |= 0x8000;
  flags |= static_cast<std::uint16_t>((static_cast<std::uint16_t>(header.opcode) & 0x0F) << 11);
  if (header.aa)
    flags |= 0x0400;
  if (header.tc)
    flags |= 0x0200;
  if (header.rd)
    flags |= 0x0100;
  if (header.ra)
    flags |= 0x0080;
  flags |= static_cast<std::uint16_t>((header.z & 0x07) << 4);
  flags |= static_cast<std::uint16_t>(static_cast<std::uint16_t>(header.rcode) & 0x0F);

  writeUint16(buffer, header.id);
  writeUint16(buffer, flags);
  writeUint16(buffer, static_cast<std::uint16_t>(qdcount));
  writeUint16(buffer, static_cast<std::uint16_t>(ancount));
  writeUint16(buffer, static_cast<std::uint16_t>(nscount));
  writeUint16(buffer, static_cast<std::uint16_t>(arcount));
}

inline void DnsMessage::writeRecord(std::vector<std::uint8_t> &buffer,
                                    const DnsResourceRecord &rr)
{
  if (rr.rdata.size() > 0xFFFF)
  {
    throw DnsParseException("RDATA too long: " + std::to_string(rr.rdata.size()));
  }
  auto encodedName = encodeName(rr.name);
  buffer.insert(buffer.end(), encodedName.begin(), encodedName.end());
  writeUint16(buffer, static_cast<std::uint16_t>(rr.type));
  writeUint16(buffer, static_cast<std::uint16_t>(rr.cls));
  writeUint32(buffer, rr.ttl);
  writeUint16(buffer, static_cast<std::uint16_t>(rr.rdata.size()));
  buffer.insert(buffer.end(), rr.rdata.begin(), rr.rdata.end());
}

inline std::vector<std::uint8_t> DnsMessage::serialize(const DnsPacket &packet)
{
  std::vector<std::uint8_t> message;
  message.reserve(constants::DNS_MAX_UDP_SIZE);

  writeHeader(message, packet.header, packet.questions.size(), packet.answers.size(),
              packet.authority.size(), packet.additional.size());

  for (const auto &question : packet.questions)
  {
    auto encodedName = encodeName(question.qname);
    message.insert(message.end(), encodedName.begin(), encodedName.end());
    writeUint16(message, static_cast<std::uint16_t>(question.qtype));
    writeUint16(message, static_cast<std::uint16_t>(question.qclass));
  }
  for (const auto &rr : packet.answers)
    writeRecord(message, rr);
  for (const auto &rr : packet.authority)
    writeRecord(message, rr);
  for (const auto &rr : packet.additional)
    writeRecord(message, rr);

  return message;
}

inline std::vector<std::uint8_t> DnsMessage::buildQuery(const DnsQuestion &question,
                                                        std::uint16_t id, bool recursionDesired)
{
  DnsPacket packet;
  packet.header.id = id;
  packet.header.rd = recursionDesired;
  packet.questions.push_back(question);
  return serialize(packet);
}

inline DnsPacket DnsMessage::makeReply(const DnsPacket &request)
{
  DnsPacket reply;
  reply.header.id = request.header.id;
  reply.header.qr = true;
  reply.header.opcode = request.header.opcode;
  reply.header.rd = request.header.rd;
  reply.header.rcode = DnsResponseCode::NOERROR;
  reply.questions = request.questions;
  return reply;
}

inline DnsPacket DnsMessage::makeFailure(const DnsPacket &request, DnsResponseCode rcode)
{
  DnsPacket reply = makeReply(request);
  reply.header.rcode = rcode;
  return reply;
}

inline std::vector<std::uint8_t> DnsMessage::makeFormatError(const std::uint8_t *data,
                                                             std::size_t size)
{
  if (size < constants::DNS_HEADER_SIZE)
  {
    return {};
  }
  DnsHeader request;
  parseHeader(data, 0, size, request);

  DnsHeader header;
  header.id = request.id;
  header.qr = true;
  header.opcode = request.opcode;
  header.rd = request.rd;
  header.rcode = DnsResponseCode::FORMERR;

  std::vector<std::uint8_t> message;
  writeHeader(message, header, 0, 0, 0, 0);
  return message;
}

inline DnsResourceRecord DnsMessage::makeARecord(const std::string &name, std::uint32_t address,
                                                 std::uint32_t ttl)
{
  DnsResourceRecord rr(name, DnsType::A, DnsClass::IN, ttl);
  writeUint32(rr.rdata, address);
  return rr;
}

inline DnsResourceRecord DnsMessage::makePtrRecord(const std::string &name,
                                                   const std::string &target, std::uint32_t ttl)
{
  DnsResourceRecord rr(name, DnsType::PTR, DnsClass::IN, ttl);
  rr.rdata = encodeName(target);
  return rr;
}

inline std::string DnsMessage::aRecordAddress(const DnsResourceRecord &rr)
{
  if (rr.rdata.size() != 4)
  {
    return {};
  }
  return std::to_string(rr.rdata[0]) + "." + std::to_string(rr.rdata[1]) + "." +
         std::to_string(rr.rdata[2]) + "." + std::to_string(rr.rdata[3]);
}

inline std::string DnsMessage::ptrRecordTarget(const DnsResourceRecord &rr)
{
  std::string target;
  decodeName(rr.rdata.data(), 0, rr.rdata.size(), target);
  return target;
}

inline std::uint16_t DnsMessage::readId(const std::vector<std::uint8_t> &message)
{
  checkBounds(0, 2, message.size());
  return readUint16(message.data(), 0);
}

inline void DnsMessage::setId(std::vector<std::uint8_t> &message, std::uint16_t id)
{
  checkBounds(0, 2, message.size());
  message[0] = static_cast<std::uint8_t>(id >> 8);
  message[1] = static_cast<std::uint8_t>(id & 0xFF);
}

} // namespace dns
} // namespace network
} // namespace torgate
