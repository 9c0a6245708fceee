// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "torgate/common/lifecycle.hpp"
#include "torgate/core/logger.hpp"
#include "torgate/network/dns/dns_message.hpp"
#include "torgate/network/dns/udp_dns_server.hpp"
#include "torgate/network/endpoint.hpp"
#include "torgate/network/ip_utils.hpp"

namespace torgate
{
namespace network
{

/// \brief [fakedns]
struct FakeDnsConfig
{
  std::string listenAddress = "127.0.0.1:15353";
  std::string subnet = "198.18.0.0/15";
  std::uint32_t ttl = 60;
  dns::UdpDnsServerConfig workers;
};

/// \brief Hands out a stable synthetic IPv4 address per domain name.
///
/// Each new canonical name ("example.com.") receives the next address of the
/// configured block, starting at network + 1. Mappings are kept in both
/// directions and are never reassigned or released. Running out of addresses
/// raises ConfigurationError rather than reusing one.
///
/// The DNS listener answers:
///   - A: the synthetic address, allocating on first sight
///   - PTR: the mapped name for in-addr.arpa names inside the block
///   - AAAA: an empty answer, so clients fall back to IPv4
/// All replies are authoritative.
class FakeDnsServer : public common::ILifecycleManaged
{
public:
  /// \throws common::ConfigurationError for an unusable listen address or block
  explicit FakeDnsServer(const FakeDnsConfig &config)
      : _log(core::Logger::component("fakedns")), _ttl(config.ttl),
        _server("fakedns",
                [this](const std::uint8_t *data, std::size_t size)
                { return handleQuery(data, size); },
                config.workers)
  {
    auto subnet = CidrNetwork::fromString(config.subnet);
    if (!subnet || subnet->isIPv6() || config.subnet.find('/') == std::string::npos)
    {
      throw common::ConfigurationError("invalid fake subnet: " + config.subnet);
    }
    auto listen = Endpoint::parse(config.listenAddress);
    if (!listen)
    {
      throw common::ConfigurationError("invalid fakedns listen address: " +
                                       config.listenAddress);
    }
    _subnet = *subnet;
    _listen = *listen;
    _nextAddress = static_cast<std::uint64_t>(_subnet.networkAddress()) + 1;
  }

  ~FakeDnsServer() override { stop(); }

  void start() override
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_state == common::LifecycleState::Running)
    {
      throw common::LifecycleError("FakeDNS already running");
    }
    TORGATE_CLOG_INFO(_log, "starting FakeDNS server addr=" << _listen.toString());
    _server.start(_listen);
    _state = common::LifecycleState::Running;
  }

  void stop() override
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_state != common::LifecycleState::Running)
    {
      return;
    }
    _server.stop();
    _state = common::LifecycleState::Stopped;
  }

  common::LifecycleState getState() const override
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    return _state;
  }

  /// \brief Port the listener is bound to (useful when configured as 0)
  std::uint16_t boundPort() const { return _server.boundPort(); }

  /// \brief Synthetic address for \p domain, allocated on first use.
  /// \throws common::ConfigurationError when the block is exhausted
  std::string getFakeIP(const std::string &domain)
  {
    const std::string name = canonicalName(domain);
    {
      std::shared_lock<std::shared_mutex> lock(_mutex);
      auto it = _forward.find(name);
      if (it != _forward.end())
      {
        return IPv4::toString(it->second);
      }
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _forward.find(name);
    if (it != _forward.end())
    {
      return IPv4::toString(it->second);
    }
    if (_nextAddress > _subnet.lastAddress())
    {
      throw common::ConfigurationError("fake address pool exhausted");
    }

    auto address = static_cast<std::uint32_t>(_nextAddress++);
    std::string text = IPv4::toString(address);
    _forward.emplace(name, address);
    _reverse.emplace(text, name);
    TORGATE_CLOG_DEBUG(_log, "allocated " << text << " for " << name);
    return text;
  }

  /// \brief True for any address inside the configured block
  bool isFakeIP(const std::string &ip) const { return _subnet.contains(ip); }

  /// \brief Canonical name mapped to \p ip, empty when not allocated
  std::string getDomainForIP(const std::string &ip) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _reverse.find(ip);
    return it == _reverse.end() ? std::string() : it->second;
  }

  std::size_t getMappingCount() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _forward.size();
  }

  /// \brief Hook for age-based eviction. Mappings are currently kept for
  /// the life of the process, so this removes nothing.
  void cleanupOldMappings(std::chrono::seconds maxAge)
  {
    TORGATE_CLOG_DEBUG(_log, "cleanup requested maxAge=" << maxAge.count()
                                                         << "s, mappings are permanent");
  }

  /// \brief Lowercase with exactly one trailing dot
  static std::string canonicalName(const std::string &domain)
  {
    std::string name = domain;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name.empty() || name.back() != '.')
    {
      name += '.';
    }
    return name;
  }

  /// \brief "1.0.18.198.in-addr.arpa." -> "198.18.0.1"; empty on malformed input
  static std::string ptrToIp(const std::string &ptrName)
  {
    static const std::string suffix = ".in-addr.arpa.";
    std::string name = canonicalName(ptrName);
    if (name.size() < suffix.size() ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
    {
      return {};
    }
    name.resize(name.size() - suffix.size());

    std::vector<std::string> labels;
    std::string current;
    for (char c : name)
    {
      if (c == '.')
      {
        if (!current.empty())
        {
          labels.push_back(current);
          current.clear();
        }
      }
      else
      {
        current += c;
      }
    }
    if (!current.empty())
    {
      labels.push_back(current);
    }
    if (labels.size() != 4)
    {
      return {};
    }
    return labels[3] + "." + labels[2] + "." + labels[1] + "." + labels[0];
  }

  /// \brief Answer one wire-format query
  std::vector<std::uint8_t> handleQuery(const std::uint8_t *data, std::size_t size)
  {
    dns::DnsPacket request;
    try
    {
      request = dns::DnsMessage::parse(data, size);
    }
    catch (const dns::DnsParseException &e)
    {
      TORGATE_CLOG_DEBUG(_log, "malformed query: " << e.what());
      return dns::DnsMessage::makeFormatError(data, size);
    }

    if (request.questions.empty())
    {
      return dns::DnsMessage::serialize(
        dns::DnsMessage::makeFailure(request, dns::DnsResponseCode::SERVFAIL));
    }

    dns::DnsPacket reply = dns::DnsMessage::makeReply(request);
    reply.header.aa = true;

    for (const auto &question : request.questions)
    {
      switch (question.qtype)
      {
      case dns::DnsType::A:
      {
        try
        {
          std::string ip = getFakeIP(question.qname);
          reply.answers.push_back(
            dns::DnsMessage::makeARecord(question.qname, *IPv4::parse(ip), _ttl));
          TORGATE_CLOG_DEBUG(_log, "FakeDNS response domain=" << question.qname
                                                               << " fake_ip=" << ip);
        }
        catch (const common::ConfigurationError &e)
        {
          TORGATE_CLOG_ERROR(_log, e.what() << " while answering " << question.qname);
          reply.header.rcode = dns::DnsResponseCode::SERVFAIL;
        }
        break;
      }
      case dns::DnsType::AAAA:
        break;
      case dns::DnsType::PTR:
      {
        std::string ip = ptrToIp(question.qname);
        std::string domain = ip.empty() ? std::string() : getDomainForIP(ip);
        if (!domain.empty())
        {
          reply.answers.push_back(dns::DnsMessage::makePtrRecord(question.qname, domain, _ttl));
        }
        break;
      }
      default:
        break;
      }
    }

    return dns::DnsMessage::serialize(reply);
  }

private:
  core::ComponentLogger _log;
  const std::uint32_t _ttl;
  CidrNetwork _subnet;
  Endpoint _listen;

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, std::uint32_t> _forward;
  std::unordered_map<std::string, std::string> _reverse;
  std::uint64_t _nextAddress = 0;

  mutable std::mutex _lifecycleMutex;
  common::LifecycleState _state = common::LifecycleState::Created;
  dns::UdpDnsServer _server;
};

} // namespace network
} // namespace torgate
