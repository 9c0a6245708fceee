// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "torgate/bypass/engine.hpp"
#include "torgate/common/lifecycle.hpp"
#include "torgate/core/logger.hpp"
#include "torgate/crypto/secure_rng.hpp"
#include "torgate/network/dns/dns_message.hpp"
#include "torgate/network/dns/dns_transport.hpp"
#include "torgate/network/dns/udp_dns_server.hpp"
#include "torgate/network/endpoint.hpp"

namespace torgate
{
namespace network
{

/// \brief Raw DNS responses keyed by "domain:qtype".
///
/// Entries older than the max age read as absent but are not purged; the
/// next successful response for the key overwrites them.
class DnsResponseCache
{
public:
  using Clock = std::chrono::steady_clock;

  struct Stats
  {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t stale = 0;
    std::uint64_t insertions = 0;
  };

  explicit DnsResponseCache(std::chrono::seconds maxAge = std::chrono::seconds(300))
      : _maxAge(maxAge)
  {
  }

  static std::string key(const std::string &domain, dns::DnsType qtype)
  {
    return domain + ":" + std::to_string(static_cast<unsigned>(qtype));
  }

  /// \brief Copy of a fresh entry, or nullopt
  std::optional<std::vector<std::uint8_t>> get(const std::string &domain, dns::DnsType qtype)
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _entries.find(key(domain, qtype));
    if (it == _entries.end())
    {
      ++_misses;
      return std::nullopt;
    }
    if (Clock::now() - it->second.timestamp > _maxAge)
    {
      ++_stale;
      return std::nullopt;
    }
    ++_hits;
    return it->second.response;
  }

  void set(const std::string &domain, dns::DnsType qtype, std::vector<std::uint8_t> response)
  {
    setAt(domain, qtype, std::move(response), Clock::now());
  }

  /// \brief Store with an explicit timestamp
  void setAt(const std::string &domain, dns::DnsType qtype, std::vector<std::uint8_t> response,
             Clock::time_point timestamp)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _entries[key(domain, qtype)] = Entry{std::move(response), timestamp};
    ++_insertions;
  }

  std::size_t size() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _entries.size();
  }

  std::chrono::seconds maxAge() const { return _maxAge; }

  Stats getStats() const
  {
    Stats s;
    s.hits = _hits.load();
    s.misses = _misses.load();
    s.stale = _stale.load();
    s.insertions = _insertions.load();
    return s;
  }

private:
  struct Entry
  {
    std::vector<std::uint8_t> response;
    Clock::time_point timestamp;
  };

  const std::chrono::seconds _maxAge;
  mutable std::shared_mutex _mutex;
  std::unordered_map<std::string, Entry> _entries;
  std::atomic<std::uint64_t> _hits{0};
  std::atomic<std::uint64_t> _misses{0};
  std::atomic<std::uint64_t> _stale{0};
  std::atomic<std::uint64_t> _insertions{0};
};

/// \brief [dns] plus the Tor resolver port
struct DnsResolverConfig
{
  std::string listenAddress = "127.0.0.1";
  std::uint16_t listenPort = 53;
  std::string torHost = "127.0.0.1";
  std::uint16_t torDnsPort = 5353;
  /// Tried in order for bypassed names; the first with systemTimeout, the
  /// rest with fallbackTimeout
  std::vector<std::string> systemResolvers = {"127.0.0.53:53", "127.0.0.1:53"};
  std::chrono::seconds cacheMaxAge{300};
  std::chrono::milliseconds torTimeout{10000};
  std::chrono::milliseconds systemTimeout{5000};
  std::chrono::milliseconds fallbackTimeout{3000};
  dns::UdpDnsServerConfig workers;
};

/// \brief DNS service that keeps every non-bypassed lookup inside Tor.
///
/// Per query:
///   bypass engine says bypass -> system resolvers, NXDOMAIN if all fail
///   bypass engine says block  -> NXDOMAIN, nothing sent
///   otherwise                 -> cache, then Tor's DNSPort; SERVFAIL on failure
///
/// A failed Tor lookup is never retried against a clearnet resolver.
class DnsResolver : public common::ILifecycleManaged
{
public:
  struct Stats
  {
    std::uint64_t queries = 0;
    std::uint64_t bypassed = 0;
    std::uint64_t blocked = 0;
    std::uint64_t cacheHits = 0;
    std::uint64_t torForwarded = 0;
    std::uint64_t torFailures = 0;
    std::uint64_t malformed = 0;
  };

  /// \param config Listener, upstream and timeout settings
  /// \param engine Classification engine, may be null (nothing is bypassed)
  /// \throws common::ConfigurationError for unusable addresses
  DnsResolver(DnsResolverConfig config, std::shared_ptr<const bypass::BypassEngine> engine)
      : _log(core::Logger::component("dns")), _config(std::move(config)),
        _engine(std::move(engine)), _cache(_config.cacheMaxAge),
        _server("dns",
                [this](const std::uint8_t *data, std::size_t size)
                { return handleQuery(data, size); },
                _config.workers)
  {
    auto listen = Endpoint::parse(
      (isIPv6Address(_config.listenAddress) ? "[" + _config.listenAddress + "]"
                                            : _config.listenAddress) +
      ":" + std::to_string(_config.listenPort));
    if (!listen)
    {
      throw common::ConfigurationError("invalid dns listen address: " + _config.listenAddress);
    }
    _listen = *listen;

    if (!isValidIpAddress(_config.torHost))
    {
      throw common::ConfigurationError("invalid tor resolver host: " + _config.torHost);
    }
    _torUpstream = Endpoint(_config.torHost, _config.torDnsPort);

    for (const auto &resolver : _config.systemResolvers)
    {
      auto endpoint = Endpoint::parse(resolver);
      if (!endpoint)
      {
        throw common::ConfigurationError("invalid system resolver: " + resolver);
      }
      _systemResolvers.push_back(*endpoint);
    }
  }

  ~DnsResolver() override { stop(); }

  void start() override
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_state == common::LifecycleState::Running)
    {
      throw common::LifecycleError("DNS resolver already running");
    }
    _server.start(_listen);
    TORGATE_CLOG_INFO(_log, "DNS resolver listening addr=" << _listen.host << ":"
                                                            << _server.boundPort()
                                                            << " upstream="
                                                            << _torUpstream.toString());
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

  std::uint16_t boundPort() const { return _server.boundPort(); }

  const Endpoint &torUpstream() const { return _torUpstream; }

  DnsResponseCache &cache() { return _cache; }

  Stats getStats() const
  {
    Stats s;
    s.queries = _queries.load();
    s.bypassed = _bypassed.load();
    s.blocked = _blocked.load();
    s.cacheHits = _cacheHits.load();
    s.torForwarded = _torForwarded.load();
    s.torFailures = _torFailures.load();
    s.malformed = _malformed.load();
    return s;
  }

  /// \brief Resolve one wire-format query and return the wire-format reply
  std::vector<std::uint8_t> handleQuery(const std::uint8_t *data, std::size_t size)
  {
    ++_queries;
    dns::DnsPacket request;
    try
    {
      request = dns::DnsMessage::parse(data, size);
    }
    catch (const dns::DnsParseException &e)
    {
      ++_malformed;
      TORGATE_CLOG_DEBUG(_log, "malformed query: " << e.what());
      return dns::DnsMessage::makeFormatError(data, size);
    }

    if (request.questions.empty())
    {
      ++_malformed;
      return failure(request, dns::DnsResponseCode::SERVFAIL);
    }

    const auto &question = request.questions.front();
    std::string domain = question.qname;
    if (!domain.empty() && domain.back() == '.')
    {
      domain.pop_back();
    }
    TORGATE_CLOG_DEBUG(_log, "DNS query domain=" << domain
                                                 << " type=" << dns::typeToString(question.qtype));

    if (_engine)
    {
      auto decision = _engine->matchDomain(domain);
      if (decision.matched && decision.action == bypass::Action::Bypass)
      {
        ++_bypassed;
        TORGATE_CLOG_DEBUG(_log, "bypassing DNS (clearnet) domain=" << domain
                                                                    << " reason="
                                                                    << decision.reason);
        return resolveDirect(request, data, size, domain);
      }
      if (decision.matched && decision.action == bypass::Action::Block)
      {
        ++_blocked;
        TORGATE_CLOG_INFO(_log, "blocked DNS query domain=" << domain);
        return failure(request, dns::DnsResponseCode::NXDOMAIN);
      }
    }

    if (auto cached = _cache.get(domain, question.qtype))
    {
      ++_cacheHits;
      dns::DnsMessage::setId(*cached, request.header.id);
      TORGATE_CLOG_DEBUG(_log, "DNS cache hit domain=" << domain);
      return *cached;
    }

    return resolveTor(request, data, size, domain);
  }

private:
  std::vector<std::uint8_t> resolveTor(const dns::DnsPacket &request, const std::uint8_t *data,
                                       std::size_t size, const std::string &domain)
  {
    ++_torForwarded;
    try
    {
      auto reply = forward(_torUpstream, data, size, _config.torTimeout);
      auto header = dns::DnsMessage::parseHeaderOnly(reply.data(), reply.size());
      dns::DnsMessage::setId(reply, request.header.id);
      if (header.rcode == dns::DnsResponseCode::NOERROR)
      {
        _cache.set(domain, request.questions.front().qtype, reply);
      }
      return reply;
    }
    catch (const std::runtime_error &e)
    {
      ++_torFailures;
      TORGATE_CLOG_WARN(_log, "Tor DNS query failed domain=" << domain << ": " << e.what());
      return failure(request, dns::DnsResponseCode::SERVFAIL);
    }
  }

  std::vector<std::uint8_t> resolveDirect(const dns::DnsPacket &request,
                                          const std::uint8_t *data, std::size_t size,
                                          const std::string &domain)
  {
    for (std::size_t i = 0; i < _systemResolvers.size(); ++i)
    {
      auto timeout = i == 0 ? _config.systemTimeout : _config.fallbackTimeout;
      try
      {
        auto reply = forward(_systemResolvers[i], data, size, timeout);
        dns::DnsMessage::setId(reply, request.header.id);
        return reply;
      }
      catch (const std::runtime_error &e)
      {
        TORGATE_CLOG_DEBUG(_log, "local resolver " << _systemResolvers[i].toString()
                                                   << " failed: " << e.what());
      }
    }
    TORGATE_CLOG_DEBUG(_log, "local DNS failed, returning NXDOMAIN domain=" << domain);
    return failure(request, dns::DnsResponseCode::NXDOMAIN);
  }

  /// \brief Relay the caller's message with a fresh random transaction ID
  static std::vector<std::uint8_t> forward(const Endpoint &upstream, const std::uint8_t *data,
                                           std::size_t size, std::chrono::milliseconds timeout)
  {
    std::vector<std::uint8_t> query(data, data + size);
    dns::DnsMessage::setId(query, crypto::SecureRng::queryId());
    return dns::DnsUdpClient::exchange(upstream, query, timeout);
  }

  static std::vector<std::uint8_t> failure(const dns::DnsPacket &request,
                                           dns::DnsResponseCode rcode)
  {
    return dns::DnsMessage::serialize(dns::DnsMessage::makeFailure(request, rcode));
  }

  core::ComponentLogger _log;
  DnsResolverConfig _config;
  std::shared_ptr<const bypass::BypassEngine> _engine;
  DnsResponseCache _cache;
  Endpoint _listen;
  Endpoint _torUpstream;
  std::vector<Endpoint> _systemResolvers;

  std::atomic<std::uint64_t> _queries{0};
  std::atomic<std::uint64_t> _bypassed{0};
  std::atomic<std::uint64_t> _blocked{0};
  std::atomic<std::uint64_t> _cacheHits{0};
  std::atomic<std::uint64_t> _torForwarded{0};
  std::atomic<std::uint64_t> _torFailures{0};
  std::atomic<std::uint64_t> _malformed{0};

  mutable std::mutex _lifecycleMutex;
  common::LifecycleState _state = common::LifecycleState::Created;
  dns::UdpDnsServer _server;
};

} // namespace network
} // namespace torgate
