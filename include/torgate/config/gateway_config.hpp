// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "torgate/bypass/bypass_config.hpp"
#include "torgate/common/lifecycle.hpp"
#include "torgate/core/config_loader.hpp"
#include "torgate/core/logger.hpp"
#include "torgate/network/dns_resolver.hpp"
#include "torgate/network/fake_dns.hpp"

namespace torgate
{
namespace config
{

/// \brief [log]
struct LogConfig
{
  core::Logger::Level level = core::Logger::Level::Info;
  std::string file; ///< Empty: console
  bool async = false;
  int retentionDays = 7;
};

/// \brief Everything torgated reads from its TOML file.
///
/// \code
/// [tor]
/// dns_port = 5353
///
/// [dns]
/// listen_address = "127.0.0.1"
/// listen_port = 53
///
/// [bypass]
/// enabled = true
/// domains = ["*.local", "*.lan"]
///
/// [[bypass.rules]]
/// name = "intranet"
/// type = "cidr"
/// pattern = "10.20.0.0/16"
/// action = "bypass"
/// \endcode
struct GatewayConfig
{
  std::uint16_t torDnsPort = 5353;
  network::DnsResolverConfig dns;
  bool fakeDnsEnabled = false;
  network::FakeDnsConfig fakeDns;
  bypass::BypassConfig bypass;
  LogConfig log;
  network::dns::UdpDnsServerConfig threadPool;

  static GatewayConfig defaults() { return GatewayConfig{}; }

  /// \brief Build from a parsed document, starting from defaults().
  /// \throws common::ConfigurationError for out-of-range or malformed values
  static GatewayConfig fromLoader(const core::ConfigLoader &loader)
  {
    GatewayConfig cfg;
    Reader r{loader};

    cfg.torDnsPort = r.port("tor.dns_port", cfg.torDnsPort);

    cfg.dns.listenAddress = r.str("dns.listen_address", cfg.dns.listenAddress);
    cfg.dns.listenPort = r.port("dns.listen_port", cfg.dns.listenPort);
    cfg.dns.systemResolvers = r.strings("dns.system_resolvers", cfg.dns.systemResolvers);
    cfg.dns.cacheMaxAge =
      std::chrono::seconds(r.integer("dns.cache_max_age_seconds", cfg.dns.cacheMaxAge.count(), 0));
    cfg.dns.torTimeout =
      std::chrono::milliseconds(r.integer("dns.tor_timeout_ms", cfg.dns.torTimeout.count(), 1));
    cfg.dns.systemTimeout = std::chrono::milliseconds(
      r.integer("dns.system_timeout_ms", cfg.dns.systemTimeout.count(), 1));
    cfg.dns.fallbackTimeout = std::chrono::milliseconds(
      r.integer("dns.fallback_timeout_ms", cfg.dns.fallbackTimeout.count(), 1));

    cfg.fakeDnsEnabled = r.boolean("fakedns.enabled", cfg.fakeDnsEnabled);
    cfg.fakeDns.listenAddress = r.str("fakedns.listen_address", cfg.fakeDns.listenAddress);
    cfg.fakeDns.subnet = r.str("fakedns.subnet", cfg.fakeDns.subnet);
    cfg.fakeDns.ttl = static_cast<std::uint32_t>(
      r.integer("fakedns.ttl", cfg.fakeDns.ttl, 0, std::numeric_limits<std::uint32_t>::max()));

    cfg.bypass.enabled = r.boolean("bypass.enabled", cfg.bypass.enabled);
    cfg.bypass.domains = r.strings("bypass.domains", {});
    cfg.bypass.cidrs = r.strings("bypass.cidrs", {});
    cfg.bypass.protocols = r.strings("bypass.protocols", {});
    cfg.bypass.applications = r.strings("bypass.applications", {});
    cfg.bypass.geoip.enabled = r.boolean("bypass.geoip.enabled", false);
    cfg.bypass.geoip.databasePath = r.str("bypass.geoip.database", "");
    cfg.bypass.geoip.countries = r.strings("bypass.geoip.countries", {});
    cfg.bypass.customRules = readRules(loader);

    if (auto level = loader.getString("log.level"))
    {
      auto parsed = core::Logger::parseLevel(*level);
      if (!parsed)
      {
        throw common::ConfigurationError("log.level: unknown level '" + *level + "'");
      }
      cfg.log.level = *parsed;
    }
    cfg.log.file = r.str("log.file", cfg.log.file);
    cfg.log.async = r.boolean("log.async", cfg.log.async);
    cfg.log.retentionDays =
      static_cast<int>(r.integer("log.retention_days", cfg.log.retentionDays, 1, 3650));

    cfg.threadPool.minThreads = static_cast<std::size_t>(
      r.integer("threadpool.min_threads", static_cast<std::int64_t>(cfg.threadPool.minThreads), 1,
                1024));
    cfg.threadPool.maxThreads = static_cast<std::size_t>(
      r.integer("threadpool.max_threads", static_cast<std::int64_t>(cfg.threadPool.maxThreads), 1,
                1024));
    cfg.threadPool.queueSize = static_cast<std::size_t>(
      r.integer("threadpool.queue_size", static_cast<std::int64_t>(cfg.threadPool.queueSize), 1,
                1 << 20));
    if (cfg.threadPool.maxThreads < cfg.threadPool.minThreads)
    {
      throw common::ConfigurationError("threadpool.max_threads must be >= min_threads");
    }

    cfg.dns.torDnsPort = cfg.torDnsPort;
    cfg.dns.workers = cfg.threadPool;
    cfg.fakeDns.workers = cfg.threadPool;
    return cfg;
  }

  /// \brief Load and parse \p path
  /// \throws std::runtime_error if the file cannot be read or parsed
  /// \throws common::ConfigurationError for invalid values
  static GatewayConfig fromFile(const std::string &path)
  {
    core::ConfigLoader loader(path);
    loader.load();
    return fromLoader(loader);
  }

private:
  struct Reader
  {
    const core::ConfigLoader &loader;

    bool present(const std::string &key) const
    {
      auto node = loader.table().at_path(key);
      return static_cast<bool>(node);
    }

    std::string str(const std::string &key, const std::string &fallback) const
    {
      if (!present(key))
        return fallback;
      auto value = loader.getString(key);
      if (!value)
        throw common::ConfigurationError(key + " must be a string");
      return *value;
    }

    bool boolean(const std::string &key, bool fallback) const
    {
      if (!present(key))
        return fallback;
      auto value = loader.getBool(key);
      if (!value)
        throw common::ConfigurationError(key + " must be a boolean");
      return *value;
    }

    std::int64_t integer(const std::string &key, std::int64_t fallback, std::int64_t min,
                         std::int64_t max = std::numeric_limits<std::int64_t>::max()) const
    {
      if (!present(key))
        return fallback;
      auto value = loader.getInt(key);
      if (!value)
        throw common::ConfigurationError(key + " must be an integer");
      if (*value < min || *value > max)
      {
        throw common::ConfigurationError(key + " out of range: " + std::to_string(*value));
      }
      return *value;
    }

    std::uint16_t port(const std::string &key, std::uint16_t fallback) const
    {
      return static_cast<std::uint16_t>(integer(key, fallback, 1, 65535));
    }

    std::vector<std::string> strings(const std::string &key,
                                     const std::vector<std::string> &fallback) const
    {
      if (!present(key))
        return fallback;
      try
      {
        auto value = loader.getStringArray(key);
        if (!value)
          throw common::ConfigurationError(key + " must be an array of strings");
        return *value;
      }
      catch (const common::ConfigurationError &)
      {
        throw;
      }
      catch (const std::runtime_error &e)
      {
        throw common::ConfigurationError(key + ": " + e.what());
      }
    }
  };

  static std::vector<bypass::Rule> readRules(const core::ConfigLoader &loader)
  {
    std::vector<bypass::Rule> rules;
    std::optional<std::vector<core::ConfigLoader>> tables;
    try
    {
      tables = loader.getTableArray("bypass.rules");
    }
    catch (const std::runtime_error &e)
    {
      throw common::ConfigurationError(std::string("bypass.rules: ") + e.what());
    }
    if (!tables)
    {
      return rules;
    }

    std::size_t index = 0;
    for (const auto &table : *tables)
    {
      Reader r{table};
      std::string where = "bypass.rules[" + std::to_string(index++) + "]";

      bypass::Rule rule;
      rule.name = r.str("name", "");
      if (rule.name.empty())
      {
        throw common::ConfigurationError(where + ": name is required");
      }
      std::string type = r.str("type", "");
      auto parsedType = bypass::parseRuleType(type);
      if (!parsedType)
      {
        throw common::ConfigurationError(where + ": unknown rule type '" + type + "'");
      }
      std::string action = r.str("action", "bypass");
      auto parsedAction = bypass::parseAction(action);
      if (!parsedAction)
      {
        throw common::ConfigurationError(where + ": unknown action '" + action + "'");
      }
      rule.type = *parsedType;
      rule.action = *parsedAction;
      rule.pattern = r.str("pattern", "");
      rule.description = r.str("description", "");
      rules.push_back(std::move(rule));
    }
    return rules;
  }
};

} // namespace config
} // namespace torgate
