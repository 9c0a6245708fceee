// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "torgate/bypass/bypass_config.hpp"
#include "torgate/bypass/country_matcher.hpp"
#include "torgate/bypass/glob.hpp"
#include "torgate/bypass/rule.hpp"
#include "torgate/core/logger.hpp"
#include "torgate/network/ip_utils.hpp"

namespace torgate
{
namespace bypass
{

/// \brief Decides whether a domain, address, protocol or application skips Tor.
///
/// Evaluation order for domains and addresses:
///   1. configured [bypass] domains / cidrs, in file order (always bypass)
///   2. for addresses only, the country matcher
///   3. custom rules of the matching type, in insertion order (rule action)
///
/// Configured entries that fail to compile are logged and skipped. All match
/// calls take a shared lock; addRule/removeRule take it exclusively.
class BypassEngine
{
public:
  /// \param config         Bypass settings
  /// \param countryMatcher Matcher to use instead of opening config.geoip
  explicit BypassEngine(BypassConfig config,
                        std::shared_ptr<CountryMatcher> countryMatcher = nullptr)
      : _log(core::Logger::component("bypass")), _enabled(config.enabled)
  {
    for (const auto &pattern : config.domains)
    {
      try
      {
        _domainPatterns.push_back(compileGlob(lowercase(pattern)));
      }
      catch (const CompileError &e)
      {
        TORGATE_CLOG_WARN(_log, "invalid domain pattern " << pattern << ": " << e.what());
      }
    }
    TORGATE_CLOG_DEBUG(_log, "compiled domain patterns count=" << _domainPatterns.size());

    for (const auto &cidr : config.cidrs)
    {
      auto net = network::CidrNetwork::fromString(cidr);
      if (!net)
      {
        TORGATE_CLOG_WARN(_log, "invalid CIDR " << cidr);
        continue;
      }
      _cidrs.push_back(*net);
    }
    TORGATE_CLOG_DEBUG(_log, "parsed CIDR ranges count=" << _cidrs.size());

    for (const auto &proto : config.protocols)
    {
      _protocols.insert(lowercase(proto));
    }
    for (const auto &app : config.applications)
    {
      _applications.insert(lowercase(app));
    }

    for (auto &rule : config.customRules)
    {
      try
      {
        compileRule(rule);
        _customRules.push_back(std::move(rule));
      }
      catch (const CompileError &e)
      {
        TORGATE_CLOG_WARN(_log, "failed to compile rule " << rule.name << ": " << e.what());
      }
    }

    if (countryMatcher)
    {
      _countryMatcher = std::move(countryMatcher);
    }
    else if (config.geoip.enabled)
    {
      try
      {
        _countryMatcher = CountryMatcher::open(config.geoip.databasePath, config.geoip.countries);
      }
      catch (const std::exception &e)
      {
        TORGATE_CLOG_WARN(_log, "failed to initialize GeoIP: " << e.what());
      }
    }
  }

  BypassEngine(const BypassEngine &) = delete;
  BypassEngine &operator=(const BypassEngine &) = delete;

  bool isEnabled() const { return _enabled; }

  MatchResult matchDomain(const std::string &domain) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    if (!_enabled)
    {
      return MatchResult::none();
    }

    const std::string name = lowercase(domain);

    for (const auto &pattern : _domainPatterns)
    {
      if (pattern.matches(name))
      {
        return MatchResult::bypass("matches pattern " + pattern.expression());
      }
    }

    for (const auto &rule : _customRules)
    {
      if (rule.type != RuleType::Domain)
        continue;
      const auto *glob = std::get_if<GlobMatcher>(&rule.compiled);
      if (glob && glob->matches(name))
      {
        return MatchResult::fromRule(rule);
      }
    }

    return MatchResult::none();
  }

  /// \brief Classify an IPv4 or IPv6 address. Unparsable input never matches.
  MatchResult matchIP(const std::string &ip) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    if (!_enabled || !network::isValidIpAddress(ip))
    {
      return MatchResult::none();
    }

    for (const auto &net : _cidrs)
    {
      if (net.contains(ip))
      {
        return MatchResult::bypass("matches CIDR " + net.toString());
      }
    }

    if (_countryMatcher)
    {
      auto country = _countryMatcher->match(ip);
      if (country.matched)
      {
        return MatchResult::bypass("matches country " + country.country);
      }
    }

    for (const auto &rule : _customRules)
    {
      if (rule.type != RuleType::Cidr)
        continue;
      const auto *net = std::get_if<network::CidrNetwork>(&rule.compiled);
      if (net && net->contains(ip))
      {
        return MatchResult::fromRule(rule);
      }
    }

    return MatchResult::none();
  }

  MatchResult matchProtocol(const std::string &protocol) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    if (!_enabled)
    {
      return MatchResult::none();
    }
    std::string name = lowercase(protocol);
    if (_protocols.count(name))
    {
      return MatchResult::bypass("protocol " + name + " is bypassed");
    }
    return MatchResult::none();
  }

  MatchResult matchApplication(const std::string &application) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    if (!_enabled)
    {
      return MatchResult::none();
    }
    std::string name = lowercase(application);
    if (_applications.count(name))
    {
      return MatchResult::bypass("application " + name + " is bypassed");
    }
    return MatchResult::none();
  }

  /// \brief Compile and append a custom rule.
  /// \throws CompileError if the pattern is invalid; the rule set is unchanged
  void addRule(Rule rule)
  {
    compileRule(rule);
    std::unique_lock<std::shared_mutex> lock(_mutex);
    TORGATE_CLOG_INFO(_log, "added bypass rule name=" << rule.name
                                                      << " type=" << ruleTypeToString(rule.type));
    _customRules.push_back(std::move(rule));
  }

  /// \brief Remove the first custom rule called \p name
  bool removeRule(const std::string &name)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = std::find_if(_customRules.begin(), _customRules.end(),
                           [&](const Rule &r) { return r.name == name; });
    if (it == _customRules.end())
    {
      return false;
    }
    _customRules.erase(it);
    return true;
  }

  std::vector<Rule> getRules() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _customRules;
  }

  /// \brief The country matcher in use, or nullptr when GeoIP is off
  std::shared_ptr<CountryMatcher> countryMatcher() const { return _countryMatcher; }

private:
  static void compileRule(Rule &rule)
  {
    switch (rule.type)
    {
    case RuleType::Domain:
      rule.compiled = compileGlob(lowercase(rule.pattern));
      break;
    case RuleType::Cidr:
    {
      auto net = network::CidrNetwork::fromString(rule.pattern);
      if (!net)
      {
        throw CompileError(rule.pattern, "not an address block");
      }
      rule.compiled = *net;
      break;
    }
    default:
      rule.compiled = std::monostate{};
      break;
    }
  }

  static std::string lowercase(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  core::ComponentLogger _log;
  const bool _enabled;

  mutable std::shared_mutex _mutex;
  std::vector<GlobMatcher> _domainPatterns;
  std::vector<network::CidrNetwork> _cidrs;
  std::unordered_set<std::string> _protocols;
  std::unordered_set<std::string> _applications;
  std::vector<Rule> _customRules;
  std::shared_ptr<CountryMatcher> _countryMatcher;
};

} // namespace bypass
} // namespace torgate
