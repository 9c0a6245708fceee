// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "torgate/bypass/glob.hpp"
#include "torgate/network/ip_utils.hpp"

namespace torgate
{
namespace bypass
{

/// \brief What a rule's pattern is matched against
enum class RuleType
{
  Domain,
  Cidr,
  Port,
  Protocol,
  Application,
  GeoIP
};

/// \brief What to do with traffic a rule matches
enum class Action
{
  Bypass, ///< Route directly
  Block,  ///< Refuse
  Tor     ///< Force through Tor
};

inline const char *ruleTypeToString(RuleType type)
{
  switch (type)
  {
  case RuleType::Domain:
    return "domain";
  case RuleType::Cidr:
    return "cidr";
  case RuleType::Port:
    return "port";
  case RuleType::Protocol:
    return "protocol";
  case RuleType::Application:
    return "application";
  case RuleType::GeoIP:
    return "geoip";
  }
  return "unknown";
}

inline std::optional<RuleType> parseRuleType(const std::string &name)
{
  if (name == "domain")
    return RuleType::Domain;
  if (name == "cidr")
    return RuleType::Cidr;
  if (name == "port")
    return RuleType::Port;
  if (name == "protocol")
    return RuleType::Protocol;
  if (name == "application")
    return RuleType::Application;
  if (name == "geoip")
    return RuleType::GeoIP;
  return std::nullopt;
}

inline const char *actionToString(Action action)
{
  switch (action)
  {
  case Action::Bypass:
    return "bypass";
  case Action::Block:
    return "block";
  case Action::Tor:
    return "tor";
  }
  return "unknown";
}

inline std::optional<Action> parseAction(const std::string &name)
{
  if (name == "bypass")
    return Action::Bypass;
  if (name == "block")
    return Action::Block;
  if (name == "tor")
    return Action::Tor;
  return std::nullopt;
}

/// \brief Compiled form of a rule pattern. Domain rules carry a GlobMatcher,
/// cidr rules a CidrNetwork, every other type nothing.
using CompiledMatcher = std::variant<std::monostate, GlobMatcher, network::CidrNetwork>;

/// \brief A named custom classification rule
struct Rule
{
  std::string name;
  RuleType type = RuleType::Domain;
  std::string pattern;
  Action action = Action::Bypass;
  std::string description;
  CompiledMatcher compiled;

  Rule() = default;
  Rule(std::string n, RuleType t, std::string p, Action a, std::string d = "")
      : name(std::move(n)), type(t), pattern(std::move(p)), action(a), description(std::move(d))
  {
  }

  bool isCompiled() const { return !std::holds_alternative<std::monostate>(compiled); }
};

/// \brief Outcome of a single classification query
struct MatchResult
{
  bool matched = false;
  std::optional<Rule> rule; ///< Set when a custom rule decided
  Action action = Action::Tor;
  std::string reason;

  static MatchResult none() { return MatchResult{}; }

  static MatchResult bypass(std::string why)
  {
    MatchResult result;
    result.matched = true;
    result.action = Action::Bypass;
    result.reason = std::move(why);
    return result;
  }

  static MatchResult fromRule(const Rule &r)
  {
    MatchResult result;
    result.matched = true;
    result.rule = r;
    result.action = r.action;
    result.reason = r.description;
    return result;
  }
};

} // namespace bypass
} // namespace torgate
