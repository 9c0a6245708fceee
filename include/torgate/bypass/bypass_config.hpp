// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <string>
#include <vector>

#include "torgate/bypass/rule.hpp"

namespace torgate
{
namespace bypass
{

/// \brief [bypass.geoip]
struct GeoIPConfig
{
  bool enabled = false;
  std::string databasePath; ///< Empty: search the default locations
  std::vector<std::string> countries;
};

/// \brief [bypass] plus its [[bypass.rules]] entries
struct BypassConfig
{
  bool enabled = false;
  std::vector<std::string> domains;      ///< Glob patterns, always bypass
  std::vector<std::string> cidrs;        ///< Address blocks, always bypass
  std::vector<std::string> protocols;    ///< Protocol names, case-insensitive
  std::vector<std::string> applications; ///< Application names, case-insensitive
  GeoIPConfig geoip;
  std::vector<Rule> customRules; ///< Uncompiled; compiled by BypassEngine
};

} // namespace bypass
} // namespace torgate
