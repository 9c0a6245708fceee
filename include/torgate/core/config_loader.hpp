// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <torgate/core/logger.hpp>
#include <torgate/parsers/minimal_toml.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace torgate
{
namespace core
{

/// \brief Loads a TOML configuration file and offers typed, dotted-key
/// access to its values.
class ConfigLoader
{
public:
  /// \brief Bind to a file on disk. Nothing is read until load() or reload().
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)) {}

  /// \brief Wrap an already parsed document (used for in-memory configs).
  explicit ConfigLoader(parsers::toml::table table) : _table(std::move(table)), _loaded(true) {}

  static ConfigLoader fromString(const std::string &document)
  {
    return ConfigLoader(parsers::toml::parse(document));
  }

  /// \brief Re-read the file. On failure the previous contents are dropped,
  /// the reason is kept in lastError() and false is returned.
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      _lastError = e.what();
      TORGATE_LOG_WARN("Failed to load configuration '" << _filename << "': " << e.what());
      return false;
    }
  }

  /// \brief Load once; throws std::runtime_error if the file cannot be parsed.
  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                               _lastError + ")");
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }
  const std::string &lastError() const { return _lastError; }
  const std::string &filename() const { return _filename; }
  const parsers::toml::table &table() const { return _table; }

  /// \brief Typed value lookup. T is one of int64_t, double, bool, std::string.
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && !node.is_table() && !node.is_array())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief String array lookup.
  /// \throws std::runtime_error if the array holds a non-string element
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    result.reserve(arr->size());
    for (const auto &elem : *arr)
    {
      if (auto *strVal = std::get_if<std::string>(&elem))
      {
        result.push_back(*strVal);
      }
      else
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
    }
    return result;
  }

  /// \brief Array-of-tables lookup ("[[a.b]]" sections), each element
  /// wrapped in its own loader for dotted access.
  /// \throws std::runtime_error if the array holds something other than tables
  std::optional<std::vector<ConfigLoader>> getTableArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<ConfigLoader> result;
    for (const auto &elem : *arr)
    {
      auto *tbl = std::get_if<std::shared_ptr<parsers::toml::table>>(&elem);
      if (!tbl || !*tbl)
      {
        throw std::runtime_error("ConfigLoader: Element at '" + key + "' is not a table");
      }
      result.emplace_back(**tbl);
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded = false;
  std::string _lastError;
};

} // namespace core
} // namespace torgate
