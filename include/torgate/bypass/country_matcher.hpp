// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <maxminddb.h>
#include <netdb.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "torgate/core/logger.hpp"

namespace torgate
{
namespace bypass
{

/// \brief Address-to-country lookup backend
class ICountryDatabase
{
public:
  virtual ~ICountryDatabase() = default;

  /// \brief Two-letter country code for \p ip, empty when unknown
  virtual std::string lookupCountry(const std::string &ip) const = 0;

  /// \brief Where the data came from, for log lines
  virtual std::string source() const = 0;
};

/// \brief A MaxMind database that could not be opened
class MmdbError : public std::runtime_error
{
public:
  explicit MmdbError(const std::string &message) : std::runtime_error("MMDB: " + message) {}
};

/// \brief ICountryDatabase over a GeoLite2/GeoIP2 Country .mmdb file, read
/// through libmaxminddb. The file is memory mapped; lookups do not lock.
class MmdbCountryDatabase : public ICountryDatabase
{
public:
  /// \throws MmdbError when the file is missing or not a MaxMind database
  explicit MmdbCountryDatabase(const std::string &path) : _path(path)
  {
    int status = MMDB_open(path.c_str(), MMDB_MODE_MMAP, &_mmdb);
    if (status != MMDB_SUCCESS)
    {
      throw MmdbError(path + ": " + MMDB_strerror(status));
    }
  }

  ~MmdbCountryDatabase() override { MMDB_close(&_mmdb); }

  MmdbCountryDatabase(const MmdbCountryDatabase &) = delete;
  MmdbCountryDatabase &operator=(const MmdbCountryDatabase &) = delete;

  std::string lookupCountry(const std::string &ip) const override
  {
    int gaiError = 0;
    int mmdbError = MMDB_SUCCESS;
    MMDB_lookup_result_s result = MMDB_lookup_string(&_mmdb, ip.c_str(), &gaiError, &mmdbError);
    if (gaiError != 0)
    {
      TORGATE_LOG_DEBUG("[geoip] invalid address " << ip << ": " << gai_strerror(gaiError));
      return "";
    }
    if (mmdbError != MMDB_SUCCESS)
    {
      TORGATE_LOG_DEBUG("[geoip] lookup failed for " << ip << ": " << MMDB_strerror(mmdbError));
      return "";
    }
    if (!result.found_entry)
    {
      return "";
    }

    MMDB_entry_data_s data{};
    int status = MMDB_get_value(&result.entry, &data, "country", "iso_code", NULL);
    if (status != MMDB_SUCCESS)
    {
      TORGATE_LOG_DEBUG("[geoip] bad record for " << ip << ": " << MMDB_strerror(status));
      return "";
    }
    if (!data.has_data || data.type != MMDB_DATA_TYPE_UTF8_STRING)
    {
      return "";
    }
    return std::string(data.utf8_string, data.data_size);
  }

  std::string source() const override { return _path; }

  const MMDB_metadata_s &metadata() const { return _mmdb.metadata; }

private:
  std::string _path;
  MMDB_s _mmdb{};
};

/// \brief Country-set membership test for addresses.
///
/// A matcher without a database is "disabled": lookups return no match and
/// country set changes are accepted but have no effect on matching.
class CountryMatcher
{
public:
  struct CountryMatch
  {
    std::string country; ///< Resolved code, empty when unknown
    bool matched = false;
  };

  static std::vector<std::string> defaultDatabasePaths()
  {
    return {"/usr/share/GeoIP/GeoLite2-Country.mmdb", "/var/lib/GeoIP/GeoLite2-Country.mmdb",
            "./GeoLite2-Country.mmdb"};
  }

  /// \brief Open \p databasePath, or the first readable default when empty.
  ///
  /// Returns a disabled matcher when no path was given and none of the
  /// \p searchPaths can be opened.
  /// \throws MmdbError when an explicitly given database cannot be opened
  static std::shared_ptr<CountryMatcher>
  open(const std::string &databasePath, const std::vector<std::string> &countries,
       const std::vector<std::string> &searchPaths = defaultDatabasePaths())
  {
    auto log = core::Logger::component("geoip");

    if (!databasePath.empty())
    {
      auto matcher = std::make_shared<CountryMatcher>(
        std::make_unique<MmdbCountryDatabase>(databasePath), countries);
      TORGATE_CLOG_INFO(log, "GeoIP matcher initialized database=" << databasePath
                                                                   << " countries="
                                                                   << countries.size());
      return matcher;
    }

    for (const auto &candidate : searchPaths)
    {
      try
      {
        auto matcher = std::make_shared<CountryMatcher>(
          std::make_unique<MmdbCountryDatabase>(candidate), countries);
        TORGATE_CLOG_INFO(log, "GeoIP matcher initialized database=" << candidate
                                                                     << " countries="
                                                                     << countries.size());
        return matcher;
      }
      catch (const MmdbError &e)
      {
        TORGATE_CLOG_DEBUG(log, "skipping " << candidate << ": " << e.what());
      }
    }

    TORGATE_CLOG_WARN(log, "GeoIP database not found, country-based bypass disabled");
    return std::make_shared<CountryMatcher>(nullptr, countries);
  }

  CountryMatcher() = default;

  CountryMatcher(std::unique_ptr<ICountryDatabase> database,
                 const std::vector<std::string> &countries)
      : _database(std::move(database))
  {
    for (const auto &c : countries)
    {
      _countries.insert(normalize(c));
    }
  }

  bool isEnabled() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _database != nullptr;
  }

  CountryMatch match(const std::string &ip) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    CountryMatch result;
    if (!_database)
    {
      return result;
    }
    result.country = _database->lookupCountry(ip);
    result.matched = !result.country.empty() && _countries.count(result.country) > 0;
    return result;
  }

  std::string getCountry(const std::string &ip) const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _database ? _database->lookupCountry(ip) : std::string();
  }

  void addCountry(const std::string &code)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _countries.insert(normalize(code));
  }

  void removeCountry(const std::string &code)
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _countries.erase(normalize(code));
  }

  /// \brief Configured codes in sorted order
  std::vector<std::string> getBypassedCountries() const
  {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return std::vector<std::string>(_countries.begin(), _countries.end());
  }

  /// \brief Release the database. The matcher is disabled afterwards.
  void close()
  {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    _database.reset();
  }

private:
  static std::string normalize(std::string code)
  {
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
  }

  mutable std::shared_mutex _mutex;
  std::unique_ptr<ICountryDatabase> _database;
  std::set<std::string> _countries;
};

} // namespace bypass
} // namespace torgate
