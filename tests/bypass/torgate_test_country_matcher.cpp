// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include "bypass/mmdb_test_writer.hpp"

using namespace torgate::bypass;
using torgate::test::MmdbTestWriter;

namespace
{
MmdbTestWriter sampleWriter(int ipVersion, int recordSize)
{
  MmdbTestWriter writer(ipVersion, recordSize);
  writer.addIPv4("81.2.69.0/24", "GB");
  writer.addIPv4("1.1.1.0/24", "AU");
  writer.addIPv4("8.8.0.0/16", "US");
  writer.addIPv4("8.8.4.0/24", "CA");
  return writer;
}
} // namespace

TEST_CASE("MmdbCountryDatabase decodes country records", "[geoip][mmdb]")
{
  torgate::test::initializeTestLogging();
  auto recordSize = GENERATE(24, 28, 32);
  auto ipVersion = GENERATE(4, 6);
  INFO("record size " << recordSize << ", ip version " << ipVersion);

  const std::string path = "test_country_v" + std::to_string(ipVersion) + "_" +
                           std::to_string(recordSize) + ".mmdb";
  sampleWriter(ipVersion, recordSize).writeTo(path);

  {
    MmdbCountryDatabase db(path);
    CHECK(db.source() == path);
    CHECK(db.metadata().record_size == recordSize);
    CHECK(db.metadata().ip_version == ipVersion);
    CHECK(db.metadata().binary_format_major_version == 2);
    CHECK(db.metadata().build_epoch == 1700000000u);
    CHECK(std::string(db.metadata().database_type) == "Torgate-Test-Country");
    CHECK(db.metadata().languages.count == 1u);

    CHECK(db.lookupCountry("81.2.69.142") == "GB");
    CHECK(db.lookupCountry("1.1.1.1") == "AU");
    CHECK(db.lookupCountry("8.8.8.8") == "US");
    CHECK(db.lookupCountry("8.8.4.4") == "CA");
    CHECK(db.lookupCountry("9.9.9.9").empty());
  }

  std::filesystem::remove(path);
}

TEST_CASE("MmdbCountryDatabase IPv6 lookups", "[geoip][mmdb]")
{
  torgate::test::initializeTestLogging();
  const std::string dualPath = "test_country_dual.mmdb";
  const std::string v4Path = "test_country_v4only.mmdb";

  MmdbTestWriter writer(6, 28);
  writer.addIPv4("81.2.69.0/24", "GB");
  writer.addIPv6("2001:db8::/32", "DE");
  writer.writeTo(dualPath);
  sampleWriter(4, 24).writeTo(v4Path);

  {
    MmdbCountryDatabase dual(dualPath);
    CHECK(dual.lookupCountry("2001:db8::1") == "DE");
    CHECK(dual.lookupCountry("::81.2.69.1") == "GB");
    CHECK(dual.lookupCountry("81.2.69.1") == "GB");
    CHECK(dual.lookupCountry("2001:db9::1").empty());

    MmdbCountryDatabase v4only(v4Path);
    CHECK(v4only.lookupCountry("2001:db8::1").empty());
  }

  std::filesystem::remove(dualPath);
  std::filesystem::remove(v4Path);
}

TEST_CASE("MmdbCountryDatabase rejects bad input", "[geoip][mmdb][error]")
{
  torgate::test::initializeTestLogging();

  SECTION("Missing file")
  {
    REQUIRE_THROWS_AS(MmdbCountryDatabase("/nonexistent/db.mmdb"), MmdbError);
  }

  SECTION("Not a database")
  {
    const std::string path = "test_country_junk.mmdb";
    MmdbTestWriter::writeImage(path, std::vector<std::uint8_t>(256, 0x42));
    REQUIRE_THROWS_AS(MmdbCountryDatabase(path), MmdbError);
    std::filesystem::remove(path);
  }

  SECTION("Truncated metadata")
  {
    const std::string path = "test_country_truncated.mmdb";
    auto image = sampleWriter(4, 24).build();
    image.resize(image.size() - 10);
    MmdbTestWriter::writeImage(path, image);
    REQUIRE_THROWS_AS(MmdbCountryDatabase(path), MmdbError);
    std::filesystem::remove(path);
  }

  SECTION("Error message names the file")
  {
    try
    {
      MmdbCountryDatabase db("/nonexistent/db.mmdb");
      FAIL("open should have failed");
    }
    catch (const MmdbError &e)
    {
      CHECK_THAT(e.what(), Catch::StartsWith("MMDB: /nonexistent/db.mmdb: "));
    }
  }

  SECTION("Invalid address resolves to nothing")
  {
    const std::string path = "test_country_invalid_addr.mmdb";
    sampleWriter(4, 24).writeTo(path);
    {
      MmdbCountryDatabase db(path);
      CHECK(db.lookupCountry("999.1.1.1").empty());
      CHECK(db.lookupCountry("not-an-ip").empty());
    }
    std::filesystem::remove(path);
  }
}

TEST_CASE("CountryMatcher over an MMDB file", "[geoip][matcher]")
{
  torgate::test::initializeTestLogging();
  const std::string path = "test_country.mmdb";
  sampleWriter(6, 24).writeTo(path);

  auto matcher = CountryMatcher::open(path, {"gb", "Ca"});
  REQUIRE(matcher);
  REQUIRE(matcher->isEnabled());

  SECTION("Configured countries match")
  {
    auto gb = matcher->match("81.2.69.142");
    CHECK(gb.matched);
    CHECK(gb.country == "GB");
    CHECK(matcher->match("8.8.4.4").matched);
  }

  SECTION("Other countries resolve but do not match")
  {
    auto us = matcher->match("8.8.8.8");
    CHECK_FALSE(us.matched);
    CHECK(us.country == "US");
    CHECK(matcher->getCountry("1.1.1.1") == "AU");
  }

  SECTION("Unknown addresses resolve to nothing")
  {
    auto none = matcher->match("9.9.9.9");
    CHECK_FALSE(none.matched);
    CHECK(none.country.empty());
    CHECK(matcher->getCountry("not-an-ip").empty());
  }

  SECTION("Country set changes are idempotent")
  {
    matcher->addCountry("us");
    matcher->addCountry("US");
    CHECK(matcher->getBypassedCountries() == std::vector<std::string>{"CA", "GB", "US"});
    CHECK(matcher->match("8.8.8.8").matched);

    matcher->removeCountry("gb");
    matcher->removeCountry("GB");
    CHECK(matcher->getBypassedCountries() == std::vector<std::string>{"CA", "US"});
    CHECK_FALSE(matcher->match("81.2.69.142").matched);
  }

  SECTION("Close disables the matcher")
  {
    matcher->close();
    CHECK_FALSE(matcher->isEnabled());
    CHECK_FALSE(matcher->match("81.2.69.142").matched);
    CHECK(matcher->getCountry("81.2.69.142").empty());
    matcher->close();
  }

  std::filesystem::remove(path);
}

TEST_CASE("CountryMatcher without a database", "[geoip][matcher][disabled]")
{
  SECTION("No explicit path and nothing in the search paths")
  {
    auto matcher = CountryMatcher::open("", {"US"}, {"/nonexistent/a.mmdb", "/nonexistent/b.mmdb"});
    REQUIRE(matcher);
    CHECK_FALSE(matcher->isEnabled());
    CHECK_FALSE(matcher->match("8.8.8.8").matched);
    CHECK(matcher->getCountry("8.8.8.8").empty());
    CHECK(matcher->getBypassedCountries() == std::vector<std::string>{"US"});

    matcher->addCountry("DE");
    matcher->removeCountry("FR");
    matcher->close();
    CHECK(matcher->getBypassedCountries() == std::vector<std::string>{"DE", "US"});
  }

  SECTION("Search paths are tried in order")
  {
    const std::string path = "test_country_search.mmdb";
    sampleWriter(4, 32).writeTo(path);
    auto matcher = CountryMatcher::open("", {}, {"/nonexistent/a.mmdb", path});
    CHECK(matcher->isEnabled());
    CHECK(matcher->getCountry("1.1.1.1") == "AU");
    CHECK(matcher->getBypassedCountries().empty());
    std::filesystem::remove(path);
  }

  SECTION("An explicit path that cannot be opened raises")
  {
    REQUIRE_THROWS_AS(CountryMatcher::open("/nonexistent/GeoLite2-Country.mmdb", {"US"}),
                      MmdbError);
  }

  SECTION("Default constructed matcher is disabled")
  {
    CountryMatcher matcher;
    CHECK_FALSE(matcher.isEnabled());
    CHECK(matcher.getBypassedCountries().empty());
  }
}
