// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <map>

using namespace torgate::bypass;

namespace
{

class StaticCountryDatabase : public ICountryDatabase
{
public:
  explicit StaticCountryDatabase(std::map<std::string, std::string> entries)
      : _entries(std::move(entries))
  {
  }

  std::string lookupCountry(const std::string &ip) const override
  {
    auto it = _entries.find(ip);
    return it == _entries.end() ? std::string() : it->second;
  }

  std::string source() const override { return "static"; }

private:
  std::map<std::string, std::string> _entries;
};

BypassConfig makeConfig()
{
  BypassConfig config;
  config.enabled = true;
  config.domains = {"*.local", "*.htb", "example.com"};
  config.cidrs = {"10.0.0.0/8", "192.168.0.0/16", "172.16.0.0/12", "127.0.0.0/8"};
  config.protocols = {"NTP", "mdns"};
  config.applications = {"Steam"};
  return config;
}

} // namespace

TEST_CASE("BypassEngine domain matching", "[bypass][domain]")
{
  torgate::test::initializeTestLogging();
  BypassEngine engine(makeConfig());

  SECTION("Configured patterns bypass")
  {
    for (const char *name : {"test.local", "sub.test.local", "box.htb", "example.com"})
    {
      auto result = engine.matchDomain(name);
      INFO(name);
      CHECK(result.matched);
      CHECK(result.action == Action::Bypass);
      CHECK_FALSE(result.rule.has_value());
    }
  }

  SECTION("Names outside the patterns do not match")
  {
    for (const char *name : {"local", "google.com", "sub.example.com", "example.com.evil"})
    {
      INFO(name);
      CHECK_FALSE(engine.matchDomain(name).matched);
    }
  }

  SECTION("Matching is case-insensitive")
  {
    CHECK(engine.matchDomain("PRINTER.LOCAL").matched);
    CHECK(engine.matchDomain("Example.COM").matched);
  }

  SECTION("Reason names the pattern")
  {
    auto result = engine.matchDomain("nas.local");
    CHECK(result.reason == "matches pattern ^.*\\.local$");
  }
}

TEST_CASE("BypassEngine IP matching", "[bypass][ip]")
{
  BypassEngine engine(makeConfig());

  for (const char *ip : {"10.1.2.3", "192.168.1.1", "172.16.5.4", "172.31.255.255", "127.0.0.1"})
  {
    INFO(ip);
    auto result = engine.matchIP(ip);
    CHECK(result.matched);
    CHECK(result.action == Action::Bypass);
  }

  CHECK_FALSE(engine.matchIP("8.8.8.8").matched);
  CHECK_FALSE(engine.matchIP("172.32.0.1").matched);
  CHECK_FALSE(engine.matchIP("not-an-ip").matched);
  CHECK(engine.matchIP("10.1.2.3").reason == "matches CIDR 10.0.0.0/8");
}

TEST_CASE("BypassEngine matches IPv4-mapped peers", "[bypass][ip]")
{
  auto config = makeConfig();
  config.customRules.emplace_back("cgnat", RuleType::Cidr, "100.64.0.0/10", Action::Block);
  BypassEngine engine(config);

  auto lan = engine.matchIP("::ffff:10.1.2.3");
  CHECK(lan.matched);
  CHECK(lan.action == Action::Bypass);
  CHECK(lan.reason == "matches CIDR 10.0.0.0/8");
  CHECK(engine.matchIP("::ffff:127.0.0.1").matched);
  CHECK(engine.matchIP("::ffff:100.64.0.9").action == Action::Block);
  CHECK_FALSE(engine.matchIP("::ffff:8.8.8.8").matched);
}

TEST_CASE("BypassEngine protocol and application matching", "[bypass][protocol]")
{
  BypassEngine engine(makeConfig());

  CHECK(engine.matchProtocol("ntp").matched);
  CHECK(engine.matchProtocol("MDNS").matched);
  CHECK(engine.matchProtocol("NTP").reason == "protocol ntp is bypassed");
  CHECK_FALSE(engine.matchProtocol("http").matched);

  CHECK(engine.matchApplication("steam").matched);
  CHECK(engine.matchApplication("STEAM").action == Action::Bypass);
  CHECK_FALSE(engine.matchApplication("firefox").matched);
}

TEST_CASE("Disabled BypassEngine matches nothing", "[bypass][disabled]")
{
  auto config = makeConfig();
  config.enabled = false;
  config.customRules.emplace_back("lan", RuleType::Domain, "*.lan", Action::Bypass);
  BypassEngine engine(config);

  CHECK_FALSE(engine.isEnabled());
  CHECK_FALSE(engine.matchDomain("test.local").matched);
  CHECK_FALSE(engine.matchDomain("printer.lan").matched);
  CHECK_FALSE(engine.matchIP("10.0.0.1").matched);
  CHECK_FALSE(engine.matchProtocol("ntp").matched);
  CHECK_FALSE(engine.matchApplication("steam").matched);
}

TEST_CASE("BypassEngine skips malformed configuration entries", "[bypass][config]")
{
  BypassConfig config;
  config.enabled = true;
  config.cidrs = {"10.0.0.0/8", "300.1.1.1/8", "garbage", "192.168.0.0/16"};
  config.customRules.emplace_back("broken", RuleType::Cidr, "10.0.0.0/99", Action::Bypass);
  config.customRules.emplace_back("ok", RuleType::Cidr, "100.64.0.0/10", Action::Block);

  BypassEngine engine(config);

  CHECK(engine.matchIP("10.9.9.9").matched);
  CHECK(engine.matchIP("192.168.3.3").matched);
  REQUIRE(engine.getRules().size() == 1);
  CHECK(engine.getRules()[0].name == "ok");
  CHECK(engine.matchIP("100.64.1.1").action == Action::Block);
}

TEST_CASE("BypassEngine custom rules", "[bypass][rules]")
{
  BypassEngine engine(makeConfig());

  SECTION("Add, match, remove")
  {
    engine.addRule(Rule("tracker", RuleType::Domain, "*.Tracker.Example", Action::Block,
                        "known tracker"));

    auto result = engine.matchDomain("ads.tracker.example");
    REQUIRE(result.matched);
    CHECK(result.action == Action::Block);
    REQUIRE(result.rule.has_value());
    CHECK(result.rule->name == "tracker");
    CHECK(result.reason == "known tracker");

    CHECK(engine.removeRule("tracker"));
    CHECK_FALSE(engine.matchDomain("ads.tracker.example").matched);
  }

  SECTION("Removing an unknown rule reports false")
  {
    CHECK_FALSE(engine.removeRule("missing"));
  }

  SECTION("Configured patterns take precedence over custom rules")
  {
    engine.addRule(Rule("force-tor", RuleType::Domain, "*.local", Action::Tor));
    auto result = engine.matchDomain("printer.local");
    CHECK(result.action == Action::Bypass);
    CHECK_FALSE(result.rule.has_value());

    engine.addRule(Rule("block-10", RuleType::Cidr, "10.0.0.0/8", Action::Block));
    CHECK(engine.matchIP("10.0.0.1").action == Action::Bypass);
  }

  SECTION("Custom CIDR rule applies after configured blocks")
  {
    engine.addRule(Rule("cgnat", RuleType::Cidr, "100.64.0.0/10", Action::Tor));
    auto result = engine.matchIP("100.64.0.5");
    REQUIRE(result.matched);
    CHECK(result.action == Action::Tor);
  }

  SECTION("First matching custom rule wins")
  {
    engine.addRule(Rule("first", RuleType::Domain, "*.corp", Action::Block));
    engine.addRule(Rule("second", RuleType::Domain, "*.corp", Action::Bypass));
    CHECK(engine.matchDomain("intranet.corp").rule->name == "first");
  }

  SECTION("Invalid rule raises and leaves the rule set unchanged")
  {
    auto before = engine.getRules().size();
    REQUIRE_THROWS_AS(engine.addRule(Rule("bad", RuleType::Cidr, "not-a-cidr", Action::Bypass)),
                      CompileError);
    CHECK(engine.getRules().size() == before);
  }

  SECTION("Duplicate names: only the first is removed")
  {
    engine.addRule(Rule("dup", RuleType::Domain, "a.test", Action::Block));
    engine.addRule(Rule("dup", RuleType::Domain, "b.test", Action::Block));
    CHECK(engine.removeRule("dup"));
    CHECK_FALSE(engine.matchDomain("a.test").matched);
    CHECK(engine.matchDomain("b.test").matched);
  }

  SECTION("Uncompiled rule types are stored")
  {
    engine.addRule(Rule("dns", RuleType::Port, "53", Action::Bypass));
    auto rules = engine.getRules();
    REQUIRE(rules.size() == 1);
    CHECK_FALSE(rules[0].isCompiled());
  }

  SECTION("getRules returns a copy")
  {
    engine.addRule(Rule("x", RuleType::Domain, "x.test", Action::Block));
    auto rules = engine.getRules();
    rules.clear();
    CHECK(engine.getRules().size() == 1);
  }
}

TEST_CASE("BypassEngine consults the country matcher", "[bypass][geoip]")
{
  auto matcher = std::make_shared<CountryMatcher>(
    std::make_unique<StaticCountryDatabase>(
      std::map<std::string, std::string>{{"81.2.69.142", "GB"}, {"1.1.1.1", "AU"}}),
    std::vector<std::string>{"gb"});

  auto config = makeConfig();
  config.customRules.emplace_back("au", RuleType::Cidr, "1.1.1.0/24", Action::Block);
  BypassEngine engine(config, matcher);

  auto gb = engine.matchIP("81.2.69.142");
  REQUIRE(gb.matched);
  CHECK(gb.action == Action::Bypass);
  CHECK(gb.reason == "matches country GB");

  CHECK(engine.matchIP("1.1.1.1").action == Action::Block);
  CHECK(engine.countryMatcher() == matcher);

  matcher->addCountry("AU");
  CHECK(engine.matchIP("1.1.1.1").action == Action::Bypass);
}

TEST_CASE("BypassEngine with GeoIP enabled but no database", "[bypass][geoip]")
{
  auto config = makeConfig();
  config.geoip.enabled = true;
  config.geoip.databasePath = "/nonexistent/GeoLite2-Country.mmdb";
  config.geoip.countries = {"US"};

  BypassEngine engine(config);

  CHECK(engine.countryMatcher() == nullptr);
  CHECK(engine.matchIP("10.0.0.1").matched);
  CHECK_FALSE(engine.matchIP("8.8.8.8").matched);
}

TEST_CASE("BypassEngine concurrent reads and rule changes", "[bypass][concurrency]")
{
  BypassEngine engine(makeConfig());
  std::atomic<bool> stop{false};
  std::atomic<int> mismatches{0};

  std::vector<std::thread> readers;
  for (int i = 0; i < 4; ++i)
  {
    readers.emplace_back(
      [&]()
      {
        while (!stop)
        {
          if (!engine.matchDomain("nas.local").matched || engine.matchIP("8.8.8.8").matched)
          {
            ++mismatches;
          }
        }
      });
  }

  for (int i = 0; i < 200; ++i)
  {
    engine.addRule(Rule("r" + std::to_string(i), RuleType::Domain, "*.x" + std::to_string(i),
                        Action::Block));
  }
  for (int i = 0; i < 200; ++i)
  {
    engine.removeRule("r" + std::to_string(i));
  }
  stop = true;
  for (auto &t : readers)
  {
    t.join();
  }

  CHECK(mismatches == 0);
  CHECK(engine.getRules().empty());
}
