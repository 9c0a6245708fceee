// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include "torgate_test_net_utils.hpp"
#include <catch2/catch.hpp>

#include <set>

using namespace torgate::network;
using namespace torgate::network::dns;
using torgate::common::ConfigurationError;
using torgate::common::LifecycleError;
using torgate::common::LifecycleState;

namespace
{
FakeDnsConfig smallConfig()
{
  FakeDnsConfig config;
  config.listenAddress = "127.0.0.1:0";
  config.workers.minThreads = 1;
  config.workers.maxThreads = 2;
  config.workers.queueSize = 16;
  return config;
}

DnsPacket ask(FakeDnsServer &server, const std::string &name, DnsType type, std::uint16_t id = 42)
{
  auto wire = DnsMessage::buildQuery(DnsQuestion(name, type), id);
  return DnsMessage::parse(server.handleQuery(wire.data(), wire.size()));
}
} // namespace

TEST_CASE("FakeDNS allocation", "[fakedns][alloc]")
{
  torgate::test::initializeTestLogging();
  FakeDnsServer server(smallConfig());

  SECTION("Sequential addresses from the start of the block")
  {
    CHECK(server.getFakeIP("example.com") == "198.18.0.1");
    CHECK(server.getFakeIP("example.org") == "198.18.0.2");
    CHECK(server.getMappingCount() == 2);
  }

  SECTION("Repeated lookups are stable")
  {
    auto first = server.getFakeIP("example.com");
    CHECK(server.getFakeIP("example.com") == first);
    CHECK(server.getFakeIP("EXAMPLE.com.") == first);
    CHECK(server.getMappingCount() == 1);
  }

  SECTION("Reverse mapping uses the canonical name")
  {
    auto ip = server.getFakeIP("Example.COM");
    CHECK(server.getDomainForIP(ip) == "example.com.");
    CHECK(server.getDomainForIP("198.18.9.9").empty());
  }

  SECTION("Block membership")
  {
    CHECK(server.isFakeIP("198.18.0.0"));
    CHECK(server.isFakeIP("198.18.0.1"));
    CHECK(server.isFakeIP("198.19.255.255"));
    CHECK_FALSE(server.isFakeIP("198.20.0.0"));
    CHECK_FALSE(server.isFakeIP("10.0.0.1"));
    CHECK_FALSE(server.isFakeIP("not-an-ip"));
  }

  SECTION("IPv4-mapped form of an allocated address")
  {
    auto ip = server.getFakeIP("example.com.");
    CHECK(ip == "198.18.0.1");
    CHECK(server.isFakeIP("::ffff:" + ip));
    CHECK_FALSE(server.isFakeIP("::ffff:10.0.0.1"));
  }

  SECTION("Cleanup keeps every mapping")
  {
    server.getFakeIP("example.com");
    server.cleanupOldMappings(std::chrono::seconds(0));
    CHECK(server.getMappingCount() == 1);
  }
}

TEST_CASE("FakeDNS name helpers", "[fakedns][names]")
{
  CHECK(FakeDnsServer::canonicalName("Example.COM") == "example.com.");
  CHECK(FakeDnsServer::canonicalName("example.com.") == "example.com.");

  CHECK(FakeDnsServer::ptrToIp("1.0.18.198.in-addr.arpa.") == "198.18.0.1");
  CHECK(FakeDnsServer::ptrToIp("1.0.18.198.IN-ADDR.ARPA") == "198.18.0.1");
  CHECK(FakeDnsServer::ptrToIp("0.18.198.in-addr.arpa.").empty());
  CHECK(FakeDnsServer::ptrToIp("example.com.").empty());
  CHECK(FakeDnsServer::ptrToIp("").empty());
}

TEST_CASE("FakeDNS pool exhaustion", "[fakedns][alloc]")
{
  auto config = smallConfig();
  config.subnet = "10.99.0.0/30";
  FakeDnsServer server(config);

  CHECK(server.getFakeIP("a.test") == "10.99.0.1");
  CHECK(server.getFakeIP("b.test") == "10.99.0.2");
  CHECK(server.getFakeIP("c.test") == "10.99.0.3");
  CHECK_THROWS_AS(server.getFakeIP("d.test"), ConfigurationError);

  // Existing mappings still resolve
  CHECK(server.getFakeIP("a.test") == "10.99.0.1");

  auto reply = ask(server, "d.test", DnsType::A);
  CHECK(reply.header.rcode == DnsResponseCode::SERVFAIL);
  CHECK(reply.answers.empty());
}

TEST_CASE("FakeDNS rejects unusable configuration", "[fakedns][config]")
{
  for (const char *subnet : {"198.18.0.0", "fd00::/8", "garbage", "198.18.0.0/40"})
  {
    INFO(subnet);
    auto config = smallConfig();
    config.subnet = subnet;
    CHECK_THROWS_AS(FakeDnsServer(config), ConfigurationError);
  }

  auto config = smallConfig();
  config.listenAddress = "localhost";
  CHECK_THROWS_AS(FakeDnsServer(config), ConfigurationError);
}

TEST_CASE("FakeDNS query handling", "[fakedns][query]")
{
  torgate::test::initializeTestLogging();
  FakeDnsServer server(smallConfig());

  SECTION("A query allocates and answers authoritatively")
  {
    auto reply = ask(server, "check.torproject.org", DnsType::A, 0x5151);
    CHECK(reply.header.id == 0x5151);
    CHECK(reply.header.qr);
    CHECK(reply.header.aa);
    CHECK(reply.header.rcode == DnsResponseCode::NOERROR);
    REQUIRE(reply.answers.size() == 1);
    CHECK(reply.answers[0].ttl == 60);
    CHECK(DnsMessage::aRecordAddress(reply.answers[0]) == "198.18.0.1");
    CHECK(server.getDomainForIP("198.18.0.1") == "check.torproject.org.");
  }

  SECTION("AAAA query gets an empty answer")
  {
    auto reply = ask(server, "example.com", DnsType::AAAA);
    CHECK(reply.header.rcode == DnsResponseCode::NOERROR);
    CHECK(reply.header.aa);
    CHECK(reply.answers.empty());
    CHECK(server.getMappingCount() == 0);
  }

  SECTION("PTR query returns the mapped name")
  {
    server.getFakeIP("example.com");
    auto reply = ask(server, "1.0.18.198.in-addr.arpa", DnsType::PTR);
    REQUIRE(reply.answers.size() == 1);
    CHECK(reply.answers[0].type == DnsType::PTR);
    CHECK(DnsMessage::ptrRecordTarget(reply.answers[0]) == "example.com");

    auto unknown = ask(server, "7.7.18.198.in-addr.arpa", DnsType::PTR);
    CHECK(unknown.header.rcode == DnsResponseCode::NOERROR);
    CHECK(unknown.answers.empty());
  }

  SECTION("Other types get an empty answer")
  {
    auto reply = ask(server, "example.com", DnsType::MX);
    CHECK(reply.answers.empty());
    CHECK(reply.header.rcode == DnsResponseCode::NOERROR);
  }

  SECTION("Malformed datagram gets FORMERR")
  {
    std::vector<std::uint8_t> junk{0xAB, 0xCD, 0x01, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0, 9, 'x'};
    auto wire = server.handleQuery(junk.data(), junk.size());
    REQUIRE(wire.size() == 12);
    auto header = DnsMessage::parseHeaderOnly(wire.data(), wire.size());
    CHECK(header.id == 0xABCD);
    CHECK(header.rcode == DnsResponseCode::FORMERR);

    std::vector<std::uint8_t> tiny{1, 2, 3};
    CHECK(server.handleQuery(tiny.data(), tiny.size()).empty());
  }

  SECTION("Query without a question gets SERVFAIL")
  {
    std::vector<std::uint8_t> empty{0x00, 0x09, 0x01, 0x00, 0, 0, 0, 0, 0, 0, 0, 0};
    auto reply = DnsMessage::parse(server.handleQuery(empty.data(), empty.size()));
    CHECK(reply.header.id == 9);
    CHECK(reply.header.rcode == DnsResponseCode::SERVFAIL);
  }
}

TEST_CASE("FakeDNS concurrent allocation", "[fakedns][concurrency]")
{
  FakeDnsServer server(smallConfig());
  std::vector<std::thread> threads;
  std::mutex mutex;
  std::set<std::string> addresses;

  for (int t = 0; t < 4; ++t)
  {
    threads.emplace_back(
      [&, t]()
      {
        for (int i = 0; i < 100; ++i)
        {
          auto ip = server.getFakeIP("host" + std::to_string(t * 100 + i) + ".test");
          std::lock_guard<std::mutex> lock(mutex);
          addresses.insert(ip);
        }
      });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  CHECK(addresses.size() == 400);
  CHECK(server.getMappingCount() == 400);
}

TEST_CASE("FakeDNS over UDP", "[fakedns][udp]")
{
  torgate::test::initializeTestLogging();
  FakeDnsServer server(smallConfig());

  CHECK(server.getState() == LifecycleState::Created);
  server.start();
  CHECK(server.getState() == LifecycleState::Running);
  REQUIRE(server.boundPort() != 0);
  CHECK_THROWS_AS(server.start(), LifecycleError);

  auto query = DnsMessage::buildQuery(DnsQuestion("onion.example", DnsType::A), 0x0101);
  auto raw = testnet::udpRoundTrip(server.boundPort(), query, std::chrono::milliseconds(2000));
  REQUIRE(raw.has_value());
  auto reply = DnsMessage::parse(*raw);
  CHECK(reply.header.id == 0x0101);
  CHECK(reply.header.aa);
  REQUIRE(reply.answers.size() == 1);
  CHECK(DnsMessage::aRecordAddress(reply.answers[0]) == "198.18.0.1");

  server.stop();
  CHECK(server.getState() == LifecycleState::Stopped);
  server.stop();
  CHECK(server.getState() == LifecycleState::Stopped);
}
