// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

/// \file torgate_test_threadpool.cpp
/// \brief Worker pool behaviour relied on by the DNS listeners

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <set>
#include <stdexcept>
#include <vector>

using torgate::core::ThreadPool;
using namespace torgate::network::dns;

namespace
{
/// Blocks the single worker of a pool until released
struct Gate
{
  std::atomic<bool> entered{false};
  std::atomic<bool> open{false};

  void hold()
  {
    entered = true;
    while (!open)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
  }
};

std::string thrownMessage(const std::function<void()> &fn)
{
  try
  {
    fn();
  }
  catch (const std::runtime_error &e)
  {
    return e.what();
  }
  return {};
}
} // namespace

TEST_CASE("ThreadPool answers queued DNS work", "[threadpool]")
{
  ThreadPool pool(2, 4);
  std::mutex mutex;
  std::set<std::uint16_t> answered;

  for (std::uint16_t id = 1; id <= 20; ++id)
  {
    pool.enqueue(
      [&, id]()
      {
        auto query = DnsMessage::buildQuery(DnsQuestion("pool.example", DnsType::A), id);
        auto reply = DnsMessage::makeFailure(DnsMessage::parse(query), DnsResponseCode::REFUSED);
        std::lock_guard<std::mutex> lock(mutex);
        answered.insert(reply.header.id);
      });
  }

  REQUIRE(torgate::test::waitFor(
    [&]()
    {
      std::lock_guard<std::mutex> lock(mutex);
      return answered.size() == 20;
    }));
}

TEST_CASE("ThreadPool enqueueWithResult forwards arguments", "[threadpool][future]")
{
  ThreadPool pool(1, 2);

  auto name = pool.enqueueWithResult(
    [](const std::string &domain, DnsType type) { return domain + "/" + typeToString(type); },
    std::string("example.com"), DnsType::AAAA);
  auto sum = pool.enqueueWithResult([](int a, int b) { return a * b; }, 6, 7);

  CHECK(name.get() == "example.com/AAAA");
  CHECK(sum.get() == 42);
}

TEST_CASE("ThreadPool adds workers while tasks wait", "[threadpool][scaling]")
{
  std::atomic<int> finished{0};
  ThreadPool pool(1, 6);

  for (int i = 0; i < 6; ++i)
  {
    pool.enqueue(
      [&finished]()
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        ++finished;
      });
  }

  CHECK(pool.getTotalThreadCount() > 1);
  CHECK(pool.getTotalThreadCount() <= 6u);
  REQUIRE(torgate::test::waitFor([&]() { return finished.load() == 6; }));
}

TEST_CASE("ThreadPool rejects work beyond its queue", "[threadpool][overflow]")
{
  Gate gate;
  ThreadPool pool(1, 1, 2);

  pool.enqueue([&gate]() { gate.hold(); });
  REQUIRE(torgate::test::waitFor([&]() { return gate.entered.load(); }));

  pool.enqueue([]() {});
  pool.enqueue([]() {});
  CHECK(pool.getPendingTaskCount() == 2);

  CHECK(thrownMessage([&]() { pool.enqueue([]() {}); }) == "ThreadPool task queue is full");
  CHECK_FALSE(pool.tryEnqueue([]() {}));

  gate.open = true;
  REQUIRE(torgate::test::waitFor([&]() { return pool.getPendingTaskCount() == 0; }));
  CHECK(pool.tryEnqueue([]() {}));
}

TEST_CASE("ThreadPool routes task failures to the error handler", "[threadpool][exception]")
{
  std::mutex mutex;
  std::vector<std::string> errors;

  ThreadPool pool(1, 2, 16,
                  [&](std::exception_ptr error)
                  {
                    try
                    {
                      std::rethrow_exception(error);
                    }
                    catch (const DnsParseException &e)
                    {
                      std::lock_guard<std::mutex> lock(mutex);
                      errors.emplace_back(e.what());
                    }
                  });

  pool.enqueue(
    []()
    {
      std::vector<std::uint8_t> truncated{0x00, 0x01, 0x01};
      DnsMessage::parse(truncated);
    });

  REQUIRE(torgate::test::waitFor(
    [&]()
    {
      std::lock_guard<std::mutex> lock(mutex);
      return errors.size() == 1;
    }));
  CHECK(errors.front().find("DNS Parse Error") == 0);
}

TEST_CASE("ThreadPool worker survives a throwing task", "[threadpool][exception]")
{
  torgate::test::initializeTestLogging();
  ThreadPool pool(1, 1);

  pool.enqueue([]() { throw std::runtime_error("handler blew up"); });
  auto after = pool.enqueueWithResult([]() { return std::string("still serving"); });

  CHECK(after.get() == "still serving");
  CHECK(pool.getTotalThreadCount() == 1);
}

TEST_CASE("ThreadPool keeps serving when the error handler throws", "[threadpool][exception]")
{
  torgate::test::initializeTestLogging();
  std::atomic<int> handled{0};
  ThreadPool pool(1, 1, 16,
                  [&handled](std::exception_ptr)
                  {
                    ++handled;
                    throw std::logic_error("error handler failed");
                  });

  pool.enqueue([]() { throw std::runtime_error("upstream timed out"); });
  pool.enqueue([]() { throw std::runtime_error("upstream refused"); });
  auto after = pool.enqueueWithResult([]() { return typeToString(DnsType::PTR); });

  CHECK(after.get() == "PTR");
  CHECK(handled == 2);
  CHECK(pool.getTotalThreadCount() == 1);
  REQUIRE(torgate::test::waitFor([&]() { return pool.getActiveThreadCount() == 0; }));
}

TEST_CASE("ThreadPool future carries the task exception", "[threadpool][future][exception]")
{
  ThreadPool pool(1, 2);

  auto future = pool.enqueueWithResult(
    []() -> std::string
    {
      auto empty = std::vector<std::uint8_t>{};
      return std::to_string(DnsMessage::readId(empty));
    });

  CHECK_THROWS_AS(future.get(), DnsParseException);
}

TEST_CASE("ThreadPool shutdown drains the queue", "[threadpool][lifecycle]")
{
  std::atomic<int> drained{0};

  {
    Gate gate;
    ThreadPool pool(1, 1, 8);
    pool.enqueue([&gate]() { gate.hold(); });
    REQUIRE(torgate::test::waitFor([&]() { return gate.entered.load(); }));
    for (int i = 0; i < 4; ++i)
    {
      pool.enqueue([&drained]() { ++drained; });
    }
    gate.open = true;
  }

  CHECK(drained == 4);
}

TEST_CASE("ThreadPool shutdown is idempotent", "[threadpool][lifecycle]")
{
  ThreadPool pool(2, 2);
  pool.shutdown();
  pool.shutdown();

  CHECK(pool.getTotalThreadCount() == 0);
  CHECK(thrownMessage([&]() { pool.enqueue([]() {}); }).find("shutting down") !=
        std::string::npos);
  CHECK_FALSE(pool.tryEnqueue([]() {}));
}
