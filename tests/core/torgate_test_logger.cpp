// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <vector>

using torgate::core::Logger;

namespace
{
std::string readAll(const std::string &path)
{
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), {});
}
} // namespace

TEST_CASE("Logger Basic Levels", "[logger][levels]")
{
  torgate::test::removeFilesMatchingPrefix("testlog.");

  Logger::init(Logger::Level::Trace, "testlog", false);
  TORGATE_LOG_TRACE("Trace message");
  TORGATE_LOG_DEBUG("Debug message");
  TORGATE_LOG_INFO("Info message");
  TORGATE_LOG_WARN("Warn message");
  TORGATE_LOG_ERROR("Error message");
  TORGATE_LOG_FATAL("Fatal message");
  Logger::shutdown();

  std::string logFile = "testlog." + Logger::currentDate() + ".log";
  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') >= 6);
  torgate::test::removeFilesMatchingPrefix("testlog.");
}

TEST_CASE("Logger filters below the minimum level", "[logger][levels]")
{
  torgate::test::removeFilesMatchingPrefix("filterlog.");

  Logger::init(Logger::Level::Warning, "filterlog", false);
  TORGATE_LOG_DEBUG("hidden debug");
  TORGATE_LOG_INFO("hidden info");
  TORGATE_LOG_WARN("visible warning");
  Logger::shutdown();

  std::string content = readAll("filterlog." + Logger::currentDate() + ".log");
  REQUIRE(content.find("visible warning") != std::string::npos);
  REQUIRE(content.find("hidden") == std::string::npos);
  torgate::test::removeFilesMatchingPrefix("filterlog.");
}

TEST_CASE("Logger Async Logging", "[logger][async]")
{
  torgate::test::removeFilesMatchingPrefix("asynclog.");

  Logger::init(Logger::Level::Info, "asynclog", true);
  for (int i = 0; i < 100; ++i)
  {
    TORGATE_LOG_INFO("Async message " << i);
  }
  Logger::shutdown();

  std::string logFile = "asynclog." + Logger::currentDate() + ".log";
  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') >= 100);
  torgate::test::removeFilesMatchingPrefix("asynclog.");
}

TEST_CASE("Logger Thread Safety", "[logger][threaded]")
{
  torgate::test::removeFilesMatchingPrefix("threadlog.");

  Logger::init(Logger::Level::Info, "threadlog", true);
  const int threads = 10;
  const int messagesPerThread = 50;
  std::vector<std::thread> workers;

  for (int i = 0; i < threads; ++i)
  {
    workers.emplace_back(
      [i]()
      {
        for (int j = 0; j < messagesPerThread; ++j)
        {
          TORGATE_LOG_INFO("Thread " << i << " message " << j);
        }
      });
  }
  for (auto &t : workers)
  {
    t.join();
  }
  Logger::shutdown();

  std::string logFile = "threadlog." + Logger::currentDate() + ".log";
  std::ifstream in(logFile);
  REQUIRE(in.is_open());
  REQUIRE(std::count(std::istreambuf_iterator<char>(in), {}, '\n') >= threads * messagesPerThread);
  torgate::test::removeFilesMatchingPrefix("threadlog.");
}

TEST_CASE("Logger component prefix and external handler", "[logger][component]")
{
  std::mutex mutex;
  std::vector<std::string> raw;
  std::vector<std::string> formatted;

  Logger::init(Logger::Level::Debug);
  Logger::setExternalHandler(
    [&](Logger::Level, const std::string &line, const std::string &message)
    {
      std::lock_guard<std::mutex> lock(mutex);
      formatted.push_back(line);
      raw.push_back(message);
    });

  auto log = Logger::component("fakedns");
  TORGATE_CLOG_INFO(log, "allocated " << "198.18.0.1");
  log.warning("pool low");

  Logger::clearExternalHandler();
  Logger::shutdown();

  REQUIRE(raw.size() == 2);
  REQUIRE(raw[0] == "[fakedns] allocated 198.18.0.1");
  REQUIRE(raw[1] == "[fakedns] pool low");
  REQUIRE(formatted[0].find("[INFO]") != std::string::npos);
  REQUIRE(formatted[1].find("[WARN]") != std::string::npos);
}

TEST_CASE("Logger custom format", "[logger][format]")
{
  std::vector<std::string> lines;
  Logger::init(Logger::Level::Info);
  Logger::setExternalHandler([&](Logger::Level, const std::string &line, const std::string &)
                             { lines.push_back(line); });
  Logger::setLogFormat("%L|%F|%m");
  TORGATE_LOG_INFO("formatted");
  Logger::setLogFormat("[%T] [%L] %m");
  Logger::clearExternalHandler();
  Logger::shutdown();

  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0] == "INFO|torgate_test_logger.cpp|formatted\n");
}

TEST_CASE("Logger level names", "[logger][levels]")
{
  REQUIRE(Logger::parseLevel("DEBUG") == Logger::Level::Debug);
  REQUIRE(Logger::parseLevel("warn") == Logger::Level::Warning);
  REQUIRE(Logger::parseLevel("Warning") == Logger::Level::Warning);
  REQUIRE_FALSE(Logger::parseLevel("verbose").has_value());
  REQUIRE(std::string(Logger::levelToString(Logger::Level::Fatal)) == "FATAL");
}
