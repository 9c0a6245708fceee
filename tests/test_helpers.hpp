// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Shared test helpers for the Torgate test suite

#pragma once

#include "torgate/torgate.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

namespace torgate
{
namespace test
{

/// \brief Automatic logger initialization for tests
struct LoggerInit
{
  LoggerInit() { torgate::core::Logger::setLevel(torgate::core::Logger::Level::Debug); }
};

/// \brief Static logger initializer - call once per test executable
inline void initializeTestLogging()
{
  static LoggerInit init;
  (void)init;
}

/// \brief Remove every file in the working directory whose name starts with \p prefix
inline void removeFilesMatchingPrefix(const std::string &prefix)
{
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(".", ec))
  {
    if (entry.path().filename().string().rfind(prefix, 0) == 0)
    {
      std::filesystem::remove(entry.path(), ec);
    }
  }
}

/// \brief Write \p content to \p path, replacing any previous file
inline void writeFile(const std::string &path, const std::string &content)
{
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

/// \brief Poll \p predicate until it holds or \p timeout elapses
inline bool waitFor(const std::function<bool()> &predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
{
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (predicate())
    {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return predicate();
}

} // namespace test
} // namespace torgate
