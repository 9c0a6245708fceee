// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "torgate/core/logger.hpp"
#include "torgate/crypto/secure_rng.hpp"
#include "torgate/network/dns/dns_message.hpp"
#include "torgate/network/dns/dns_transport.hpp"
#include "torgate/network/endpoint.hpp"

namespace torgate
{
namespace network
{

/// \brief One leak self-test outcome
struct LeakTest
{
  std::string name;
  bool passed = false;
  std::string details;
  std::string error;
};

/// \brief Aggregated leak self-test report
struct LeakCheckResult
{
  std::chrono::system_clock::time_point timestamp;
  bool passed = false;
  std::vector<LeakTest> tests;

  std::string toString() const
  {
    std::ostringstream oss;
    std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&t, &tm);
    oss << "Leak check at " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ": "
        << (passed ? "PASSED" : "FAILED") << "\n";
    for (const auto &test : tests)
    {
      oss << "  [" << (test.passed ? "PASS" : "FAIL") << "] " << test.name;
      if (!test.details.empty())
        oss << " - " << test.details;
      if (!test.error.empty())
        oss << " (error: " << test.error << ")";
      oss << "\n";
    }
    return oss.str();
  }
};

/// \brief Attempts a direct connection to \p target within \p timeout.
/// Returns true when the connection could be made; on failure \p error
/// describes why.
using DirectConnect =
  std::function<bool(const Endpoint &target, std::chrono::milliseconds timeout, std::string &error)>;

/// \brief Non-blocking UDP connect() to \p target, the same check a client
/// library makes before sending its first datagram. Gives up once \p timeout
/// has passed without the socket becoming writable.
inline bool udpDirectConnect(const Endpoint &target, std::chrono::milliseconds timeout,
                             std::string &error)
{
  sockaddr_storage ss{};
  socklen_t sl = 0;
  if (!target.toSockaddr(ss, sl))
  {
    error = "invalid address " + target.toString();
    return false;
  }
  int fd = ::socket(ss.ss_family, SOCK_DGRAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (fd < 0)
  {
    error = std::string("socket: ") + std::strerror(errno);
    return false;
  }

  bool connected = ::connect(fd, reinterpret_cast<sockaddr *>(&ss), sl) == 0;
  if (!connected && errno == EINPROGRESS)
  {
    pollfd pfd{fd, POLLOUT, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0)
    {
      error = "connect: timed out after " + std::to_string(timeout.count()) + "ms";
    }
    else if (ready < 0)
    {
      error = std::string("poll: ") + std::strerror(errno);
    }
    else
    {
      int soError = 0;
      socklen_t len = sizeof(soError);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0)
      {
        soError = errno;
      }
      connected = soError == 0;
      if (!connected)
      {
        error = std::string("connect: ") + std::strerror(soError);
      }
    }
  }
  else if (!connected)
  {
    error = std::string("connect: ") + std::strerror(errno);
  }
  ::close(fd);
  return connected;
}

struct LeakCheckOptions
{
  Endpoint torResolver{"127.0.0.1", 5353};
  std::string checkDomain = "check.torproject.org.";
  Endpoint directTarget{"8.8.8.8", 53};
  std::chrono::milliseconds torTimeout{10000};
  std::chrono::milliseconds directTimeout{3000};
  DirectConnect directConnect = udpDirectConnect;
};

/// \brief Run the two leak self-tests:
///   "DNS through Tor"     check domain resolves with NOERROR via Tor's DNSPort
///   "Direct DNS blocked"  the public resolver cannot be reached directly
/// The overall result passes only if both do.
inline LeakCheckResult runLeakCheck(const LeakCheckOptions &options = {})
{
  auto log = core::Logger::component("leak-check");
  LeakCheckResult result;
  result.timestamp = std::chrono::system_clock::now();

  TORGATE_CLOG_INFO(log, "testing DNS leak protection...");

  LeakTest torTest;
  torTest.name = "DNS through Tor";
  try
  {
    auto query = dns::DnsMessage::buildQuery(dns::DnsQuestion(options.checkDomain, dns::DnsType::A),
                                             crypto::SecureRng::queryId());
    auto reply = dns::DnsUdpClient::exchange(options.torResolver, query, options.torTimeout);
    auto header = dns::DnsMessage::parseHeaderOnly(reply.data(), reply.size());
    torTest.passed = header.rcode == dns::DnsResponseCode::NOERROR;
    torTest.details = "Response code: " + dns::responseCodeToString(header.rcode);
  }
  catch (const std::runtime_error &e)
  {
    torTest.passed = false;
    torTest.error = e.what();
  }
  result.tests.push_back(torTest);

  LeakTest directTest;
  directTest.name = "Direct DNS blocked";
  std::string connectError;
  if (options.directConnect(options.directTarget, options.directTimeout, connectError))
  {
    directTest.passed = false;
    directTest.details =
      "Direct connection to " + options.directTarget.toString() + " succeeded (potential leak)";
  }
  else
  {
    directTest.passed = true;
    directTest.details = connectError;
  }
  result.tests.push_back(directTest);

  result.passed = true;
  for (const auto &test : result.tests)
  {
    if (!test.passed)
    {
      result.passed = false;
      break;
    }
  }

  if (result.passed)
  {
    TORGATE_CLOG_INFO(log, "leak check passed");
  }
  else
  {
    TORGATE_CLOG_WARN(log, "leak check failed");
  }
  return result;
}

} // namespace network
} // namespace torgate
