// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include "dns_message.hpp"
#include "torgate/network/endpoint.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace torgate
{
namespace network
{
namespace dns
{

/// \brief DNS transport exceptions
class DnsTransportException : public std::runtime_error
{
public:
  explicit DnsTransportException(const std::string &message)
      : std::runtime_error("DNS Transport Error: " + message)
  {
  }
};

class DnsTimeoutException : public DnsTransportException
{
public:
  explicit DnsTimeoutException(const std::string &message = "DNS query timeout")
      : DnsTransportException(message)
  {
  }
};

/// \brief One-shot UDP exchanges with an upstream resolver.
///
/// The socket is connected to the upstream, so the kernel drops datagrams
/// from any other source. Replies whose transaction ID differs from the
/// query are discarded and the wait continues until the deadline.
class DnsUdpClient
{
public:
  /// \brief Send \p query to \p server and wait for the matching reply.
  /// \throws DnsTimeoutException when no matching reply arrives in time
  /// \throws DnsTransportException on socket errors
  static std::vector<std::uint8_t> exchange(const Endpoint &server,
                                            const std::vector<std::uint8_t> &query,
                                            std::chrono::milliseconds timeout)
  {
    if (query.size() < constants::DNS_HEADER_SIZE)
    {
      throw DnsTransportException("query shorter than a DNS header");
    }
    const std::uint16_t expectedId = DnsMessage::readId(query);

    sockaddr_storage ss{};
    socklen_t sl = 0;
    if (!server.toSockaddr(ss, sl))
    {
      throw DnsTransportException("invalid server address: " + server.toString());
    }

    Socket sock(::socket(ss.ss_family, SOCK_DGRAM | SOCK_CLOEXEC, 0));
    if (sock.fd < 0)
    {
      throw DnsTransportException("socket: " + lastErr());
    }
    if (::connect(sock.fd, reinterpret_cast<sockaddr *>(&ss), sl) < 0)
    {
      throw DnsTransportException("connect " + server.toString() + ": " + lastErr());
    }
    ssize_t sent = ::send(sock.fd, query.data(), query.size(), 0);
    if (sent < 0 || static_cast<std::size_t>(sent) != query.size())
    {
      throw DnsTransportException("send " + server.toString() + ": " + lastErr());
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::uint8_t> buf(constants::DNS_RECEIVE_BUFFER_SIZE);
    for (;;)
    {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0)
      {
        throw DnsTimeoutException("no reply from " + server.toString() + " within " +
                                  std::to_string(timeout.count()) + "ms");
      }

      pollfd pfd{};
      pfd.fd = sock.fd;
      pfd.events = POLLIN;
      int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (rc < 0)
      {
        if (errno == EINTR)
          continue;
        throw DnsTransportException("poll: " + lastErr());
      }
      if (rc == 0)
      {
        continue;
      }

      ssize_t n = ::recv(sock.fd, buf.data(), buf.size(), 0);
      if (n < 0)
      {
        if (errno == EINTR || errno == EAGAIN)
          continue;
        throw DnsTransportException("recv " + server.toString() + ": " + lastErr());
      }
      if (static_cast<std::size_t>(n) < constants::DNS_HEADER_SIZE)
      {
        continue;
      }
      std::vector<std::uint8_t> reply(buf.begin(), buf.begin() + n);
      if (DnsMessage::readId(reply) != expectedId)
      {
        continue;
      }
      return reply;
    }
  }

private:
  struct Socket
  {
    explicit Socket(int f) : fd(f) {}
    ~Socket()
    {
      if (fd >= 0)
        ::close(fd);
    }
    Socket(const Socket &) = delete;
    Socket &operator=(const Socket &) = delete;
    int fd;
  };

  static std::string lastErr() { return std::strerror(errno); }
};

} // namespace dns
} // namespace network
} // namespace torgate
