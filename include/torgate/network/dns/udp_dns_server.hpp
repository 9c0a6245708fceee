// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#if !defined(__linux__)
#error "Linux-only (epoll/eventfd)"
#endif

#include "dns_message.hpp"
#include "dns_transport.hpp"
#include "torgate/core/logger.hpp"
#include "torgate/core/thread_pool.hpp"
#include "torgate/network/endpoint.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace torgate
{
namespace network
{
namespace dns
{

/// \brief Worker sizing for a UDP DNS listener
struct UdpDnsServerConfig
{
  std::size_t minThreads = 2;
  std::size_t maxThreads = 8;
  std::size_t queueSize = 1024;
};

/// \brief UDP listener that hands each datagram to a handler on a worker pool.
///
/// One epoll thread reads datagrams; the handler runs on the pool and its
/// return value is sent back to the source address. An empty return means no
/// reply. When the pool rejects a task the datagram is answered inline with
/// SERVFAIL (FORMERR if it cannot be decoded).
///
/// stop() is synchronous: it wakes the loop through an eventfd, joins it,
/// drains the pool and closes the socket before returning.
class UdpDnsServer
{
public:
  using Handler = std::function<std::vector<std::uint8_t>(const std::uint8_t *, std::size_t)>;

  UdpDnsServer(std::string name, Handler handler, UdpDnsServerConfig config = {})
      : _name(std::move(name)), _handler(std::move(handler)), _config(config)
  {
  }

  ~UdpDnsServer() { stop(); }

  UdpDnsServer(const UdpDnsServer &) = delete;
  UdpDnsServer &operator=(const UdpDnsServer &) = delete;

  /// \brief Bind \p listen and start serving.
  /// \throws DnsTransportException when the socket cannot be created or bound
  void start(const Endpoint &listen)
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (_running.load())
    {
      throw DnsTransportException(_name + " already listening");
    }

    sockaddr_storage ss{};
    socklen_t sl = 0;
    if (!listen.toSockaddr(ss, sl))
    {
      throw DnsTransportException("invalid listen address: " + listen.toString());
    }

    int sfd = ::socket(ss.ss_family, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sfd < 0)
    {
      throw DnsTransportException("socket: " + lastErr());
    }
    if (ss.ss_family == AF_INET6)
    {
      int v6only = 0;
      ::setsockopt(sfd, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only));
    }
    if (::bind(sfd, reinterpret_cast<sockaddr *>(&ss), sl) < 0)
    {
      std::string err = lastErr();
      ::close(sfd);
      throw DnsTransportException("bind " + listen.toString() + ": " + err);
    }

    sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    std::uint16_t boundPort = listen.port;
    if (::getsockname(sfd, reinterpret_cast<sockaddr *>(&bound), &boundLen) == 0)
    {
      boundPort = bound.ss_family == AF_INET6
                    ? ntohs(reinterpret_cast<sockaddr_in6 *>(&bound)->sin6_port)
                    : ntohs(reinterpret_cast<sockaddr_in *>(&bound)->sin_port);
    }

    int efd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    int pfd = ::epoll_create1(EPOLL_CLOEXEC);
    if (efd < 0 || pfd < 0)
    {
      std::string err = lastErr();
      ::close(sfd);
      if (efd >= 0)
        ::close(efd);
      if (pfd >= 0)
        ::close(pfd);
      throw DnsTransportException("epoll setup: " + err);
    }
    epoll_event e{};
    e.events = EPOLLIN;
    e.data.fd = sfd;
    ::epoll_ctl(pfd, EPOLL_CTL_ADD, sfd, &e);
    e.data.fd = efd;
    ::epoll_ctl(pfd, EPOLL_CTL_ADD, efd, &e);

    _socketFd = sfd;
    _eventFd = efd;
    _epollFd = pfd;
    _boundPort = boundPort;
    _listen = listen;
    _pool = std::make_unique<core::ThreadPool>(_config.minThreads, _config.maxThreads,
                                               _config.queueSize);
    _running.store(true);
    _loopThread = std::thread([this]() { loop(); });

    TORGATE_LOG_INFO("[" << _name << "] listening on " << listen.host << ":" << _boundPort);
  }

  /// \brief Stop serving and release the port. No-op when not running.
  void stop()
  {
    std::lock_guard<std::mutex> lock(_lifecycleMutex);
    if (!_running.exchange(false))
    {
      return;
    }

    std::uint64_t one = 1;
    if (::write(_eventFd, &one, sizeof(one)) < 0)
    {
      TORGATE_LOG_WARN("[" << _name << "] eventfd wake failed: " << lastErr());
    }
    if (_loopThread.joinable())
    {
      _loopThread.join();
    }
    _pool->shutdown();
    _pool.reset();

    ::close(_epollFd);
    ::close(_eventFd);
    ::close(_socketFd);
    _epollFd = _eventFd = _socketFd = -1;
    TORGATE_LOG_INFO("[" << _name << "] stopped");
  }

  bool isRunning() const { return _running.load(); }

  /// \brief Port actually bound; differs from the configured one when it was 0
  std::uint16_t boundPort() const { return _boundPort; }

  const Endpoint &listenEndpoint() const { return _listen; }

private:
  void loop()
  {
    epoll_event evs[8];
    std::vector<std::uint8_t> buf(constants::DNS_RECEIVE_BUFFER_SIZE);
    while (_running.load())
    {
      int n = ::epoll_wait(_epollFd, evs, 8, -1);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        TORGATE_LOG_ERROR("[" << _name << "] epoll_wait: " << lastErr());
        break;
      }
      for (int i = 0; i < n; ++i)
      {
        if (evs[i].data.fd == _eventFd)
        {
          std::uint64_t v;
          while (::read(_eventFd, &v, sizeof(v)) > 0)
          {
          }
          continue;
        }
        readDatagrams(buf);
      }
    }
  }

  void readDatagrams(std::vector<std::uint8_t> &buf)
  {
    for (;;)
    {
      sockaddr_storage from{};
      socklen_t fl = sizeof(from);
      ssize_t n = ::recvfrom(_socketFd, buf.data(), buf.size(), 0,
                             reinterpret_cast<sockaddr *>(&from), &fl);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
        {
          TORGATE_LOG_WARN("[" << _name << "] recvfrom: " << lastErr());
        }
        return;
      }

      auto datagram = std::make_shared<std::vector<std::uint8_t>>(buf.begin(), buf.begin() + n);
      bool queued = _pool->tryEnqueue(
        [this, datagram, from, fl]()
        {
          std::vector<std::uint8_t> reply;
          try
          {
            reply = _handler(datagram->data(), datagram->size());
          }
          catch (const std::exception &e)
          {
            TORGATE_LOG_ERROR("[" << _name << "] handler failed: " << e.what());
            reply = failureFor(*datagram);
          }
          sendReply(reply, from, fl);
        });
      if (!queued)
      {
        TORGATE_LOG_WARN("[" << _name << "] worker pool saturated, answering SERVFAIL");
        sendReply(failureFor(*datagram), from, fl);
      }
    }
  }

  static std::vector<std::uint8_t> failureFor(const std::vector<std::uint8_t> &datagram)
  {
    try
    {
      auto request = DnsMessage::parse(datagram);
      return DnsMessage::serialize(DnsMessage::makeFailure(request, DnsResponseCode::SERVFAIL));
    }
    catch (const DnsParseException &)
    {
      return DnsMessage::makeFormatError(datagram.data(), datagram.size());
    }
  }

  void sendReply(const std::vector<std::uint8_t> &reply, const sockaddr_storage &to,
                 socklen_t tl)
  {
    if (reply.empty())
    {
      return;
    }
    if (::sendto(_socketFd, reply.data(), reply.size(), 0,
                 reinterpret_cast<const sockaddr *>(&to), tl) < 0)
    {
      TORGATE_LOG_WARN("[" << _name << "] sendto: " << lastErr());
    }
  }

  static std::string lastErr() { return std::strerror(errno); }

  std::string _name;
  Handler _handler;
  UdpDnsServerConfig _config;

  std::mutex _lifecycleMutex;
  std::atomic<bool> _running{false};
  std::thread _loopThread;
  std::unique_ptr<core::ThreadPool> _pool;
  Endpoint _listen;
  std::uint16_t _boundPort = 0;
  int _socketFd = -1;
  int _eventFd = -1;
  int _epollFd = -1;
};

} // namespace dns
} // namespace network
} // namespace torgate
