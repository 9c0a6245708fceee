// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include <torgate/core/logger.hpp>

namespace torgate
{
namespace core
{

/// Worker pool used to run one task per inbound datagram. Starts with
/// \c minThreads workers and grows up to \c maxThreads while tasks are
/// waiting. The queue is bounded; enqueue() throws when it is full.
class ThreadPool
{
public:
  /// @param minThreads   Workers started up front and kept for the pool's life.
  /// @param maxThreads   Hard limit on workers.
  /// @param maxQueueSize Tasks allowed to wait before enqueue() throws.
  /// @param onTaskError  Receives exceptions escaping a task. When absent
  ///                     they are logged.
  ThreadPool(std::size_t minThreads = 2, std::size_t maxThreads = 8,
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _minThreads(minThreads == 0 ? 1 : minThreads),
        _maxThreads(maxThreads < _minThreads ? _minThreads : maxThreads),
        _maxQueueSize(maxQueueSize), _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _minThreads; ++i)
    {
      spawnWorkerLocked();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /// Enqueue a fire-and-forget task.
  /// @throws std::runtime_error if the pool is shutting down or the queue is full
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    enqueueImpl([bound = std::move(bound)]() mutable { bound(); });
  }

  /// Same as enqueue() but reports rejection by returning false.
  template <typename F, typename... Args> bool tryEnqueue(F &&func, Args &&...args)
  {
    try
    {
      enqueue(std::forward<F>(func), std::forward<Args>(args)...);
      return true;
    }
    catch (const std::runtime_error &)
    {
      return false;
    }
  }

  /// Enqueue a task and obtain its result through a future.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  /// Stop accepting work, run what is queued and join every worker.
  /// Safe to call more than once.
  void shutdown()
  {
    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown && _workers.empty())
      {
        return;
      }
      _shutdown = true;
      workers.swap(_workers);
    }
    _condition.notify_all();
    for (auto &worker : workers)
    {
      if (worker.joinable())
      {
        worker.join();
      }
    }
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _workers.size();
  }

  std::size_t getActiveThreadCount() const { return _activeThreads.load(); }

private:
  void enqueueImpl(std::function<void()> task)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        throw std::runtime_error("ThreadPool task queue is full");
      }
      _tasks.push(std::move(task));
      if (_idleThreads < _tasks.size() && _workers.size() < _maxThreads)
      {
        spawnWorkerLocked();
      }
    }
    _condition.notify_one();
  }

  void spawnWorkerLocked()
  {
    _workers.emplace_back([this]() { workerLoop(); });
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        ++_idleThreads;
        _condition.wait(lock, [this]() { return _shutdown || !_tasks.empty(); });
        --_idleThreads;
        if (_tasks.empty())
        {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop();
      }

      ++_activeThreads;
      try
      {
        task();
      }
      catch (...)
      {
        reportTaskError(std::current_exception());
      }
      task = nullptr;
      --_activeThreads;
    }
  }

  void reportTaskError(std::exception_ptr error)
  {
    if (_onTaskError)
    {
      try
      {
        _onTaskError(error);
        return;
      }
      catch (const std::exception &e)
      {
        TORGATE_LOG_ERROR("[ThreadPool] Task error handler threw: " << e.what());
      }
      catch (...)
      {
        TORGATE_LOG_ERROR("[ThreadPool] Task error handler threw a non-standard exception");
      }
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception &e)
    {
      TORGATE_LOG_ERROR("[ThreadPool] Unhandled exception in task: " << e.what());
    }
    catch (...)
    {
      TORGATE_LOG_ERROR("[ThreadPool] Unhandled non-standard exception in task");
    }
  }

  const std::size_t _minThreads;
  const std::size_t _maxThreads;
  const std::size_t _maxQueueSize;
  std::function<void(std::exception_ptr)> _onTaskError;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::vector<std::thread> _workers;
  std::size_t _idleThreads = 0;
  std::atomic<std::size_t> _activeThreads{0};
  bool _shutdown = false;
};

} // namespace core
} // namespace torgate
