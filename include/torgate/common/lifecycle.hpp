// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <stdexcept>
#include <string>

namespace torgate
{
namespace common
{

/// Lifecycle state of a network-facing component
enum class LifecycleState
{
  Created, ///< Constructed, never started
  Running, ///< Listener bound and serving
  Stopped  ///< Listener released; may be started again
};

/// Raised by start() on a component that is already running
class LifecycleError : public std::runtime_error
{
public:
  explicit LifecycleError(const std::string &message) : std::runtime_error(message) {}
};

/// Raised for configuration that cannot be honoured (bad address block,
/// out of range port, unknown enum name, exhausted address pool)
class ConfigurationError : public std::runtime_error
{
public:
  explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
};

/// Components with a start/stop lifecycle.
///
///   Created -> Running -> Stopped -> Running ...
///
/// start() on a running component throws LifecycleError ("already running").
/// stop() is synchronous: when it returns the listening port has been
/// released. Calling stop() on a component that is not running does nothing.
class ILifecycleManaged
{
public:
  virtual ~ILifecycleManaged() = default;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual LifecycleState getState() const = 0;

  bool isRunning() const { return getState() == LifecycleState::Running; }
};

inline const char *lifecycleStateToString(LifecycleState state)
{
  switch (state)
  {
  case LifecycleState::Created:
    return "Created";
  case LifecycleState::Running:
    return "Running";
  case LifecycleState::Stopped:
    return "Stopped";
  }
  return "Unknown";
}

} // namespace common
} // namespace torgate
