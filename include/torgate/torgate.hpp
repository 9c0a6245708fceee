// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "bypass/country_matcher.hpp"
#include "bypass/engine.hpp"
#include "bypass/glob.hpp"
#include "bypass/rule.hpp"
#include "common/lifecycle.hpp"
#include "config/gateway_config.hpp"
#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "core/thread_pool.hpp"
#include "network/dns_resolver.hpp"
#include "network/fake_dns.hpp"
#include "network/leak_check.hpp"

#define TORGATE_VERSION "0.1.0"
#define TORGATE_DEFAULT_CONFIG_FILE_PATH "/etc/torgate/torgate.toml"
