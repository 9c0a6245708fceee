// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <torgate/torgate.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <pthread.h>

namespace
{

struct CliOptions
{
  std::optional<std::string> configFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  bool leakCheck = false;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "torgated " << TORGATE_VERSION << "\n"
            << "Options:\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        Configuration file path (default: "
            << TORGATE_DEFAULT_CONFIG_FILE_PATH << ")\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, "
               "warning, error, fatal)\n"
            << "  -f, --log-file <file>      Log file path\n"
            << "      --leak-check           Run the DNS leak self-test and exit\n";
}

/// \brief Parse command-line arguments
CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
    {
      options.logFile = argv[++i];
    }
    else if (arg == "--leak-check")
    {
      options.leakCheck = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      std::exit(0);
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
  return options;
}

/// \brief Explicit file, else the default path if it exists, else built-in defaults
torgate::config::GatewayConfig loadConfig(const CliOptions &options)
{
  if (options.configFile)
  {
    return torgate::config::GatewayConfig::fromFile(*options.configFile);
  }
  std::error_code ec;
  if (std::filesystem::exists(TORGATE_DEFAULT_CONFIG_FILE_PATH, ec))
  {
    return torgate::config::GatewayConfig::fromFile(TORGATE_DEFAULT_CONFIG_FILE_PATH);
  }
  return torgate::config::GatewayConfig::defaults();
}

void initLogging(const torgate::config::GatewayConfig &config, const CliOptions &options)
{
  using torgate::core::Logger;
  Logger::Level level = config.log.level;
  if (options.logLevel)
  {
    auto parsed = Logger::parseLevel(*options.logLevel);
    if (!parsed)
    {
      throw std::runtime_error("Invalid log level: " + *options.logLevel);
    }
    level = *parsed;
  }
  Logger::init(level, options.logFile.value_or(config.log.file), config.log.async,
               config.log.retentionDays);
}

int runLeakCheck(const torgate::config::GatewayConfig &config)
{
  torgate::network::LeakCheckOptions options;
  options.torResolver = torgate::network::Endpoint(config.dns.torHost, config.torDnsPort);
  options.torTimeout = config.dns.torTimeout;
  auto result = torgate::network::runLeakCheck(options);
  std::cout << result.toString();
  return result.passed ? 0 : 1;
}

} // namespace

int main(int argc, char **argv)
{
  using namespace torgate;

  // Must precede any thread creation
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  std::unique_ptr<network::FakeDnsServer> fakeDns;
  std::unique_ptr<network::DnsResolver> resolver;
  try
  {
    CliOptions options = parseCliArgs(argc, argv);
    config::GatewayConfig config = loadConfig(options);
    initLogging(config, options);

    if (options.leakCheck)
    {
      int rc = runLeakCheck(config);
      core::Logger::shutdown();
      return rc;
    }

    auto engine = std::make_shared<bypass::BypassEngine>(config.bypass);
    TORGATE_LOG_INFO("bypass engine ready enabled=" << (engine->isEnabled() ? "true" : "false")
                                                    << " rules=" << engine->getRules().size());

    resolver = std::make_unique<network::DnsResolver>(config.dns, engine);
    resolver->start();

    if (config.fakeDnsEnabled)
    {
      fakeDns = std::make_unique<network::FakeDnsServer>(config.fakeDns);
      fakeDns->start();
    }

    int sig = 0;
    sigwait(&signals, &sig);
    TORGATE_LOG_INFO("received signal " << sig << ", shutting down");
  }
  catch (const std::exception &ex)
  {
    std::cerr << "torgated: " << ex.what() << std::endl;
    TORGATE_LOG_FATAL("startup failed: " << ex.what());
    if (fakeDns)
      fakeDns->stop();
    if (resolver)
      resolver->stop();
    core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  if (fakeDns)
    fakeDns->stop();
  resolver->stop();
  core::Logger::shutdown();
  return 0;
}
