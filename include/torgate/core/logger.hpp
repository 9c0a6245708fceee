// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace torgate
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a source path at compile time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class ComponentLogger;

/// \brief Process-wide, thread-safe logger with optional async delivery,
/// daily file rotation and retention.
///
/// With no file path the logger writes to stdout. An external handler, once
/// registered, receives every record instead of the file or console.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief Receives the level, the formatted line and the raw message
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  static void init(Level level = Level::Info, const std::string &filePath = "", bool async = false,
                   int retentionDays = 7, const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.timestampFormat = timeFormat;
    data.currentLogDate.clear();
    data.fileStream.reset();
    rotateLogFileIfNeeded();

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueueLocked(data);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  static void shutdown()
  {
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();
    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
    flush();

    std::lock_guard<std::mutex> lock(data.mutex);
    data.asyncMode = false;
    data.fileStream.reset();
    data.currentLogDate.clear();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Parse a level name as written in configuration files.
  /// Accepts trace, debug, info, warn, warning, error and fatal in any case.
  static std::optional<Level> parseLevel(const std::string &name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
      return Level::Trace;
    if (lower == "debug")
      return Level::Debug;
    if (lower == "info")
      return Level::Info;
    if (lower == "warn" || lower == "warning")
      return Level::Warning;
    if (lower == "error")
      return Level::Error;
    if (lower == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

  /// \brief Route all records to \p handler instead of the file or console
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueueLocked(data);
    data.externalHandler = std::move(handler);
    if (data.fileStream)
    {
      data.fileStream->close();
      data.fileStream.reset();
    }
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
    data.currentLogDate.clear();
  }

  /// \brief Set the line layout.
  ///   %T timestamp, %t thread id, %L level, %m message,
  ///   %F source file, %l source line, %f function, %% literal percent.
  /// Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    data.compiledFormat = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      data.compiledFormat = compileFormat(data.logFormat);
    }
    Record record{level, message, file ? detail::basename(file) : "", line,
                  function ? function : "", std::this_thread::get_id(),
                  std::chrono::system_clock::now()};

    if (data.asyncMode)
    {
      data.queue.push(std::move(record));
      lock.unlock();
      data.cv.notify_one();
      return;
    }
    emitLocked(data, record);
  }

  /// \brief Logger view that tags every record with "[name] "
  static ComponentLogger component(const std::string &name);

  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    }
    return "UNKNOWN";
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal;
  };

  struct Record
  {
    Level level;
    std::string message;
    std::string file;
    int line;
    std::string function;
    std::thread::id thread;
    std::chrono::system_clock::time_point when;
  };

  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<Record> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainQueueLocked(data);
      if (data.exit)
      {
        break;
      }
    }
  }

  static void drainQueueLocked(LoggerData &data)
  {
    while (!data.queue.empty())
    {
      Record record = std::move(data.queue.front());
      data.queue.pop();
      emitLocked(data, record);
    }
  }

  static void emitLocked(LoggerData &data, const Record &record)
  {
    std::string line = format(data, record);
    if (data.externalHandler)
    {
      data.externalHandler(record.level, line, record.message);
      return;
    }
    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << line;
      data.fileStream->flush();
    }
    else
    {
      std::cout << line;
    }
  }

  static std::vector<FormatSegment> compileFormat(const std::string &format)
  {
    std::vector<FormatSegment> segments;
    std::string literal;
    auto pushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, literal});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }
      FormatToken token;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        literal += '%';
        continue;
      }
      pushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    pushLiteral();
    return segments;
  }

  static std::string format(const LoggerData &data, const Record &record)
  {
    std::ostringstream oss;
    for (const auto &seg : data.compiledFormat)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
      {
        auto t = std::chrono::system_clock::to_time_t(record.when);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    record.when.time_since_epoch()) %
                  1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        oss << std::put_time(&tm, data.timestampFormat.c_str());
        if (data.timestampFormat.find("%S") != std::string::npos)
        {
          oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
        }
        break;
      }
      case FormatToken::ThreadId:
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(record.thread) << std::dec << std::setfill(' ');
        break;
      case FormatToken::Level:
        oss << levelToString(record.level);
        break;
      case FormatToken::Message:
        oss << record.message;
        break;
      case FormatToken::File:
        oss << record.file;
        break;
      case FormatToken::Line:
        if (record.line > 0)
        {
          oss << record.line;
        }
        break;
      case FormatToken::Function:
        oss << record.function;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }

  static void rotateLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty() || data.externalHandler)
    {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logPath(data.logBasePath);
    fs::path logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }
    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - "
                  << ec.message() << std::endl;
        return;
      }
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }
    data.currentLogDate = today;
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      return;
    }
    deleteOldLogFiles(logDir, logPath.filename().string() + ".", data.retentionDays);
  }

  static void deleteOldLogFiles(const std::filesystem::path &logDir, const std::string &prefix,
                                int retentionDays)
  {
    if (retentionDays <= 0)
    {
      return;
    }
    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec))
    {
      std::string fname = entry.path().filename().string();
      if (fname.rfind(prefix, 0) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }
      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto ageDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (ageDays >= retentionDays)
      {
        std::error_code rmEc;
        fs::remove(entry.path(), rmEc);
        if (rmEc)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << rmEc.message() << std::endl;
        }
      }
    }
    if (ec)
    {
      std::cerr << "[Logger] Failed to scan log directory: " << logDir << " - " << ec.message()
                << std::endl;
    }
  }
};

/// \brief Named view on the process logger. Every record is prefixed with
/// the component name, e.g. "[fakedns] allocated 198.18.0.1".
class ComponentLogger
{
public:
  explicit ComponentLogger(std::string name) : _name(std::move(name)) {}

  const std::string &name() const { return _name; }

  void log(Logger::Level level, const std::string &message) const
  {
    Logger::log(level, "[" + _name + "] " + message);
  }

  void log(Logger::Level level, const std::string &message, const char *file, int line,
           const char *function) const
  {
    Logger::log(level, "[" + _name + "] " + message, file, line, function);
  }

  void debug(const std::string &message) const { log(Logger::Level::Debug, message); }
  void info(const std::string &message) const { log(Logger::Level::Info, message); }
  void warning(const std::string &message) const { log(Logger::Level::Warning, message); }
  void error(const std::string &message) const { log(Logger::Level::Error, message); }

private:
  std::string _name;
};

inline ComponentLogger Logger::component(const std::string &name) { return ComponentLogger(name); }

} // namespace core
} // namespace torgate

/// \brief Stream-style logging with source location (%F, %l, %f)
#define TORGATE_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    torgate::core::Logger::log(torgate::core::Logger::Level::level, _oss.str(), __FILE__,          \
                               __LINE__, __func__);                                                \
  } while (0)

#define TORGATE_LOG_TRACE(msg) TORGATE_LOG_WITH_LEVEL(Trace, msg)
#define TORGATE_LOG_DEBUG(msg) TORGATE_LOG_WITH_LEVEL(Debug, msg)
#define TORGATE_LOG_INFO(msg) TORGATE_LOG_WITH_LEVEL(Info, msg)
#define TORGATE_LOG_WARN(msg) TORGATE_LOG_WITH_LEVEL(Warning, msg)
#define TORGATE_LOG_ERROR(msg) TORGATE_LOG_WITH_LEVEL(Error, msg)
#define TORGATE_LOG_FATAL(msg) TORGATE_LOG_WITH_LEVEL(Fatal, msg)

/// \brief Stream-style logging through a ComponentLogger
#define TORGATE_CLOG_WITH_LEVEL(clog, level, msg)                                                  \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    (clog).log(torgate::core::Logger::Level::level, _oss.str(), __FILE__, __LINE__, __func__);     \
  } while (0)

#define TORGATE_CLOG_TRACE(clog, msg) TORGATE_CLOG_WITH_LEVEL(clog, Trace, msg)
#define TORGATE_CLOG_DEBUG(clog, msg) TORGATE_CLOG_WITH_LEVEL(clog, Debug, msg)
#define TORGATE_CLOG_INFO(clog, msg) TORGATE_CLOG_WITH_LEVEL(clog, Info, msg)
#define TORGATE_CLOG_WARN(clog, msg) TORGATE_CLOG_WITH_LEVEL(clog, Warning, msg)
#define TORGATE_CLOG_ERROR(clog, msg) TORGATE_CLOG_WITH_LEVEL(clog, Error, msg)

/// \brief Printf-style logging with source location.
/// \warning Output is truncated at 4095 bytes.
#define TORGATE_LOG_PRINTF(level, fmt, ...)                                                        \
  do                                                                                               \
  {                                                                                                \
    char _buf[4096];                                                                               \
    std::snprintf(_buf, sizeof(_buf), fmt, ##__VA_ARGS__);                                         \
    torgate::core::Logger::log(torgate::core::Logger::Level::level, _buf, __FILE__, __LINE__,      \
                               __func__);                                                          \
  } while (0)

#define TORGATE_LOG_DEBUGF(fmt, ...) TORGATE_LOG_PRINTF(Debug, fmt, ##__VA_ARGS__)
#define TORGATE_LOG_INFOF(fmt, ...) TORGATE_LOG_PRINTF(Info, fmt, ##__VA_ARGS__)
#define TORGATE_LOG_WARNF(fmt, ...) TORGATE_LOG_PRINTF(Warning, fmt, ##__VA_ARGS__)
#define TORGATE_LOG_ERRORF(fmt, ...) TORGATE_LOG_PRINTF(Error, fmt, ##__VA_ARGS__)
