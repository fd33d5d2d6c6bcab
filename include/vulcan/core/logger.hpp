// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file logger.hpp
/// \brief Process-wide synchronous logger used by the loader, the server and
/// the command line tools.

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace vulcan
{
namespace core
{

namespace detail
{
  /// \brief Last path component of a `__FILE__` string.
  constexpr const char *basename(const char *path)
  {
    const char *name = path;
    for (; *path; ++path)
    {
      if (*path == '/' || *path == '\\')
      {
        name = path + 1;
      }
    }
    return name;
  }

  /// \brief Broken-down local time for \p when.
  inline std::tm localTime(std::chrono::system_clock::time_point when)
  {
    std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&seconds, &tm);
    return tm;
  }

  /// \brief A log file named `<base>.<YYYY-MM-DD>.log`, reopened when the
  /// date changes.
  class DailyLogFile
  {
  public:
    void setBase(std::string base)
    {
      _base = std::move(base);
      close();
    }

    /// \brief Appends \p text; false when no file could be opened.
    bool write(const std::string &text, const std::string &today)
    {
      if (!_base.empty() && (today != _date || !_out))
      {
        reopen(today);
      }
      if (!_out)
      {
        return false;
      }
      *_out << text;
      _out->flush();
      return true;
    }

    void flush()
    {
      if (_out)
      {
        _out->flush();
      }
    }

    void close()
    {
      _out.reset();
      _date.clear();
      _path.clear();
    }

    /// \brief Path currently open, or empty.
    const std::string &path() const { return _path; }

  private:
    std::string _base;
    std::string _date;
    std::string _path;
    std::unique_ptr<std::ofstream> _out;

    void reopen(const std::string &today)
    {
      namespace fs = std::filesystem;
      close();

      fs::path base(_base);
      fs::path dir = base.parent_path();
      std::error_code ec;
      if (!dir.empty() && !fs::exists(dir, ec))
      {
        fs::create_directories(dir, ec);
        if (ec)
        {
          std::cerr << "[Logger] cannot create " << dir << ": " << ec.message() << std::endl;
          return;
        }
      }

      std::string path = _base + "." + today + ".log";
      auto out = std::make_unique<std::ofstream>(path, std::ios::app);
      if (!out->is_open())
      {
        std::cerr << "[Logger] cannot open " << path << std::endl;
        return;
      }
      _out = std::move(out);
      _date = today;
      _path = std::move(path);
    }
  };
} // namespace detail

class LoggerStream;

/// \brief Thread-safe synchronous logger with levels, daily log files and an
/// optional external sink.
///
/// Records are written as `[timestamp] [LEVEL] message`. Without a file,
/// records go to stderr so that tools writing their result to stdout stay
/// clean.
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

  /// \brief Receives the level, the formatted record and the bare message.
  /// While set, file and console output are skipped.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  struct Endl
  {
  };
  static inline constexpr Endl endl{};

  /// \brief Configure the logger. With a non-empty \p filePath, records are
  /// appended to `<filePath>.<YYYY-MM-DD>.log`.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.minLevel = level;
    state.timeFormat = timeFormat;
    state.file.setBase(filePath);
  }

  static void flush()
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.file.flush();
    std::cerr.flush();
  }

  /// \brief Close the log file. Later records go to stderr until the next
  /// init().
  static void shutdown()
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.file.flush();
    state.file.setBase("");
  }

  static void setLevel(Level level)
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.minLevel = level;
  }

  static Level getLevel()
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.minLevel;
  }

  static void setExternalHandler(ExternalHandler handler)
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.external = std::move(handler);
  }

  static void clearExternalHandler()
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.external = nullptr;
  }

  /// \brief Add `[file:line function]` to records written through the
  /// VULCAN_LOG_* macros.
  static void setIncludeSourceLocation(bool include)
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.withLocation = include;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Emit one record. \p file and \p function may be null.
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level < state.minLevel)
    {
      return;
    }

    auto now = std::chrono::system_clock::now();
    std::string record = format(state, now, level, message, file, line, function);

    if (state.external)
    {
      state.external(level, record, message);
      return;
    }
    if (!state.file.write(record, dateOf(now)))
    {
      std::cerr << record;
    }
  }

  static const char *levelToString(Level level)
  {
    static constexpr std::array<const char *, 6> names = {"TRACE", "DEBUG", "INFO",
                                                          "WARN",  "ERROR", "FATAL"};
    auto index = static_cast<std::size_t>(level);
    return index < names.size() ? names[index] : "UNKNOWN";
  }

  /// \brief Parse a level name from configuration. Case is ignored and both
  /// "warn" and "warning" are accepted.
  static std::optional<Level> parseLevel(const std::string &name)
  {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning")
    {
      return Level::Warning;
    }
    for (int i = static_cast<int>(Level::Trace); i <= static_cast<int>(Level::Fatal); ++i)
    {
      std::string candidate = levelToString(static_cast<Level>(i));
      std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (candidate == lower)
      {
        return static_cast<Level>(i);
      }
    }
    return std::nullopt;
  }

  /// \brief Today's local date as `YYYY-MM-DD`.
  static std::string currentDate() { return dateOf(std::chrono::system_clock::now()); }

  /// \brief Path of the file currently written to, empty when logging to
  /// stderr.
  static std::string currentLogFile()
  {
    State &state = instance();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.file.path();
  }

private:
  struct State
  {
    std::mutex mutex;
    Level minLevel{Level::Info};
    std::string timeFormat{"%Y-%m-%d %H:%M:%S"};
    bool withLocation{false};
    ExternalHandler external;
    detail::DailyLogFile file;
  };

  static State &instance()
  {
    static State state;
    return state;
  }

  static std::string dateOf(std::chrono::system_clock::time_point when)
  {
    std::tm tm = detail::localTime(when);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

  /// \note Caller holds the mutex.
  static std::string format(const State &state, std::chrono::system_clock::time_point when,
                            Level level, const std::string &message, const char *file,
                            int line, const char *function)
  {
    std::tm tm = detail::localTime(when);
    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, state.timeFormat.c_str());
    if (state.timeFormat.find("%S") != std::string::npos)
    {
      auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;
      oss << '.' << std::setfill('0') << std::setw(3) << millis.count();
    }
    oss << "] [" << levelToString(level) << "] ";

    if (state.withLocation && file)
    {
      oss << '[' << detail::basename(file) << ':' << line;
      if (function)
      {
        oss << ' ' << function;
      }
      oss << "] ";
    }
    oss << message << '\n';
    return oss.str();
  }
};

/// \brief Collects `<<` pieces and emits one record when flushed by
/// Logger::endl or on destruction.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  LoggerStream(LoggerStream &&) = default;

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _buffer << value;
    _pending = true;
    return *this;
  }

  LoggerStream &operator<<(Logger::Endl)
  {
    emit();
    return *this;
  }

  ~LoggerStream()
  {
    if (!_pending)
    {
      return;
    }
    try
    {
      emit();
    }
    catch (const std::exception &e)
    {
      std::cerr << "[Logger] dropped record: " << e.what() << std::endl;
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _buffer;
  bool _pending{false};

  void emit()
  {
    Logger::log(_level, _buffer.str());
    _buffer.str({});
    _pending = false;
  }
};

/// \brief Entry point for `Logger << Level << ...` statements.
class LoggerProxy
{
public:
  LoggerStream operator<<(Logger::Level level) { return Logger::stream(level); }
};

inline LoggerProxy Logger;

/// \brief Stream-style logging with source location
#define VULCAN_LOG_WITH_LEVEL(level, msg)                                                          \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _vulcanLogStream;                                                           \
    _vulcanLogStream << msg;                                                                       \
    vulcan::core::Logger::log(vulcan::core::Logger::Level::level, _vulcanLogStream.str(),          \
                              __FILE__, __LINE__, __func__);                                       \
  } while (0)

#define VULCAN_LOG_TRACE(msg) VULCAN_LOG_WITH_LEVEL(Trace, msg)
#define VULCAN_LOG_DEBUG(msg) VULCAN_LOG_WITH_LEVEL(Debug, msg)
#define VULCAN_LOG_INFO(msg) VULCAN_LOG_WITH_LEVEL(Info, msg)
#define VULCAN_LOG_WARN(msg) VULCAN_LOG_WITH_LEVEL(Warning, msg)
#define VULCAN_LOG_ERROR(msg) VULCAN_LOG_WITH_LEVEL(Error, msg)
#define VULCAN_LOG_FATAL(msg) VULCAN_LOG_WITH_LEVEL(Fatal, msg)

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace vulcan
