// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file options.hpp
/// \brief Configuration of the static front end: command line, TOML file and
/// defaults, in that order of precedence.

#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "vulcan/core/config_loader.hpp"
#include "vulcan/core/logger.hpp"

namespace vulcan
{
namespace frontend
{

/// \brief Settings as gathered; unset fields fall through to the next source.
struct Config
{
  struct ServerConfig
  {
    std::optional<std::uint16_t> port;
    std::optional<std::string> bindAddress;
  } server;

  struct StaticConfig
  {
    std::optional<std::vector<std::string>> dirs;
    std::optional<std::string> index;
    std::optional<bool> dev;
  } statics;

  struct LogConfig
  {
    std::optional<std::string> level;
    std::optional<std::string> file;
  } log;

  std::optional<std::string> configFile;
  bool help{false};
};

/// \brief Settings after defaults were applied.
struct Settings
{
  std::uint16_t port{8000};
  std::string bindAddress{"0.0.0.0"};
  std::vector<std::string> dirs{"static"};
  std::string index{"/index.htl"};
  bool dev{false};
  core::Logger::Level logLevel{core::Logger::Level::Info};
  std::string logFile;
};

inline void printHelp(std::ostream &os, const char *program = "ffe")
{
  os << "Usage: " << program << " [options]\n"
     << "Serves static files, rendering .htl pages to HTML.\n\n"
     << "  -h, --help                 Show this help message\n"
     << "  -c, --config <file>        TOML configuration file\n"
     << "  -p, --port <port>          Listen port or [host]:port (default: 8000)\n"
     << "  -b, --bind <addr>          Bind address (default: 0.0.0.0)\n"
     << "  -d, --dirs <a:b:...>       Colon-separated static directories "
        "(default: static)\n"
     << "  -i, --index <route>        Route also served at / (default: /index.htl)\n"
     << "      --dev                  Reload files on every request\n"
     << "  -l, --log-level <level>    Log level (trace, debug, info, warning, "
        "error, fatal)\n"
     << "  -f, --log-file <file>      Log file path (default: stderr)\n";
}

/// \brief Splits \p value on \p separator, dropping empty parts.
inline std::vector<std::string> splitList(const std::string &value, char separator = ':')
{
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (start <= value.size())
  {
    std::size_t end = value.find(separator, start);
    if (end == std::string::npos)
    {
      end = value.size();
    }
    if (end > start)
    {
      parts.push_back(value.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}

/// \throws std::runtime_error unless \p value is an integer in 0..65535.
inline std::uint16_t parsePort(const std::string &value)
{
  std::size_t used = 0;
  long port = -1;
  try
  {
    port = std::stol(value, &used);
  }
  catch (const std::logic_error &)
  {
    throw std::runtime_error("Invalid port number: " + value);
  }
  if (used != value.size() || port < 0 || port > 65535)
  {
    throw std::runtime_error("Invalid port number: " + value);
  }
  return static_cast<std::uint16_t>(port);
}

/// \brief Accepts `8000`, `:8000` and `host:8000`. A host part sets the bind
/// address unless one was already given.
inline void applyPortArgument(Config &config, const std::string &value)
{
  auto colon = value.rfind(':');
  if (colon == std::string::npos)
  {
    config.server.port = parsePort(value);
    return;
  }
  config.server.port = parsePort(value.substr(colon + 1));
  std::string host = value.substr(0, colon);
  if (!host.empty() && !config.server.bindAddress)
  {
    config.server.bindAddress = host == "localhost" ? "127.0.0.1" : host;
  }
}

/// \brief Parse command-line arguments into \p config.
/// \throws std::runtime_error on unknown options, missing values or bad
/// numbers.
inline void parseCliArgs(int argc, const char *const *argv, Config &config)
{
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    auto value = [&]() -> std::string
    {
      if (i + 1 >= argc)
      {
        throw std::runtime_error("Missing value for option: " + arg);
      }
      return argv[++i];
    };

    if (arg == "-p" || arg == "--port")
    {
      applyPortArgument(config, value());
    }
    else if (arg == "-b" || arg == "--bind")
    {
      config.server.bindAddress = value();
    }
    else if (arg == "-d" || arg == "--dirs")
    {
      config.statics.dirs = splitList(value());
    }
    else if (arg == "-i" || arg == "--index")
    {
      config.statics.index = value();
    }
    else if (arg == "--dev")
    {
      config.statics.dev = true;
    }
    else if (arg == "-l" || arg == "--log-level")
    {
      config.log.level = value();
    }
    else if (arg == "-f" || arg == "--log-file")
    {
      config.log.file = value();
    }
    else if (arg == "-c" || arg == "--config")
    {
      config.configFile = value();
    }
    else if (arg == "-h" || arg == "--help")
    {
      config.help = true;
    }
    else
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }
}

/// \brief Fill fields the command line left unset from a loaded TOML file.
/// \throws std::runtime_error on values of the wrong shape.
inline void applyConfigFile(Config &config, const core::ConfigLoader &loader)
{
  if (!config.server.port)
  {
    if (auto port = loader.getInt("vulcan.server.port"))
    {
      config.server.port = parsePort(std::to_string(*port));
    }
  }
  if (!config.server.bindAddress)
  {
    config.server.bindAddress = loader.getString("vulcan.server.bindAddress");
  }
  if (!config.statics.dirs)
  {
    config.statics.dirs = loader.getStringArray("vulcan.static.dirs");
  }
  if (!config.statics.index)
  {
    config.statics.index = loader.getString("vulcan.static.index");
  }
  if (!config.statics.dev)
  {
    config.statics.dev = loader.getBool("vulcan.static.dev");
  }
  if (!config.log.level)
  {
    config.log.level = loader.getString("vulcan.log.level");
  }
  if (!config.log.file)
  {
    config.log.file = loader.getString("vulcan.log.file");
  }
}

/// \brief Apply defaults and validate.
/// \throws std::runtime_error on an unknown log level or an empty directory
/// list.
inline Settings resolve(const Config &config)
{
  Settings settings;
  if (config.server.port)
    settings.port = *config.server.port;
  if (config.server.bindAddress)
    settings.bindAddress = *config.server.bindAddress;
  if (config.statics.dirs)
    settings.dirs = *config.statics.dirs;
  if (config.statics.index)
    settings.index = *config.statics.index;
  if (config.statics.dev)
    settings.dev = *config.statics.dev;
  if (config.log.file)
    settings.logFile = *config.log.file;
  if (config.log.level)
  {
    auto level = core::Logger::parseLevel(*config.log.level);
    if (!level)
    {
      throw std::runtime_error("Invalid log level: " + *config.log.level);
    }
    settings.logLevel = *level;
  }
  if (settings.dirs.empty())
  {
    throw std::runtime_error("No static directories configured");
  }
  return settings;
}

/// \brief Command line, then the configuration file if one was named, then
/// defaults.
/// \throws std::runtime_error on any invalid input, including an unreadable
/// configuration file.
inline Settings loadSettings(int argc, const char *const *argv, Config &config)
{
  parseCliArgs(argc, argv, config);
  if (config.configFile)
  {
    core::ConfigLoader loader(*config.configFile);
    loader.load();
    applyConfigFile(config, loader);
  }
  return resolve(config);
}

} // namespace frontend
} // namespace vulcan
