// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "vulcan/core/logger.hpp"
#include "vulcan/parsers/minimal_toml.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace vulcan
{
namespace core
{
/// \brief A TOML file read on demand, with typed lookups by dotted key
/// (`vulcan.server.port`).
class ConfigLoader
{
public:
  explicit ConfigLoader(std::string filename) : _filename(std::move(filename)) {}

  /// \brief Read the file again. A failure leaves an empty table, records
  /// the reason in lastError() and returns false.
  bool reload()
  {
    try
    {
      parsers::toml::table fresh = parsers::toml::parse_file(_filename);
      _table = std::move(fresh);
      _lastError.clear();
      _loaded = true;
    }
    catch (const std::runtime_error &e)
    {
      _table = {};
      _lastError = e.what();
      _loaded = false;
      VULCAN_LOG_WARN("ConfigLoader: cannot use " << _filename << ": " << _lastError);
    }
    return _loaded;
  }

  /// \brief The table, reading the file on first use.
  /// \throws std::runtime_error when the file cannot be read or parsed.
  const parsers::toml::table &load()
  {
    if (_loaded || reload())
    {
      return _table;
    }
    throw std::runtime_error("Failed to load configuration file: " + _filename + " (" +
                             _lastError + ")");
  }

  bool isLoaded() const { return _loaded; }
  const std::string &filename() const { return _filename; }
  const std::string &lastError() const { return _lastError; }
  const parsers::toml::table &table() const { return _table; }

  /// \tparam T int64_t, double, bool or std::string
  /// \return nullopt when the key is missing or holds another type
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    parsers::toml::node found = _table.at_path(dottedKey);
    return found.is_value() ? found.as<T>() : std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }
  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }
  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \return nullopt when the key is missing or not an array
  /// \throws std::runtime_error when an element is not a string
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    const parsers::toml::array *items = _table.at_path(key).as_array();
    if (items == nullptr)
    {
      return std::nullopt;
    }
    std::vector<std::string> strings;
    for (std::size_t i = 0; i < items->size(); ++i)
    {
      const auto *text = std::get_if<std::string>(&(*items)[i]);
      if (text == nullptr)
      {
        throw std::runtime_error("ConfigLoader: element " + std::to_string(i) + " of '" + key +
                                 "' is not a string");
      }
      strings.push_back(*text);
    }
    return strings;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  std::string _lastError;
  bool _loaded{false};
};

} // namespace core
} // namespace vulcan
