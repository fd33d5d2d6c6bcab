// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace vulcan
{
namespace util
{

  /// \brief Read a whole file in binary mode.
  /// \throws std::runtime_error if the file cannot be opened or read.
  inline std::string readFileContents(const std::filesystem::path& path)
  {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open())
    {
      throw std::runtime_error("cannot open file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
      throw std::runtime_error("cannot read file: " + path.string());
    }
    return buffer.str();
  }

  /// \brief All regular files below \p dir, recursively, sorted by path.
  /// Directories and other special files are skipped.
  /// \throws std::runtime_error if \p dir is not a directory.
  inline std::vector<std::filesystem::path> listRegularFiles(const std::filesystem::path& dir)
  {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec))
    {
      throw std::runtime_error("not a directory: " + dir.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir))
    {
      if (entry.is_regular_file())
      {
        files.push_back(entry.path());
      }
    }
    std::sort(files.begin(), files.end());
    return files;
  }

} // namespace util
} // namespace vulcan
