// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace vulcan
{
namespace core
{
  /// JSON value type used by the tooling outputs.
  using Json = nlohmann::json;

  /// \brief Serialize for humans: two-space indent, non-ASCII kept as UTF-8
  /// and invalid UTF-8 replaced instead of throwing.
  inline std::string toPrettyString(const Json &value)
  {
    return value.dump(2, ' ', false, Json::error_handler_t::replace);
  }
} // namespace core
} // namespace vulcan
