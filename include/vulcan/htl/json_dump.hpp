// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file json_dump.hpp
/// \brief JSON views of parsed trees and parse errors, for tooling.

#include "vulcan/core/json.hpp"
#include "vulcan/htl/node.hpp"
#include "vulcan/htl/parser.hpp"

#include <cstdint>

namespace vulcan
{
namespace htl
{

/// \brief Convert a subtree to JSON.
///
/// Elements become `{"type":"element","tag":...,"attributes":{...},"children":[...]}`,
/// text leaves become `{"type":"text","text":...}`.
inline core::Json toJson(const Node &node)
{
  if (node.isText())
  {
    return core::Json{{"type", "text"}, {"text", node.text()}};
  }

  core::Json attributes = core::Json::object();
  for (const auto &[key, value] : node.attributes())
  {
    attributes[key] = value;
  }

  core::Json children = core::Json::array();
  for (const auto &child : node.children())
  {
    children.push_back(toJson(*child));
  }

  return core::Json{{"type", "element"},
                    {"tag", node.tag()},
                    {"attributes", std::move(attributes)},
                    {"children", std::move(children)}};
}

inline core::Json toJson(const ParseError &error)
{
  return core::Json{{"kind", toString(error.kind)},
                    {"message", error.message},
                    {"line", error.line},
                    {"column", error.column},
                    {"codePoint", static_cast<std::uint32_t>(error.codePoint)}};
}

/// \brief JSON for a whole parse outcome: `{"ok":true,"tree":...}` or
/// `{"ok":false,"error":...}`. An empty document has a null tree.
inline core::Json toJson(const ParseResult &result)
{
  if (result.error)
  {
    return core::Json{{"ok", false}, {"error", toJson(*result.error)}};
  }
  core::Json tree = result.tree ? toJson(*result.tree) : core::Json();
  return core::Json{{"ok", true}, {"tree", std::move(tree)}};
}

} // namespace htl
} // namespace vulcan
