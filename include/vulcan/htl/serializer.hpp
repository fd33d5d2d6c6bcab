// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file serializer.hpp
/// \brief Render HTL trees as HTML text.
///
/// Output is deterministic: attributes are emitted in ascending key order.
/// Values and text are written verbatim; quoted literals were already escaped
/// when they were parsed.

#include "vulcan/htl/node.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace vulcan
{
namespace htl
{

/// \brief True for tags rendered as `<tag/>` when they have no children.
inline bool isVoidTag(std::string_view tag)
{
  return tag == "br" || tag == "hr" || tag == "link" || tag == "img" || tag == "meta";
}

/// \brief Serializer that appends into a caller-owned buffer.
class Serializer
{
public:
  /// \brief Non-breaking space shorthand: a text node holding exactly this
  /// renders as `&nbsp;`.
  static constexpr std::string_view NBSP_SHORTHAND = "_";

  /// \brief Append the rendering of \p node to \p out. A null node appends
  /// nothing.
  static void renderTo(const Node *node, std::string &out)
  {
    if (!node)
    {
      return;
    }

    if (node->isText())
    {
      if (node->text() == NBSP_SHORTHAND)
      {
        out += "&nbsp;";
      }
      else
      {
        out += node->text();
      }
      return;
    }

    if (node->isAnonymous())
    {
      renderChildren(*node, out);
      return;
    }

    const std::string &tag = node->tag();
    out += '<';
    out += tag;
    renderAttributes(*node, out);

    if (!node->hasChildren())
    {
      if (isVoidTag(tag))
      {
        out += "/>";
      }
      else
      {
        out += "></";
        out += tag;
        out += '>';
      }
      return;
    }

    out += '>';
    renderChildren(*node, out);
    out += "</";
    out += tag;
    out += '>';
  }

private:
  static void renderChildren(const Node &node, std::string &out)
  {
    for (const auto &child : node.children())
    {
      renderTo(child.get(), out);
    }
  }

  static void renderAttributes(const Node &node, std::string &out)
  {
    const AttributeMap &attrs = node.attributes();
    if (attrs.empty())
    {
      return;
    }

    std::vector<const AttributeMap::value_type *> sorted;
    sorted.reserve(attrs.size());
    for (const auto &entry : attrs)
    {
      sorted.push_back(&entry);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto *a, const auto *b) { return a->first < b->first; });

    for (const auto *entry : sorted)
    {
      out += ' ';
      out += entry->first;
      out += "=\"";
      out += entry->second;
      out += '"';
    }
  }
};

/// \brief Render \p tree as HTML. Returns an empty string for a null tree.
inline std::string render(const Node *tree)
{
  std::string out;
  Serializer::renderTo(tree, out);
  return out;
}

inline std::string Node::render() const { return htl::render(this); }

} // namespace htl
} // namespace vulcan
