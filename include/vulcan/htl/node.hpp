// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file node.hpp
/// \brief Tree model for HTL documents: elements with attributes and ordered
/// children, and text leaves.
///
/// A tree is owned from its root down through std::unique_ptr; there are no
/// parent pointers. An element with an empty tag is an anonymous group: the
/// parser uses one as the document root so that several top-level elements can
/// be siblings.

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vulcan
{
namespace htl
{

/// \brief Node kinds.
enum class NodeType
{
  Element,
  Text
};

class Node;
using NodePtr = std::unique_ptr<Node>;

/// \brief Attribute storage. Iteration order is unspecified; the serializer
/// sorts keys before emitting them.
using AttributeMap = std::unordered_map<std::string, std::string>;

/// \brief A single node of an HTL tree.
class Node
{
public:
  /// \brief Create an element. An empty tag makes an anonymous group.
  static NodePtr makeElement(std::string tag = std::string{})
  {
    return NodePtr(new Node(NodeType::Element, std::move(tag)));
  }

  /// \brief Create a text leaf holding \p text verbatim.
  static NodePtr makeText(std::string text)
  {
    return NodePtr(new Node(NodeType::Text, std::move(text)));
  }

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  NodeType type() const { return _type; }
  bool isElement() const { return _type == NodeType::Element; }
  bool isText() const { return _type == NodeType::Text; }

  /// \brief True for an element whose tag is empty.
  bool isAnonymous() const { return isElement() && _value.empty(); }

  /// \brief Element tag name. Empty for anonymous groups.
  const std::string &tag() const
  {
    requireElement("tag");
    return _value;
  }

  void setTag(std::string tag)
  {
    requireElement("setTag");
    _value = std::move(tag);
  }

  /// \brief Text payload of a text leaf.
  const std::string &text() const
  {
    if (!isText())
    {
      throw std::logic_error("htl::Node::text called on an element");
    }
    return _value;
  }

  const AttributeMap &attributes() const { return _attributes; }

  /// \brief Set an attribute. An existing key is overwritten.
  void setAttribute(std::string key, std::string value)
  {
    requireElement("setAttribute");
    _attributes[std::move(key)] = std::move(value);
  }

  bool hasAttribute(const std::string &key) const
  {
    return _attributes.find(key) != _attributes.end();
  }

  /// \brief Find attribute by name; returns empty string_view if not found.
  std::string_view getAttribute(const std::string &key) const
  {
    auto it = _attributes.find(key);
    if (it == _attributes.end())
    {
      return std::string_view{};
    }
    return it->second;
  }

  const std::vector<NodePtr> &children() const { return _children; }

  bool hasChildren() const { return !_children.empty(); }

  /// \brief Append \p child as the last child and return a non-owning pointer
  /// to it.
  Node *appendChild(NodePtr child)
  {
    requireElement("appendChild");
    if (!child)
    {
      throw std::invalid_argument("htl::Node::appendChild called with a null child");
    }
    Node *raw = child.get();
    _children.push_back(std::move(child));
    return raw;
  }

  /// \brief Convenience: append a new text leaf.
  Node *appendText(std::string text) { return appendChild(makeText(std::move(text))); }

  /// \brief Render this subtree as HTML. Defined in serializer.hpp.
  std::string render() const;

private:
  Node(NodeType type, std::string value) : _type(type), _value(std::move(value)) {}

  void requireElement(const char *operation) const
  {
    if (!isElement())
    {
      throw std::logic_error(std::string("htl::Node::") + operation + " called on a text node");
    }
  }

  NodeType _type;
  std::string _value; ///< Tag for elements, payload for text
  AttributeMap _attributes;
  std::vector<NodePtr> _children;
};

} // namespace htl
} // namespace vulcan
