// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file parser.hpp
/// \brief Single-pass parser for HTL, the parenthesized HTML shorthand.
///
/// \code
/// (a :href http://foo "body" (br))
/// \endcode
/// parses to an element `a` with attribute `href` and two children, and renders
/// as `<a href="http://foo">body<br/></a>`.
///
/// The parser is a character-driven state machine. Each code point is handed to
/// the current "eater", which updates the parse state and names the eater for
/// the next code point. Nesting is tracked on an explicit, bounded stack whose
/// bottom frame is an anonymous root element.
///
/// Example:
/// \code
/// auto result = vulcan::htl::parse("(p \"hello\")");
/// if (result.error) { std::cerr << result.error->describe(); }
/// else { std::cout << vulcan::htl::render(result.tree.get()); }
/// \endcode

#include "vulcan/htl/node.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vulcan
{
namespace htl
{

/// \brief Default cap on the parse stack, root frame included.
constexpr std::size_t DEFAULT_MAX_DEPTH = 256;

/// \brief Parse failure categories.
enum class ErrorKind
{
  Structural,   ///< Misplaced paren, colon or backslash; unterminated string; unclosed elements
  DepthExceeded ///< Nesting exceeded Options::maxDepth
};

inline const char *toString(ErrorKind kind)
{
  switch (kind)
  {
  case ErrorKind::Structural:
    return "structural";
  case ErrorKind::DepthExceeded:
    return "depth-exceeded";
  }
  return "unknown";
}

/// \brief Error information for parse failures.
///
/// For failures detected at end of input, codePoint is 0 and line/column point
/// just past the last character.
struct ParseError
{
  ErrorKind kind{ErrorKind::Structural};
  char32_t codePoint{0};
  std::size_t line{1};
  std::size_t column{0};
  std::string message;

  /// \brief Human-readable one-line description.
  std::string describe() const
  {
    std::string out;
    if (codePoint != 0)
    {
      out += "error processing character ";
      out += quoteCodePoint(codePoint);
      out += " (line " + std::to_string(line) + " column " + std::to_string(column) + "): ";
    }
    else
    {
      out += "error at end of input (line " + std::to_string(line) + " column " +
             std::to_string(column) + "): ";
    }
    out += message;
    return out;
  }

  static std::string quoteCodePoint(char32_t cp);
};

/// \brief Thrown by parseOrThrow().
class ParseException : public std::runtime_error
{
public:
  explicit ParseException(ParseError error)
      : std::runtime_error(error.describe()), _error(std::move(error))
  {
  }

  const ParseError &error() const { return _error; }

private:
  ParseError _error;
};

/// \brief Outcome of parse(). For non-empty input exactly one of tree and error
/// is set; for empty input both are empty.
struct ParseResult
{
  NodePtr tree;
  std::optional<ParseError> error;

  bool ok() const { return !error.has_value(); }
};

/// \brief Parser options and safety limits.
struct Options
{
  std::size_t maxDepth{DEFAULT_MAX_DEPTH}; ///< Max stack frames, root included
};

namespace detail
{

/// \brief Append \p cp to \p out as UTF-8. Out-of-range values become U+FFFD.
inline void appendUtf8(char32_t cp, std::string &out)
{
  if (cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
  {
    cp = 0xFFFDu;
  }
  if (cp <= 0x7Fu)
  {
    out.push_back(static_cast<char>(cp));
  }
  else if (cp <= 0x7FFu)
  {
    out.push_back(static_cast<char>(0xC0u | ((cp >> 6) & 0x1Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else if (cp <= 0xFFFFu)
  {
    out.push_back(static_cast<char>(0xE0u | ((cp >> 12) & 0x0Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
  else
  {
    out.push_back(static_cast<char>(0xF0u | ((cp >> 18) & 0x07u)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

/// \brief Decode one code point starting at \p pos and advance \p pos past it.
/// A malformed sequence consumes a single byte and yields U+FFFD.
inline char32_t decodeUtf8(std::string_view in, std::size_t &pos)
{
  const auto b0 = static_cast<unsigned char>(in[pos]);
  if (b0 < 0x80u)
  {
    ++pos;
    return b0;
  }

  std::size_t len = 0;
  char32_t cp = 0;
  char32_t min = 0;
  if ((b0 & 0xE0u) == 0xC0u)
  {
    len = 2;
    cp = b0 & 0x1Fu;
    min = 0x80u;
  }
  else if ((b0 & 0xF0u) == 0xE0u)
  {
    len = 3;
    cp = b0 & 0x0Fu;
    min = 0x800u;
  }
  else if ((b0 & 0xF8u) == 0xF0u)
  {
    len = 4;
    cp = b0 & 0x07u;
    min = 0x10000u;
  }
  else
  {
    ++pos;
    return 0xFFFDu;
  }

  if (pos + len > in.size())
  {
    ++pos;
    return 0xFFFDu;
  }
  for (std::size_t i = 1; i < len; ++i)
  {
    const auto b = static_cast<unsigned char>(in[pos + i]);
    if ((b & 0xC0u) != 0x80u)
    {
      ++pos;
      return 0xFFFDu;
    }
    cp = (cp << 6) | (b & 0x3Fu);
  }
  // Reject overlong forms, surrogates and values past U+10FFFF
  if (cp < min || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu))
  {
    ++pos;
    return 0xFFFDu;
  }
  pos += len;
  return cp;
}

/// \brief Unicode White_Space.
inline bool isSpace(char32_t cp)
{
  switch (cp)
  {
  case U'\t':
  case U'\n':
  case U'\v':
  case U'\f':
  case U'\r':
  case U' ':
  case 0x85u:
  case 0xA0u:
  case 0x1680u:
  case 0x2028u:
  case 0x2029u:
  case 0x202Fu:
  case 0x205Fu:
  case 0x3000u:
    return true;
  default:
    return cp >= 0x2000u && cp <= 0x200Au;
  }
}

/// \brief Append \p cp with the five HTML-significant characters replaced by
/// entities.
inline void appendHtmlEscaped(char32_t cp, std::string &out)
{
  switch (cp)
  {
  case U'<':
    out += "&lt;";
    break;
  case U'>':
    out += "&gt;";
    break;
  case U'&':
    out += "&amp;";
    break;
  case U'\'':
    out += "&apos;";
    break;
  case U'"':
    out += "&quot;";
    break;
  default:
    appendUtf8(cp, out);
    break;
  }
}

/// \brief Resolve the character following a backslash inside a quoted string.
/// Letters of the C control escapes map to their control characters; anything
/// else, backslash and double quote included, is HTML-escaped.
inline void appendBackslashEscape(char32_t cp, std::string &out)
{
  switch (cp)
  {
  case U'f':
    out.push_back('\f');
    break;
  case U'n':
    out.push_back('\n');
    break;
  case U'r':
    out.push_back('\r');
    break;
  case U't':
    out.push_back('\t');
    break;
  case U'v':
    out.push_back('\v');
    break;
  default:
    appendHtmlEscaped(cp, out);
    break;
  }
}

/// \brief Lexical context. Decides what a committed token means.
enum class Context
{
  Default,
  Tag,
  AfterTag,
  AttrKey,
  AfterAttrKey,
  AttrValue,
  Content
};

/// \brief The behavior that consumes the next code point.
enum class Eater
{
  Air,     ///< Between tokens
  Symbol,  ///< Inside a bare token
  String,  ///< Inside a double-quoted literal
  Comment, ///< Inside a line comment
  Failed   ///< Terminal; the parse is aborted
};

/// \brief Mutable state of one parse. Owns the tree until the parse succeeds.
class ParseState
{
public:
  explicit ParseState(std::size_t maxDepth) : _maxDepth(maxDepth)
  {
    _root = Node::makeElement();
    _stack.reserve(maxDepth);
    _stack.push_back(_root.get());
  }

  /// \brief Feed one code point to \p eater; returns the eater for the next one.
  Eater eat(Eater eater, char32_t cp)
  {
    switch (eater)
    {
    case Eater::Air:
      return eatAir(cp);
    case Eater::Symbol:
      return eatSymbol(cp);
    case Eater::String:
      return eatString(cp);
    case Eater::Comment:
      return eatComment(cp);
    case Eater::Failed:
      break;
    }
    return Eater::Failed;
  }

  std::size_t depth() const { return _stack.size(); }

  const std::string &failureMessage() const { return _failureMessage; }
  ErrorKind failureKind() const { return _failureKind; }

  NodePtr releaseRoot() { return std::move(_root); }

private:
  static constexpr char32_t OPEN_PAREN = U'(';
  static constexpr char32_t CLOSE_PAREN = U')';
  static constexpr char32_t QUOTE = U'"';
  static constexpr char32_t BACKSLASH = U'\\';
  static constexpr char32_t KEYWORD_START = U':';
  static constexpr char32_t COMMENT_START = U';';
  static constexpr char32_t NEWLINE = U'\n';

  Eater fail(const char *message, ErrorKind kind = ErrorKind::Structural)
  {
    _failureMessage = message;
    _failureKind = kind;
    return Eater::Failed;
  }

  Node *currentNode() const { return _stack.back(); }

  std::string flushToken()
  {
    std::string token;
    token.swap(_token);
    return token;
  }

  void commit()
  {
    switch (_context)
    {
    case Context::Tag:
      currentNode()->setTag(flushToken());
      break;
    case Context::AttrKey:
      _key = flushToken();
      break;
    case Context::AttrValue:
    {
      std::string key;
      key.swap(_key);
      currentNode()->setAttribute(std::move(key), flushToken());
      break;
    }
    case Context::Content:
      currentNode()->appendText(flushToken());
      break;
    default:
      break;
    }
  }

  Eater push()
  {
    if (_stack.size() >= _maxDepth)
    {
      return fail("tree too deep", ErrorKind::DepthExceeded);
    }
    Node *node = currentNode()->appendChild(Node::makeElement());
    _stack.push_back(node);
    _context = Context::Tag;
    return Eater::Symbol;
  }

  Eater pop()
  {
    if (_stack.size() <= 1)
    {
      return fail("unexpected closing paren");
    }
    _stack.pop_back();
    _context = Context::Default;
    return Eater::Air;
  }

  Eater eatAir(char32_t cp)
  {
    switch (cp)
    {
    case OPEN_PAREN:
      if (_context == Context::AfterAttrKey)
      {
        return fail("unexpected open paren");
      }
      return push();

    case CLOSE_PAREN:
      if (_context == Context::AfterAttrKey)
      {
        return fail("unexpected closing paren");
      }
      return pop();

    case QUOTE:
      _context = (_context == Context::AfterAttrKey) ? Context::AttrValue : Context::Content;
      return Eater::String;

    case COMMENT_START:
      return Eater::Comment;

    case KEYWORD_START:
      if (_context == Context::AfterTag)
      {
        _context = Context::AttrKey;
        return Eater::Symbol;
      }
      return fail("unexpected colon");

    case BACKSLASH:
      return fail("backslash-escaping is not allowed here");

    default:
      if (isSpace(cp))
      {
        return Eater::Air;
      }
      appendUtf8(cp, _token);
      _context = (_context == Context::AfterAttrKey) ? Context::AttrValue : Context::Content;
      return Eater::Symbol;
    }
  }

  Eater eatSymbol(char32_t cp)
  {
    switch (cp)
    {
    case OPEN_PAREN:
      if (_context == Context::AttrKey)
      {
        return fail("unexpected open paren");
      }
      commit();
      return push();

    case CLOSE_PAREN:
      if (_context == Context::AttrKey)
      {
        return fail("unexpected closing paren");
      }
      commit();
      return pop();

    case QUOTE:
      commit();
      _context = (_context == Context::AttrKey) ? Context::AttrValue : Context::Content;
      return Eater::String;

    case BACKSLASH:
      return fail("backslash-escaping is not allowed here");

    default:
      if (isSpace(cp))
      {
        commit();
        _context = (_context == Context::AttrKey) ? Context::AfterAttrKey : Context::AfterTag;
        return Eater::Air;
      }
      appendUtf8(cp, _token);
      return Eater::Symbol;
    }
  }

  Eater eatString(char32_t cp)
  {
    if (_escaping)
    {
      _escaping = false;
      appendBackslashEscape(cp, _token);
      return Eater::String;
    }
    if (cp == QUOTE)
    {
      commit();
      _context = (_context == Context::AttrValue) ? Context::AfterTag : Context::Default;
      return Eater::Air;
    }
    if (cp == BACKSLASH)
    {
      _escaping = true;
      return Eater::String;
    }
    appendHtmlEscaped(cp, _token);
    return Eater::String;
  }

  Eater eatComment(char32_t cp)
  {
    // The lexical context is left as it was before the comment
    return cp == NEWLINE ? Eater::Air : Eater::Comment;
  }

  std::size_t _maxDepth;
  NodePtr _root;
  std::vector<Node *> _stack; ///< Open elements; _stack[0] is the root
  Context _context{Context::Default};
  std::string _token;
  std::string _key;
  bool _escaping{false};
  std::string _failureMessage;
  ErrorKind _failureKind{ErrorKind::Structural};
};

} // namespace detail

inline std::string ParseError::quoteCodePoint(char32_t cp)
{
  std::string out = "'";
  switch (cp)
  {
  case U'\n':
    out += "\\n";
    break;
  case U'\r':
    out += "\\r";
    break;
  case U'\t':
    out += "\\t";
    break;
  case U'\'':
    out += "\\'";
    break;
  case U'\\':
    out += "\\\\";
    break;
  default:
    detail::appendUtf8(cp, out);
    break;
  }
  out += "'";
  return out;
}

/// \brief Parse a complete HTL document.
///
/// Empty input yields neither a tree nor an error. Otherwise the tree is an
/// anonymous root element whose children are the top-level nodes of the
/// document.
inline ParseResult parse(std::string_view input, const Options &opt = Options{})
{
  ParseResult result;
  if (input.empty())
  {
    return result;
  }

  detail::ParseState ps(opt.maxDepth == 0 ? 1 : opt.maxDepth);
  detail::Eater eater = detail::Eater::Air;
  std::size_t line = 1;
  std::size_t column = 0;

  std::size_t pos = 0;
  while (pos < input.size())
  {
    char32_t cp = detail::decodeUtf8(input, pos);
    eater = ps.eat(eater, cp);
    if (cp == U'\n')
    {
      ++line;
      column = 0;
    }
    else
    {
      ++column;
    }
    if (eater == detail::Eater::Failed)
    {
      result.error = ParseError{ps.failureKind(), cp, line, column, ps.failureMessage()};
      return result;
    }
  }

  if (eater == detail::Eater::String)
  {
    result.error = ParseError{ErrorKind::Structural, 0, line, column, "unterminated string"};
    return result;
  }
  if (ps.depth() > 1)
  {
    std::size_t missing = ps.depth() - 1;
    result.error = ParseError{ErrorKind::Structural, 0, line, column,
                              std::to_string(missing) + " closing paren" +
                                (missing == 1 ? " is" : "s are") + " missing"};
    return result;
  }

  result.tree = ps.releaseRoot();
  return result;
}

/// \brief Parse, throwing ParseException on failure. Returns nullptr for empty
/// input.
inline NodePtr parseOrThrow(std::string_view input, const Options &opt = Options{})
{
  ParseResult result = parse(input, opt);
  if (result.error)
  {
    throw ParseException(std::move(*result.error));
  }
  return std::move(result.tree);
}

} // namespace htl
} // namespace vulcan
