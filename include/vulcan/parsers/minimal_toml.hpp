// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file minimal_toml.hpp
/// \brief Small TOML reader covering what configuration files need: tables,
/// dotted keys, strings, integers, floats, booleans and arrays.
///
/// Not supported: inline tables, arrays of tables, multi-line strings and
/// date-times. Errors throw std::runtime_error naming the line.

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace vulcan
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Ordered list of values; elements need not share a type.
class array
{
public:
  using const_iterator = std::vector<value_type>::const_iterator;

  void push_back(value_type val) { _items.push_back(std::move(val)); }

  size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  const value_type &operator[](size_t idx) const { return _items[idx]; }

  const_iterator begin() const { return _items.begin(); }
  const_iterator end() const { return _items.end(); }

private:
  std::vector<value_type> _items;
};

/// \brief A looked-up value; false when the key was absent.
class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  explicit operator bool() const { return _value.index() != 0; }

  bool is_string() const { return holds<std::string>(); }
  bool is_integer() const { return holds<int64_t>(); }
  bool is_floating_point() const { return holds<double>(); }
  bool is_boolean() const { return holds<bool>(); }
  bool is_array() const { return holds<std::shared_ptr<array>>(); }
  bool is_table() const { return holds<std::shared_ptr<table>>(); }
  bool is_value() const { return *this && !is_array() && !is_table(); }

  /// \brief Typed access. An integer is also readable as double.
  template <typename T> std::optional<T> as() const
  {
    if (const T *exact = std::get_if<T>(&_value))
    {
      return *exact;
    }
    if constexpr (std::is_same_v<T, double>)
    {
      if (const int64_t *whole = std::get_if<int64_t>(&_value))
      {
        return static_cast<double>(*whole);
      }
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    const auto *ptr = std::get_if<std::shared_ptr<array>>(&_value);
    return ptr ? ptr->get() : nullptr;
  }

  table *as_table() const
  {
    const auto *ptr = std::get_if<std::shared_ptr<table>>(&_value);
    return ptr ? ptr->get() : nullptr;
  }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;

  template <typename T> bool holds() const { return std::holds_alternative<T>(_value); }
};

/// \brief Key to node mapping; nested tables are held by shared_ptr.
class table
{
public:
  using const_iterator = std::map<std::string, node>::const_iterator;

  bool contains(const std::string &key) const { return _entries.count(key) > 0; }
  bool empty() const { return _entries.empty(); }
  size_t size() const { return _entries.size(); }

  node &operator[](const std::string &key) { return _entries[key]; }

  /// \brief Look up `a.b.c`; an empty node when any part is missing or a
  /// non-table sits on the way.
  node at_path(const std::string &dottedPath) const
  {
    const table *scope = this;
    std::istringstream parts(dottedPath);
    std::string part;
    node found;
    while (std::getline(parts, part, '.'))
    {
      if (!scope)
      {
        return node();
      }
      auto it = scope->_entries.find(part);
      if (it == scope->_entries.end())
      {
        return node();
      }
      found = it->second;
      scope = found.as_table();
    }
    return found;
  }

  const_iterator begin() const { return _entries.begin(); }
  const_iterator end() const { return _entries.end(); }

private:
  std::map<std::string, node> _entries;
};

namespace detail
{
  struct token
  {
    enum kind_t
    {
      end,
      newline,
      word,
      string,
      equals,
      comma,
      open_bracket,
      close_bracket
    };

    kind_t kind{end};
    std::string text;
    std::size_t line{1};
  };

  inline bool isWordChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '+' ||
           c == '.';
  }

  /// \brief Splits the input into tokens on demand. Comments and horizontal
  /// whitespace are dropped; line breaks are kept as tokens.
  class lexer
  {
  public:
    explicit lexer(const std::string &input) : _input(input) {}

    const token &peek()
    {
      if (!_ahead)
      {
        _ahead = scan();
      }
      return *_ahead;
    }

    token next()
    {
      token t = peek();
      _ahead.reset();
      return t;
    }

    [[noreturn]] void fail(std::size_t line, const std::string &message) const
    {
      throw std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " +
                               message);
    }

  private:
    const std::string &_input;
    std::size_t _pos{0};
    std::size_t _line{1};
    std::optional<token> _ahead;

    token make(token::kind_t kind, std::string text = {}) const
    {
      return token{kind, std::move(text), _line};
    }

    token scan()
    {
      while (_pos < _input.size())
      {
        char c = _input[_pos];
        if (c == ' ' || c == '\t' || c == '\r')
        {
          ++_pos;
        }
        else if (c == '#')
        {
          _pos = std::min(_input.find('\n', _pos), _input.size());
        }
        else
        {
          break;
        }
      }
      if (_pos >= _input.size())
      {
        return make(token::end);
      }

      char c = _input[_pos];
      switch (c)
      {
      case '\n':
      {
        token t = make(token::newline);
        ++_pos;
        ++_line;
        return t;
      }
      case '=':
        ++_pos;
        return make(token::equals);
      case ',':
        ++_pos;
        return make(token::comma);
      case '[':
        ++_pos;
        return make(token::open_bracket);
      case ']':
        ++_pos;
        return make(token::close_bracket);
      case '"':
      case '\'':
        return make(token::string, quoted());
      default:
        break;
      }

      if (!isWordChar(c))
      {
        fail(_line, std::string("unexpected character '") + c + "'");
      }
      std::size_t start = _pos;
      while (_pos < _input.size() && isWordChar(_input[_pos]))
      {
        ++_pos;
      }
      return make(token::word, _input.substr(start, _pos - start));
    }

    /// \brief Basic strings take backslash escapes; literal strings do not.
    std::string quoted()
    {
      const char quote = _input[_pos++];
      std::string out;
      for (;;)
      {
        if (_pos >= _input.size() || _input[_pos] == '\n')
        {
          fail(_line, "unterminated string");
        }
        char c = _input[_pos++];
        if (c == quote)
        {
          return out;
        }
        if (c != '\\' || quote == '\'')
        {
          out += c;
          continue;
        }
        if (_pos >= _input.size())
        {
          fail(_line, "unterminated string");
        }
        char esc = _input[_pos++];
        static const std::map<char, char> escapes = {{'n', '\n'}, {'t', '\t'}, {'r', '\r'},
                                                     {'b', '\b'}, {'f', '\f'}, {'\\', '\\'},
                                                     {'"', '"'}};
        auto it = escapes.find(esc);
        if (it == escapes.end())
        {
          fail(_line, std::string("unknown escape '\\") + esc + "'");
        }
        out += it->second;
      }
    }
  };
} // namespace detail

/// \brief Builds a table from TOML text.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)), _lex(_input) {}
  parser(const parser &) = delete;
  parser &operator=(const parser &) = delete;

  table parse()
  {
    table root;
    table *section = &root;

    for (;;)
    {
      const detail::token &t = _lex.peek();
      if (t.kind == detail::token::end)
      {
        return root;
      }
      if (t.kind == detail::token::newline)
      {
        _lex.next();
        continue;
      }

      if (t.kind == detail::token::open_bracket)
      {
        _lex.next();
        std::vector<std::string> path = keyPath(detail::token::close_bracket);
        require(detail::token::close_bracket, "expected ']' to close table header");
        section = openTables(root, path, "table header");
      }
      else
      {
        std::size_t line = t.line;
        std::vector<std::string> path = keyPath(detail::token::equals);
        require(detail::token::equals, "expected '=' after key");
        value_type value = parseValue();

        std::string leaf = path.back();
        path.pop_back();
        table *target = openTables(*section, path, "dotted key");
        if (target->contains(leaf))
        {
          _lex.fail(line, "duplicate key '" + leaf + "'");
        }
        (*target)[leaf] = node(std::move(value));
      }

      const detail::token &after = _lex.peek();
      if (after.kind != detail::token::newline && after.kind != detail::token::end)
      {
        _lex.fail(after.line, "unexpected trailing characters");
      }
    }
  }

private:
  std::string _input;
  detail::lexer _lex;

  void require(detail::token::kind_t kind, const char *message)
  {
    detail::token t = _lex.next();
    if (t.kind != kind)
    {
      _lex.fail(t.line, message);
    }
  }

  /// \brief Reads `a.b."c d"` up to \p stop. A word token may carry several
  /// dot-separated parts.
  std::vector<std::string> keyPath(detail::token::kind_t stop)
  {
    std::vector<std::string> parts;
    bool wantDot = false;
    std::size_t line = _lex.peek().line;

    while (_lex.peek().kind != stop)
    {
      detail::token t = _lex.next();
      if (t.kind == detail::token::string)
      {
        if (wantDot)
        {
          _lex.fail(t.line, "expected '.' between key parts");
        }
        parts.push_back(t.text);
        wantDot = true;
        continue;
      }
      if (t.kind != detail::token::word)
      {
        _lex.fail(t.line, "expected a key");
      }

      std::vector<std::string> pieces;
      std::istringstream in(t.text + ".");
      for (std::string piece; std::getline(in, piece, '.');)
      {
        pieces.push_back(piece);
      }
      // "a.b." splits into {a, b, ""}; a leading "" joins to the previous part.
      std::size_t first = 0;
      if (wantDot)
      {
        if (!pieces.front().empty())
        {
          _lex.fail(t.line, "expected '.' between key parts");
        }
        first = 1;
      }
      for (std::size_t i = first; i < pieces.size(); ++i)
      {
        bool last = i + 1 == pieces.size();
        if (pieces[i].empty() && !last)
        {
          _lex.fail(t.line, "empty key part");
        }
        if (!pieces[i].empty())
        {
          if (pieces[i].find('+') != std::string::npos)
          {
            _lex.fail(t.line, "invalid key '" + pieces[i] + "'");
          }
          parts.push_back(pieces[i]);
        }
      }
      wantDot = !t.text.empty() && t.text.back() != '.';
    }

    if (parts.empty() || !wantDot)
    {
      _lex.fail(line, "expected a key");
    }
    return parts;
  }

  table *openTables(table &from, const std::vector<std::string> &path, const char *what)
  {
    table *scope = &from;
    for (const auto &key : path)
    {
      node &slot = (*scope)[key];
      if (!slot)
      {
        slot = node(std::make_shared<table>());
      }
      scope = slot.as_table();
      if (!scope)
      {
        _lex.fail(_lex.peek().line, std::string(what) + " redefines value '" + key + "'");
      }
    }
    return scope;
  }

  value_type parseValue()
  {
    detail::token t = _lex.next();
    switch (t.kind)
    {
    case detail::token::string:
      return t.text;
    case detail::token::open_bracket:
      return parseArray();
    case detail::token::word:
      return scalar(t);
    default:
      _lex.fail(t.line, "invalid value");
    }
  }

  value_type parseArray()
  {
    auto items = std::make_shared<array>();
    for (;;)
    {
      skipNewlines();
      if (_lex.peek().kind == detail::token::close_bracket)
      {
        _lex.next();
        return items;
      }
      items->push_back(parseValue());
      skipNewlines();

      detail::token sep = _lex.next();
      if (sep.kind == detail::token::close_bracket)
      {
        return items;
      }
      if (sep.kind != detail::token::comma)
      {
        _lex.fail(sep.line, "expected ',' or ']' in array");
      }
    }
  }

  void skipNewlines()
  {
    while (_lex.peek().kind == detail::token::newline)
    {
      _lex.next();
    }
  }

  /// \brief Booleans, integers and floats. Underscores between digits are
  /// ignored.
  value_type scalar(const detail::token &t)
  {
    if (t.text == "true")
    {
      return true;
    }
    if (t.text == "false")
    {
      return false;
    }

    std::string digits;
    std::copy_if(t.text.begin(), t.text.end(), std::back_inserter(digits),
                 [](char c) { return c != '_'; });
    bool numeric = !digits.empty() &&
                   std::all_of(digits.begin(), digits.end(),
                               [](char c)
                               {
                                 return std::isdigit(static_cast<unsigned char>(c)) ||
                                        c == '+' || c == '-' || c == '.' || c == 'e' ||
                                        c == 'E';
                               });
    if (!numeric)
    {
      _lex.fail(t.line, "invalid value '" + t.text + "'");
    }

    bool fractional = digits.find_first_of(".eE") != std::string::npos;
    std::size_t used = 0;
    value_type result;
    try
    {
      if (fractional)
      {
        result = std::stod(digits, &used);
      }
      else
      {
        result = static_cast<int64_t>(std::stoll(digits, &used));
      }
    }
    catch (const std::logic_error &)
    {
      used = 0;
    }
    if (used == 0 || used != digits.size())
    {
      _lex.fail(t.line, "invalid number '" + t.text + "'");
    }
    return result;
  }
};

inline table parse(const std::string &tomlString) { return parser(tomlString).parse(); }

/// \throws std::runtime_error when the file cannot be opened or parsed.
inline table parse_file(const std::string &filename)
{
  std::ifstream in(filename, std::ios::binary);
  if (!in)
  {
    throw std::runtime_error("Cannot open file: " + filename);
  }
  std::ostringstream content;
  content << in.rdbuf();
  return parse(content.str());
}

} // namespace toml
} // namespace parsers
} // namespace vulcan
