// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace torgate
{
namespace parsers
{
namespace toml
{

class table;
class array;
class node;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Raised for malformed documents; carries the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &message, std::size_t line)
      : std::runtime_error("TOML parse error at line " + std::to_string(line) + ": " + message),
        _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type val) { _values.push_back(std::move(val)); }

  std::size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type &operator[](std::size_t idx) const { return _values[idx]; }
  value_type &back() { return _values.back(); }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(value_type val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  array *as_array()
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return is_value(); }

  const value_type &get_value() const { return _value; }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  std::size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Resolve "a.b.c" through nested tables; empty node if absent
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    while (current)
    {
      std::size_t dot = dottedPath.find('.', start);
      std::string part = dottedPath.substr(start, dot == std::string::npos ? dot : dot - start);
      auto it = current->_values.find(part);
      if (it == current->_values.end())
        return node();
      if (dot == std::string::npos)
        return it->second;
      current = it->second.as_table();
      start = dot + 1;
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: tables,
/// arrays of tables, dotted headers, strings, integers, floats, booleans
/// and (nested) arrays. Inline tables and dates are not supported.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    while (true)
    {
      skipWhitespaceAndComments();
      if (isEnd())
        break;

      if (peek() == '[')
      {
        current = parseHeader(root);
      }
      else
      {
        std::string key = parseKey();
        skipWhitespace();
        if (peek() != '=')
          fail("expected '=' after key '" + key + "'");
        advance();
        skipWhitespace();
        if (current->contains(key))
          fail("duplicate key '" + key + "'");
        current->insert(key, parseValue());
      }
      expectEndOfLine();
    }
    return root;
  }

private:
  std::string _input;
  std::size_t _pos = 0;
  std::size_t _line = 1;

  [[noreturn]] void fail(const std::string &message) const { throw parse_error(message, _line); }

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }
  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void skipWhitespace()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipWhitespaceAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (std::isspace(static_cast<unsigned char>(c)))
        advance();
      else if (c == '#')
        skipComment();
      else
        break;
    }
  }

  void expectEndOfLine()
  {
    skipWhitespace();
    skipComment();
    if (!isEnd() && peek() != '\n' && peek() != '\r')
      fail(std::string("unexpected character '") + peek() + "'");
  }

  static std::vector<std::string> splitPath(const std::string &path)
  {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.'))
    {
      std::size_t b = part.find_first_not_of(" \t");
      std::size_t e = part.find_last_not_of(" \t");
      parts.push_back(b == std::string::npos ? "" : part.substr(b, e - b + 1));
    }
    return parts;
  }

  /// Handles both "[a.b]" and "[[a.b]]"; returns the table that
  /// subsequent key/value pairs belong to.
  table *parseHeader(table &root)
  {
    advance();
    bool arrayOfTables = false;
    if (peek() == '[')
    {
      arrayOfTables = true;
      advance();
    }

    std::string path;
    while (!isEnd() && peek() != ']' && peek() != '\n')
      path += advance();
    if (peek() != ']')
      fail("unterminated table header");
    advance();
    if (arrayOfTables)
    {
      if (peek() != ']')
        fail("unterminated array-of-tables header");
      advance();
    }

    auto parts = splitPath(path);
    for (const auto &p : parts)
    {
      if (p.empty())
        fail("empty segment in table header '" + path + "'");
    }

    table *parent = &root;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i)
      parent = descend(*parent, parts[i], path);

    const std::string &leaf = parts.back();
    if (!arrayOfTables)
      return descend(*parent, leaf, path);

    node &slot = (*parent)[leaf];
    if (!slot.is_value())
      slot = node(std::make_shared<array>());
    array *arr = slot.as_array();
    if (!arr)
      fail("'" + path + "' is not an array of tables");
    auto tbl = std::make_shared<table>();
    table *raw = tbl.get();
    arr->push_back(std::move(tbl));
    return raw;
  }

  /// Step into (creating if needed) the table \p key of \p parent. When the
  /// key names an array of tables, the most recently added element is used.
  table *descend(table &parent, const std::string &key, const std::string &path)
  {
    node &slot = parent[key];
    if (!slot.is_value())
      slot = node(std::make_shared<table>());
    if (table *t = slot.as_table())
      return t;
    if (array *arr = slot.as_array())
    {
      if (!arr->empty())
      {
        if (auto *last = std::get_if<std::shared_ptr<table>>(&arr->back()))
          return last->get();
      }
    }
    fail("'" + path + "' conflicts with an existing value");
  }

  std::string parseKey()
  {
    if (peek() == '"' || peek() == '\'')
      return parseString();
    std::string key;
    while (!isEnd() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                        peek() == '-'))
    {
      key += advance();
    }
    if (key.empty())
      fail(std::string("invalid key character '") + peek() + "'");
    return key;
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == '[')
      return node(parseArray());
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return node(parseNumber());
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      if (c == '\\' && quote == '"')
      {
        char esc = advance();
        switch (esc)
        {
        case 'n':
          str += '\n';
          break;
        case 't':
          str += '\t';
          break;
        case 'r':
          str += '\r';
          break;
        case '\\':
        case '"':
          str += esc;
          break;
        default:
          fail(std::string("unknown escape '\\") + esc + "'");
        }
      }
      else
      {
        str += c;
      }
    }
    if (peek() != quote)
      fail("unterminated string");
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance();
    auto arr = std::make_shared<array>();
    skipWhitespaceAndComments();
    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue().get_value());
      skipWhitespaceAndComments();
      if (peek() == ',')
      {
        advance();
        skipWhitespaceAndComments();
      }
      else if (peek() != ']')
      {
        fail("expected ',' or ']' in array");
      }
    }
    if (peek() != ']')
      fail("unterminated array");
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();
    if (word == "true")
      return true;
    if (word == "false")
      return false;
    fail("invalid boolean '" + word + "'");
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      num += advance();
    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && isFloat))
        break;
      num += advance();
    }
    try
    {
      if (isFloat)
        return std::stod(num);
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      fail("invalid number '" + num + "'");
    }
  }
};

inline table parse(const std::string &document)
{
  parser p(document);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace torgate
