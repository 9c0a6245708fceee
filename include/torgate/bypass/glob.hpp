// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Torgate, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#pragma once

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>

namespace torgate
{
namespace bypass
{

/// \brief A rule pattern (glob or address block) that could not be compiled
class CompileError : public std::runtime_error
{
public:
  CompileError(const std::string &pattern, const std::string &reason)
      : std::runtime_error("invalid pattern '" + pattern + "': " + reason), _pattern(pattern)
  {
  }

  const std::string &pattern() const { return _pattern; }

private:
  std::string _pattern;
};

/// \brief Anchored domain wildcard matcher.
///
/// `*` matches any run of characters (including none and including dots),
/// `?` matches exactly one character. Everything else is literal. The whole
/// input must match.
class GlobMatcher
{
public:
  /// \throws CompileError when the translated expression is rejected
  explicit GlobMatcher(const std::string &pattern)
      : _pattern(pattern), _expression(translate(pattern))
  {
    try
    {
      _regex = std::make_shared<const std::regex>(_expression,
                                                  std::regex::ECMAScript | std::regex::optimize);
    }
    catch (const std::regex_error &e)
    {
      throw CompileError(pattern, e.what());
    }
  }

  bool matches(const std::string &input) const { return std::regex_match(input, *_regex); }

  /// \brief The pattern as written
  const std::string &pattern() const { return _pattern; }

  /// \brief The anchored regular expression it compiled to
  const std::string &expression() const { return _expression; }

  /// \brief Glob to anchored ECMAScript expression: "*.local" -> "^.*\.local$"
  static std::string translate(const std::string &pattern)
  {
    std::string out;
    out.reserve(pattern.size() * 2 + 2);
    out += '^';
    for (char c : pattern)
    {
      switch (c)
      {
      case '*':
        out += ".*";
        break;
      case '?':
        out += '.';
        break;
      case '.':
      case '[':
      case ']':
      case '(':
      case ')':
      case '{':
      case '}':
      case '^':
      case '$':
      case '+':
      case '|':
      case '\\':
        out += '\\';
        out += c;
        break;
      default:
        out += c;
      }
    }
    out += '$';
    return out;
  }

private:
  std::string _pattern;
  std::string _expression;
  std::shared_ptr<const std::regex> _regex;
};

/// \brief Compile \p pattern, reporting failure through CompileError
inline GlobMatcher compileGlob(const std::string &pattern) { return GlobMatcher(pattern); }

} // namespace bypass
} // namespace torgate
