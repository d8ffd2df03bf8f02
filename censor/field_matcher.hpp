/* File: field_matcher.hpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace pdfcensor::censor {

enum class FieldKind { kGender, kAge };

/// @brief "gender" or "age"
std::string FieldKindName(FieldKind kind);

/**
 * @brief One pattern of the field vocabulary
 * @details value_group is the regex group holding the value, 0 for the whole
 * match.
 */
struct TokenPattern {
  std::string expression;
  size_t value_group = 0;
  bool ignore_case = false;
};

/// @brief a value found in a line, position and length are byte offsets
struct TokenMatch {
  size_t position = 0;
  size_t length = 0;
  std::string value;
};

/**
 * @brief Finds a field value in a line of text
 */
class IFieldMatcher {
 public:
  IFieldMatcher() = default;
  IFieldMatcher(const IFieldMatcher &) = delete;
  IFieldMatcher(IFieldMatcher &&) = delete;
  IFieldMatcher &operator=(const IFieldMatcher &) = delete;
  IFieldMatcher &operator=(IFieldMatcher &&) = delete;
  virtual ~IFieldMatcher() = default;

  [[nodiscard]] virtual FieldKind Kind() const noexcept = 0;

  /**
   * @brief Find the leftmost value in the line
   * @param line UTF-8 text
   * @return std::nullopt if there is no value
   */
  [[nodiscard]] virtual std::optional<TokenMatch> FindFirst(
    const std::string &line) const = 0;
};

/**
 * @brief Matcher built from ECMAScript regular expressions
 */
class RegexFieldMatcher : public IFieldMatcher {
 public:
  /**
   * @brief Construct a new Regex Field Matcher
   * @param kind
   * @param patterns
   * @throws std::invalid_argument for an empty list, a bad expression or a
   * group number out of range
   */
  RegexFieldMatcher(FieldKind kind, const std::vector<TokenPattern> &patterns);

  [[nodiscard]] FieldKind Kind() const noexcept override { return kind_; }

  [[nodiscard]] std::optional<TokenMatch> FindFirst(
    const std::string &line) const override;

 private:
  struct Compiled {
    std::regex regex;
    size_t group = 0;
  };

  FieldKind kind_;
  std::vector<Compiled> patterns_;
};

using MatcherSet = std::map<FieldKind, std::shared_ptr<const IFieldMatcher>>;

/// @brief default gender vocabulary
std::vector<TokenPattern> DefaultGenderPatterns();

/// @brief default age vocabulary
std::vector<TokenPattern> DefaultAgePatterns();

/// @brief matchers for both kinds with the default vocabulary
MatcherSet DefaultMatchers();

} // namespace pdfcensor::censor
