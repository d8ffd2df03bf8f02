/* File: field_matcher.cpp
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

#include "field_matcher.hpp"

#include <stdexcept>
#include <utility>

namespace pdfcensor::censor {

std::string FieldKindName(FieldKind kind) {
  switch (kind) {
    case FieldKind::kGender:
      return "gender";
    case FieldKind::kAge:
      return "age";
  }
  return "unknown";
}

RegexFieldMatcher::RegexFieldMatcher(FieldKind kind,
                                     const std::vector<TokenPattern> &patterns)
  : kind_(kind) {
  const std::string func_name = "[RegexFieldMatcher] ";
  if (patterns.empty()) {
    throw std::invalid_argument(func_name + "no patterns for " +
                                FieldKindName(kind));
  }
  for (const auto &pattern : patterns) {
    auto flags = std::regex::ECMAScript;
    if (pattern.ignore_case) {
      flags |= std::regex::icase;
    }
    Compiled compiled;
    try {
      compiled.regex = std::regex(pattern.expression, flags);
    } catch (const std::regex_error &ex) {
      throw std::invalid_argument(func_name + "bad pattern '" +
                                  pattern.expression + "' " + ex.what());
    }
    if (pattern.value_group > compiled.regex.mark_count()) {
      throw std::invalid_argument(func_name + "no group " +
                                  std::to_string(pattern.value_group) +
                                  " in pattern '" + pattern.expression + "'");
    }
    compiled.group = pattern.value_group;
    patterns_.push_back(std::move(compiled));
  }
}

std::optional<TokenMatch> RegexFieldMatcher::FindFirst(
  const std::string &line) const {
  std::optional<TokenMatch> res;
  for (const auto &pattern : patterns_) {
    std::smatch match;
    if (!std::regex_search(line, match, pattern.regex) ||
        !match[pattern.group].matched) {
      continue;
    }
    const auto position = static_cast<size_t>(match.position(pattern.group));
    if (res && res->position <= position) {
      continue;
    }
    res = TokenMatch{position, static_cast<size_t>(match.length(pattern.group)),
                     match.str(pattern.group)};
  }
  return res;
}

std::vector<TokenPattern> DefaultGenderPatterns() {
  return {{R"(\b(Masculino|Femenino)\b)", 0, false},
          {R"(\b(?:Sex|Gender|Sexo)\s*:?\s*(Male|Female|M|F)\b)", 1, true},
          {R"(\b(Male|Female)\b)", 0, false}};
}

std::vector<TokenPattern> DefaultAgePatterns() {
  return {{"\\((\\d{1,3}) a\xC3\xB1os\\)", 0, false},
          {R"(\b(?:Age|Edad)\s*:?\s*(\d{1,3})\b)", 1, true},
          {R"(\b(\d{1,3})\s*(?:years?|yrs?)\b)", 1, true}};
}

MatcherSet DefaultMatchers() {
  MatcherSet res;
  res[FieldKind::kGender] = std::make_shared<const RegexFieldMatcher>(
    FieldKind::kGender, DefaultGenderPatterns());
  res[FieldKind::kAge] = std::make_shared<const RegexFieldMatcher>(
    FieldKind::kAge, DefaultAgePatterns());
  return res;
}

} // namespace pdfcensor::censor
