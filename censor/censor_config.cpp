/* File: censor_config.cpp
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

#include "censor_config.hpp"

#include <boost/json.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pdfcensor::censor {

namespace json = boost::json;

namespace {

constexpr const char *const kFuncName = "[ParseConfig] ";
// checked before the cast to size_t
constexpr double kMaxGroupNumber = 1000;

double ToDouble(const json::value &val, const std::string &what) {
  if (val.is_double()) {
    return val.get_double();
  }
  if (val.is_int64()) {
    return static_cast<double>(val.get_int64());
  }
  if (val.is_uint64()) {
    return static_cast<double>(val.get_uint64());
  }
  throw std::runtime_error(kFuncName + what + " must be a number");
}

bool ToBool(const json::value &val, const std::string &what) {
  if (!val.is_bool()) {
    throw std::runtime_error(kFuncName + what + " must be true or false");
  }
  return val.get_bool();
}

const json::object &ToObject(const json::value &val, const std::string &what) {
  if (!val.is_object()) {
    throw std::runtime_error(kFuncName + what + " must be an object");
  }
  return val.get_object();
}

const json::array &ToArray(const json::value &val, const std::string &what) {
  if (!val.is_array()) {
    throw std::runtime_error(kFuncName + what + " must be an array");
  }
  return val.get_array();
}

double RequiredNumber(const json::object &obj, const char *key,
                      const std::string &what) {
  const auto *val = obj.if_contains(key);
  if (val == nullptr) {
    throw std::runtime_error(kFuncName + what + " has no " + key);
  }
  return ToDouble(*val, what + "." + key);
}

std::vector<RedactionRegion> ParseRegions(const json::value &val) {
  std::vector<RedactionRegion> res;
  const auto &arr = ToArray(val, "regions");
  for (size_t i = 0; i < arr.size(); ++i) {
    const std::string what = "regions[" + std::to_string(i) + "]";
    RedactionRegion region;
    if (arr[i].is_array()) {
      const auto &coords = arr[i].get_array();
      if (coords.size() != 4) {
        throw std::runtime_error(kFuncName + what +
                                 " must have 4 numbers: x, y, width, height");
      }
      region.x = ToDouble(coords[0], what);
      region.y = ToDouble(coords[1], what);
      region.width = ToDouble(coords[2], what);
      region.height = ToDouble(coords[3], what);
    } else {
      const auto &obj = ToObject(arr[i], what);
      region.x = RequiredNumber(obj, "x", what);
      region.y = RequiredNumber(obj, "y", what);
      region.width = RequiredNumber(obj, "width", what);
      region.height = RequiredNumber(obj, "height", what);
    }
    res.push_back(region);
  }
  ValidateRegions(res);
  return res;
}

PreserveLayout ParseLayout(const json::value &val) {
  PreserveLayout res;
  const auto &obj = ToObject(val, "preserve");
  if (const auto *x_val = obj.if_contains("x")) {
    res.x = ToDouble(*x_val, "preserve.x");
  }
  if (const auto *y_val = obj.if_contains("y")) {
    res.y = ToDouble(*y_val, "preserve.y");
  }
  if (const auto *size_val = obj.if_contains("font_size")) {
    res.font_size = ToDouble(*size_val, "preserve.font_size");
  }
  ValidateLayout(res);
  return res;
}

std::vector<TokenPattern> ParsePatterns(const json::value &val,
                                        const std::string &what) {
  std::vector<TokenPattern> res;
  const auto &arr = ToArray(val, what);
  for (size_t i = 0; i < arr.size(); ++i) {
    const std::string item_what = what + "[" + std::to_string(i) + "]";
    const auto &obj = ToObject(arr[i], item_what);
    const auto *pattern = obj.if_contains("pattern");
    if (pattern == nullptr || !pattern->is_string()) {
      throw std::runtime_error(kFuncName + item_what +
                               ".pattern must be a string");
    }
    TokenPattern token;
    token.expression = std::string(pattern->get_string());
    if (const auto *group = obj.if_contains("group")) {
      const double group_num = ToDouble(*group, item_what + ".group");
      if (!(group_num >= 0 && group_num <= kMaxGroupNumber) ||
          std::floor(group_num) != group_num) {
        throw std::runtime_error(kFuncName + item_what +
                                 ".group must be a non-negative integer");
      }
      token.value_group = static_cast<size_t>(group_num);
    }
    if (const auto *icase = obj.if_contains("ignore_case")) {
      token.ignore_case = ToBool(*icase, item_what + ".ignore_case");
    }
    res.push_back(std::move(token));
  }
  return res;
}

} // namespace

CensorConfig ParseConfig(const std::string &json_text) {
  boost::system::error_code err;
  const json::value root = json::parse(json_text, err);
  if (err) {
    throw std::runtime_error(kFuncName + std::string("malformed JSON: ") +
                             err.message());
  }
  const auto &obj = ToObject(root, "configuration");
  CensorConfig res;
  if (const auto *regions = obj.if_contains("regions")) {
    res.params.regions = ParseRegions(*regions);
  }
  if (const auto *use_template = obj.if_contains("default_template")) {
    res.params.use_default_template =
      ToBool(*use_template, "default_template");
  }
  if (const auto *include_info = obj.if_contains("include_info")) {
    res.params.include_info = ToBool(*include_info, "include_info");
  }
  if (const auto *preserve = obj.if_contains("preserve")) {
    res.params.layout = ParseLayout(*preserve);
  }
  if (const auto *patterns = obj.if_contains("patterns")) {
    const auto &patterns_obj = ToObject(*patterns, "patterns");
    if (const auto *gender = patterns_obj.if_contains("gender")) {
      res.params.matchers[FieldKind::kGender] =
        std::make_shared<const RegexFieldMatcher>(
          FieldKind::kGender, ParsePatterns(*gender, "patterns.gender"));
    }
    if (const auto *age = patterns_obj.if_contains("age")) {
      res.params.matchers[FieldKind::kAge] =
        std::make_shared<const RegexFieldMatcher>(
          FieldKind::kAge, ParsePatterns(*age, "patterns.age"));
    }
  }
  if (const auto *jobs = obj.if_contains("jobs")) {
    const bool valid =
      (jobs->is_int64() && jobs->get_int64() > 0 &&
       jobs->get_int64() <= std::numeric_limits<unsigned int>::max()) ||
      (jobs->is_uint64() && jobs->get_uint64() > 0 &&
       jobs->get_uint64() <= std::numeric_limits<unsigned int>::max());
    if (!valid) {
      throw std::runtime_error(std::string(kFuncName) +
                               "jobs must be a positive integer");
    }
    res.jobs = jobs->is_int64() ? static_cast<unsigned int>(jobs->get_int64())
                                : static_cast<unsigned int>(jobs->get_uint64());
  }
  return res;
}

CensorConfig LoadConfig(const std::string &path) {
  std::ifstream ifile(path);
  if (!ifile.is_open()) {
    throw std::runtime_error("[LoadConfig] can't open " + path);
  }
  std::ostringstream buf;
  buf << ifile.rdbuf();
  if (ifile.bad()) {
    throw std::runtime_error("[LoadConfig] can't read " + path);
  }
  return ParseConfig(buf.str());
}

} // namespace pdfcensor::censor
