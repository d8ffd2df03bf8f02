/* File: censor_config.hpp
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

#include <optional>
#include <string>

#include "censor_pipeline.hpp"

namespace pdfcensor::censor {

struct CensorConfig {
  CensorParams params;
  std::optional<unsigned int> jobs;
};

/**
 * @brief Parse the JSON configuration
 * @details Keys (all optional): "regions" - array of {x, y, width, height}
 * objects or [x, y, width, height] arrays, "default_template" - bool, add
 * the built-in template regions, "include_info" - bool,
 * "preserve" - {x, y, font_size}, "patterns" - {gender, age}, each an array
 * of {pattern, group, ignore_case}, "jobs" - positive integer.
 * @param json_text
 * @return CensorConfig
 * @throws std::runtime_error for malformed JSON or wrong value types
 * @throws std::invalid_argument for invalid regions or patterns
 */
CensorConfig ParseConfig(const std::string &json_text);

/**
 * @brief Read and parse the configuration file
 * @throws std::runtime_error if the file can not be read
 */
CensorConfig LoadConfig(const std::string &path);

} // namespace pdfcensor::censor
