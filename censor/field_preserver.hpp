/* File: field_preserver.hpp
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

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

#include "censored_document.hpp"
#include "text_extractor.hpp"

namespace pdfcensor::censor {

/**
 * @brief Where the preserved fields are written
 * @details x and y are offsets from the lower left corner of the MediaBox.
 */
struct PreserveLayout {
  double x = 36;
  double y = 18;
  double font_size = 10;
};

/**
 * @brief Check the layout values
 * @throws std::invalid_argument for a non-finite position or a non-positive
 * font size
 */
void ValidateLayout(const PreserveLayout &layout);

/// @brief gender and age values joined with a space
std::string PreservedText(const std::vector<ExtractedField> &fields);

/**
 * @brief Write the extracted fields back on the censored page
 * @details Courier text at the layout position. If the line overlaps a
 * blacked out region it moves up one line at a time. If no line is free
 * the fields are not written and a warning is logged.
 * @param doc censored document
 * @param fields extracted from the source
 * @param include_info if false, the document is returned unchanged
 * @param layout
 * @param logger may be nullptr
 * @return CensoredDocument
 * @throws std::invalid_argument for an invalid layout
 */
CensoredDocument ApplyPreservedFields(
  CensoredDocument doc, const std::vector<ExtractedField> &fields,
  bool include_info, const PreserveLayout &layout = {},
  const std::shared_ptr<spdlog::logger> &logger = nullptr);

} // namespace pdfcensor::censor
