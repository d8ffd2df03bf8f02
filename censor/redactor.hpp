/* File: redactor.hpp
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
#include "document.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::censor {

/// @brief rectangle in default user space of the page, y goes up
struct RedactionRegion {
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;

  [[nodiscard]] pdf::BBox ToBBox() const noexcept {
    return pdf::BBox::FromXYWH(x, y, width, height);
  }

  [[nodiscard]] std::string ToString() const;
};

/**
 * @brief Check the region dimensions
 * @throws std::invalid_argument for a non-positive or non-finite value, the
 * message names the region index and dimensions
 */
void ValidateRegions(const std::vector<RedactionRegion> &regions);

/**
 * @brief Remove everything under the regions and paint them black
 * @details Glyphs, images, inline images and form XObject content that
 * intersect a region are deleted from the page, annotations whose /Rect
 * intersects a region are removed. Regions outside the page are skipped.
 * The source document is not changed.
 * @param doc source
 * @param regions
 * @param logger may be nullptr
 * @return CensoredDocument
 * @throws std::invalid_argument for invalid regions (nothing is done)
 * @throws std::runtime_error (QPDFExc) for damaged content
 */
CensoredDocument Redact(const pdf::Document &doc,
                        const std::vector<RedactionRegion> &regions,
                        const std::shared_ptr<spdlog::logger> &logger = nullptr);

} // namespace pdfcensor::censor
