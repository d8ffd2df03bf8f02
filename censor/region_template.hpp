/* File: region_template.hpp
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

#include <vector>

#include "pdf_structs.hpp"
#include "redactor.hpp"

namespace pdfcensor::censor {

/**
 * @brief Rectangle of a region template
 * @details x1, x2 are taken from the left edge of the MediaBox. y1, y2 are
 * mirrored against the page width: the covered band starts (width - y2) and
 * ends (width - y1) below the top edge.
 */
struct TemplateRect {
  double x1 = 0;
  double y1 = 0;
  double x2 = 0;
  double y2 = 0;
};

/// @brief the built-in template used when no region is given
const std::vector<TemplateRect> &DefaultTemplate();

/**
 * @brief Convert template rectangles to regions of a page
 * @param rects template
 * @param media_box of the page
 * @return std::vector<RedactionRegion> in default user space, regions that
 * fall outside the page are kept (the redactor skips them)
 * @throws std::invalid_argument if a rectangle has x2 <= x1 or y2 <= y1
 */
std::vector<RedactionRegion> TemplateRegions(
  const std::vector<TemplateRect> &rects, const pdf::BBox &media_box);

} // namespace pdfcensor::censor
