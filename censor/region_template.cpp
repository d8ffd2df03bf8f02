/* File: region_template.cpp
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

#include "region_template.hpp"

#include <stdexcept>
#include <string>

namespace pdfcensor::censor {

const std::vector<TemplateRect> &DefaultTemplate() {
  static const std::vector<TemplateRect> rects{
    {39.2821, 7.81606, 95.3558, 107.861},
    {21.7321, 7.99649, 37.7421, 268.27},
    {568.015, 688.962, 584.025, 767.536}};
  return rects;
}

std::vector<RedactionRegion> TemplateRegions(
  const std::vector<TemplateRect> &rects, const pdf::BBox &media_box) {
  std::vector<RedactionRegion> res;
  res.reserve(rects.size());
  const double page_width = media_box.Width();
  for (size_t i = 0; i < rects.size(); ++i) {
    const TemplateRect &rect = rects[i];
    if (!(rect.x2 > rect.x1) || !(rect.y2 > rect.y1)) {
      throw std::invalid_argument("[TemplateRegions] template rectangle " +
                                  std::to_string(i) + " is empty");
    }
    RedactionRegion region;
    region.x = media_box.left_bottom.x + rect.x1;
    region.y = media_box.right_top.y - (page_width - rect.y1);
    region.width = rect.x2 - rect.x1;
    region.height = rect.y2 - rect.y1;
    res.push_back(region);
  }
  return res;
}

} // namespace pdfcensor::censor
