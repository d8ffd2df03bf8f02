/* File: field_preserver.cpp
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

#include "field_preserver.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfcensor::censor {

namespace {

constexpr const char *const kFontNamePrefix = "/PcF";
constexpr double kLineSpacing = 1.5;

// name of the Courier font in the page resources, added if missing
std::string AddCourierFont(QPDF &qpdf, QPDFObjectHandle page) {
  QPDFPageObjectHelper page_helper(page);
  auto resources = page_helper.getAttribute(pdf::kTagResources, true);
  if (!resources.isDictionary()) {
    resources = QPDFObjectHandle::newDictionary();
    page.replaceKey(pdf::kTagResources, resources);
  }
  auto old_fonts = resources.getKey(pdf::kTagFont);
  QPDFObjectHandle fonts = old_fonts.isDictionary()
                             ? old_fonts.shallowCopy()
                             : QPDFObjectHandle::newDictionary();
  int counter = 0;
  std::string name;
  do {
    name = kFontNamePrefix + std::to_string(++counter);
  } while (fonts.hasKey(name));
  auto font = QPDFObjectHandle::newDictionary();
  font.replaceKey(pdf::kTagType, QPDFObjectHandle::newName(pdf::kTagFont));
  font.replaceKey(pdf::kTagSubType, QPDFObjectHandle::newName(pdf::kTagType1));
  font.replaceKey(pdf::kTagBaseFont, QPDFObjectHandle::newName("/Courier"));
  font.replaceKey(pdf::kTagEncoding,
                  QPDFObjectHandle::newName(pdf::kWinAnsiEncoding));
  fonts.replaceKey(name, qpdf.makeIndirectObject(font));
  resources.replaceKey(pdf::kTagFont, fonts);
  return name;
}

} // namespace

void ValidateLayout(const PreserveLayout &layout) {
  if (!std::isfinite(layout.x) || !std::isfinite(layout.y)) {
    throw std::invalid_argument(
      "[ValidateLayout] preserved fields position must be finite");
  }
  if (!std::isfinite(layout.font_size) || layout.font_size <= 0) {
    throw std::invalid_argument(
      "[ValidateLayout] preserved fields font size must be positive");
  }
}

std::string PreservedText(const std::vector<ExtractedField> &fields) {
  std::string res;
  for (const FieldKind kind : {FieldKind::kGender, FieldKind::kAge}) {
    auto it_field =
      std::find_if(fields.cbegin(), fields.cend(),
                   [kind](const ExtractedField &field) {
                     return field.kind == kind && !field.value.empty();
                   });
    if (it_field == fields.cend()) {
      continue;
    }
    if (!res.empty()) {
      res.push_back(' ');
    }
    res += it_field->value;
  }
  return res;
}

CensoredDocument ApplyPreservedFields(
  CensoredDocument doc, const std::vector<ExtractedField> &fields,
  bool include_info, const PreserveLayout &layout,
  const std::shared_ptr<spdlog::logger> &logger) {
  const std::string func_name = "[ApplyPreservedFields] ";
  if (!include_info) {
    return doc;
  }
  const std::string text = PreservedText(fields);
  if (text.empty()) {
    return doc;
  }
  ValidateLayout(layout);
  QPDFObjectHandle page = doc.GetPage();
  const auto media_box = pdf::PageMediaBox(page);
  if (!media_box) {
    throw std::runtime_error(func_name + pdf::kErrPageSize);
  }
  const std::string encoded = pdf::Utf8ToWinAnsi(text);
  const double font_size = layout.font_size;
  const double width = static_cast<double>(encoded.size()) * font_size *
                       pdf::kCourierGlyphWidth / pdf::kGlyphUnits;
  const double ascent = font_size * pdf::kDefaultAscent / pdf::kGlyphUnits;
  const double descent = font_size * pdf::kDefaultDescent / pdf::kGlyphUnits;
  const double x_pos = media_box->left_bottom.x + layout.x;
  double y_pos = media_box->left_bottom.y + layout.y;
  std::optional<double> free_line;
  while (y_pos + ascent <= media_box->right_top.y) {
    const pdf::BBox line{{x_pos, y_pos + descent}, {x_pos + width, y_pos + ascent}};
    const auto &regions = doc.AppliedRegions();
    const bool overlaps = std::any_of(
      regions.cbegin(), regions.cend(),
      [&line](const pdf::BBox &region) { return region.Intersects(line); });
    if (!overlaps) {
      free_line = y_pos;
      break;
    }
    y_pos += font_size * kLineSpacing;
  }
  if (!free_line) {
    // the regions cover the whole column, the page stays fully redacted
    if (logger) {
      logger->warn("{}no free line for the preserved fields, skipped",
                   func_name);
    }
    return doc;
  }
  const std::string font_name = AddCourierFont(doc.GetQPDF(), page);
  std::ostringstream builder;
  builder << "q\n0 g\nBT\n"
          << font_name << " " << pdf::DoubleToString10(font_size) << " Tf\n"
          << pdf::DoubleToString10(x_pos) << " "
          << pdf::DoubleToString10(*free_line) << " Td\n"
          << QPDFObjectHandle::newString(encoded).unparse() << " Tj\n"
          << "ET\nQ\n";
  doc.AppendPageContent(builder.str());
  return doc;
}

} // namespace pdfcensor::censor
