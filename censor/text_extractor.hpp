/* File: text_extractor.hpp
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
#include <string>
#include <vector>

#include "content_walker.hpp"
#include "document.hpp"
#include "field_matcher.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::censor {

/// @brief a gender or age value located on the page
struct ExtractedField {
  FieldKind kind = FieldKind::kGender;
  std::string value;
  pdf::BBox box;
};

/**
 * @brief One line of text in reading order
 * @details glyph_of_byte maps every byte of text to the index in
 * PageText::glyphs, kNoGlyph marks the inserted spaces.
 */
struct TextLine {
  static constexpr size_t kNoGlyph = static_cast<size_t>(-1);

  std::string text;
  std::vector<size_t> glyph_of_byte;
};

struct PageText {
  std::vector<pdf::PositionedGlyph> glyphs;
  std::vector<TextLine> lines;

  /// @brief true if at least one glyph maps to a non-whitespace character
  [[nodiscard]] bool HasRecoverableGlyphs() const noexcept;

  /// @brief lines joined with '\n'
  [[nodiscard]] std::string Text() const;
};

/**
 * @brief Extract the text of a page object
 * @details Form XObjects painted by the page are walked too.
 * @param page page dictionary
 * @return PageText
 * @throws QPDFExc for damaged content streams
 */
PageText ExtractPageText(QPDFObjectHandle page);

/**
 * @brief Extract the text of the first page of the document
 * @throws std::runtime_error if the document has no pages
 */
PageText ExtractPageText(const pdf::Document &doc);

/**
 * @brief Find the preserved fields in the page text
 * @details At most one field per kind, the first one in reading order.
 * A missing kind is not an error.
 */
std::vector<ExtractedField> ExtractFields(const PageText &page_text,
                                          const MatcherSet &matchers);

/// @brief ExtractPageText + ExtractFields
std::vector<ExtractedField> ExtractFields(const pdf::Document &doc,
                                          const MatcherSet &matchers);

} // namespace pdfcensor::censor
