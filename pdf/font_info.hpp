/* File: font_info.hpp
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

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::pdf {

/// @brief one character code taken from a shown string
struct CharCode {
  uint32_t code = 0;
  std::string bytes;
};

/**
 * @brief Parse a ToUnicode CMap (bfchar and bfrange sections)
 * @param cmap decoded CMap stream
 * @return std::map<uint32_t, std::string> code -> UTF-8
 */
std::map<uint32_t, std::string> ParseToUnicodeCMap(const std::string &cmap);

/**
 * @brief Metrics and text decoding of one font resource
 * @details Simple fonts use one byte codes, Type0 fonts are read as two byte
 * codes (Identity-H and similar CMaps). Widths, ascent and descent are in
 * glyph space, FontMatrix() maps them to text space (1/1000 for all fonts
 * but Type3).
 */
class FontInfo {
 public:
  /**
   * @brief Build from a font dictionary
   * @param font /Font resource entry, may be null
   */
  explicit FontInfo(QPDFObjectHandle font);

  /// @brief split a shown string into character codes
  [[nodiscard]] std::vector<CharCode> SplitCodes(
    const std::string &bytes) const;

  /// @brief horizontal displacement in glyph space units
  [[nodiscard]] double Width(uint32_t code) const noexcept;

  /// @brief UTF-8 text for the code, empty if it can not be recovered
  [[nodiscard]] std::string ToUnicode(uint32_t code) const;

  [[nodiscard]] bool IsTwoByte() const noexcept { return two_byte_; }
  [[nodiscard]] double Ascent() const noexcept { return ascent_; }
  [[nodiscard]] double Descent() const noexcept { return descent_; }
  [[nodiscard]] const Matrix &FontMatrix() const noexcept {
    return font_matrix_;
  }

 private:
  void ReadSimpleWidths(QPDFObjectHandle &font);
  void ReadCidWidths(QPDFObjectHandle &cid_font);
  void ReadDescriptor(QPDFObjectHandle descriptor);
  void ReadDifferences(QPDFObjectHandle encoding);
  void ReadType3Metrics(QPDFObjectHandle &font);

  bool two_byte_ = false;
  double default_width_ = kDefaultGlyphWidth;
  double ascent_ = kDefaultAscent;
  double descent_ = kDefaultDescent;
  Matrix font_matrix_{1 / kGlyphUnits, 0, 0, 1 / kGlyphUnits, 0, 0};
  std::unordered_map<uint32_t, double> widths_;
  std::map<uint32_t, std::string> to_unicode_;
  std::unordered_map<uint32_t, std::string> differences_;
};

/**
 * @brief Per document cache of parsed fonts
 */
class FontCache {
 public:
  /// @brief parsed font for the resource entry, never nullptr
  std::shared_ptr<const FontInfo> Get(QPDFObjectHandle font);

 private:
  std::unordered_map<std::string, std::shared_ptr<const FontInfo>> fonts_;
};

} // namespace pdfcensor::pdf
