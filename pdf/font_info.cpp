/* File: font_info.cpp
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

#include "font_info.hpp"

#include <cctype>
#include <cstddef>
#include <exception>
#include <map>
#include <string>
#include <vector>

#include "pdf_utils.hpp"

namespace pdfcensor::pdf {

namespace {

// a token of the CMap syntax
struct CMapToken {
  enum class Kind { kHex, kArrayOpen, kArrayClose, kWord };
  Kind kind = Kind::kWord;
  std::string value;
};

std::string HexToBytes(const std::string &hex) {
  std::string digits;
  for (const char sym : hex) {
    if (std::isxdigit(static_cast<unsigned char>(sym)) != 0) {
      digits.push_back(sym);
    }
  }
  if (digits.size() % 2 != 0) {
    digits.push_back('0');
  }
  std::string res;
  for (size_t i = 0; i < digits.size(); i += 2) {
    res.push_back(static_cast<char>(std::stoi(digits.substr(i, 2), nullptr, 16)));
  }
  return res;
}

uint32_t BytesToCode(const std::string &bytes) noexcept {
  uint32_t res = 0;
  for (const char sym : bytes) {
    res = (res << 8U) | static_cast<unsigned char>(sym);
  }
  return res;
}

std::vector<CMapToken> TokenizeCMap(const std::string &cmap) {
  std::vector<CMapToken> res;
  size_t pos = 0;
  while (pos < cmap.size()) {
    const char sym = cmap[pos];
    if (std::isspace(static_cast<unsigned char>(sym)) != 0) {
      ++pos;
      continue;
    }
    if (sym == '%') {
      while (pos < cmap.size() && cmap[pos] != '\n' && cmap[pos] != '\r') {
        ++pos;
      }
      continue;
    }
    if (sym == '<') {
      if (pos + 1 < cmap.size() && cmap[pos + 1] == '<') {
        pos += 2;
        continue;
      }
      const size_t end = cmap.find('>', pos);
      if (end == std::string::npos) {
        break;
      }
      res.push_back(
        {CMapToken::Kind::kHex, HexToBytes(cmap.substr(pos + 1, end - pos - 1))});
      pos = end + 1;
      continue;
    }
    if (sym == '>') {
      ++pos;
      continue;
    }
    if (sym == '[') {
      res.push_back({CMapToken::Kind::kArrayOpen, {}});
      ++pos;
      continue;
    }
    if (sym == ']') {
      res.push_back({CMapToken::Kind::kArrayClose, {}});
      ++pos;
      continue;
    }
    if (sym == '(') {
      // literal strings are not used for mappings, skip
      int depth = 0;
      while (pos < cmap.size()) {
        if (cmap[pos] == '\\') {
          pos += 2;
          continue;
        }
        if (cmap[pos] == '(') {
          ++depth;
        } else if (cmap[pos] == ')' && --depth == 0) {
          ++pos;
          break;
        }
        ++pos;
      }
      continue;
    }
    std::string word;
    while (pos < cmap.size() &&
           std::isspace(static_cast<unsigned char>(cmap[pos])) == 0 &&
           cmap[pos] != '<' && cmap[pos] != '[' && cmap[pos] != ']' &&
           cmap[pos] != '(' && cmap[pos] != '%') {
      word.push_back(cmap[pos]);
      ++pos;
    }
    if (word.empty()) {
      ++pos;
      continue;
    }
    res.push_back({CMapToken::Kind::kWord, std::move(word)});
  }
  return res;
}

// increment the last byte of the UTF-16BE destination
std::string IncrementUtf16(std::string dst, uint32_t offset) {
  if (dst.size() < 2) {
    return dst;
  }
  uint32_t last = (static_cast<unsigned char>(dst[dst.size() - 2]) << 8U) |
                  static_cast<unsigned char>(dst.back());
  last += offset;
  dst[dst.size() - 2] = static_cast<char>((last >> 8U) & 0xFFU);
  dst.back() = static_cast<char>(last & 0xFFU);
  return dst;
}

// glyph names used in /Differences by the common producers
const std::map<std::string, uint32_t> &GlyphNames() {
  static const std::map<std::string, uint32_t> names{
    {"space", 0x20},      {"exclam", 0x21},     {"quotedbl", 0x22},
    {"numbersign", 0x23}, {"dollar", 0x24},     {"percent", 0x25},
    {"ampersand", 0x26},  {"quotesingle", 0x27}, {"parenleft", 0x28},
    {"parenright", 0x29}, {"asterisk", 0x2A},   {"plus", 0x2B},
    {"comma", 0x2C},      {"hyphen", 0x2D},     {"period", 0x2E},
    {"slash", 0x2F},      {"zero", 0x30},       {"one", 0x31},
    {"two", 0x32},        {"three", 0x33},      {"four", 0x34},
    {"five", 0x35},       {"six", 0x36},        {"seven", 0x37},
    {"eight", 0x38},      {"nine", 0x39},       {"colon", 0x3A},
    {"semicolon", 0x3B},  {"less", 0x3C},       {"equal", 0x3D},
    {"greater", 0x3E},    {"question", 0x3F},   {"at", 0x40},
    {"underscore", 0x5F}, {"aacute", 0xE1},     {"eacute", 0xE9},
    {"iacute", 0xED},     {"oacute", 0xF3},     {"uacute", 0xFA},
    {"ntilde", 0xF1},     {"Aacute", 0xC1},     {"Eacute", 0xC9},
    {"Iacute", 0xCD},     {"Oacute", 0xD3},     {"Uacute", 0xDA},
    {"Ntilde", 0xD1},     {"udieresis", 0xFC},  {"ordfeminine", 0xAA},
    {"ordmasculine", 0xBA}};
  return names;
}

std::string GlyphNameToUtf8(const std::string &name) {
  std::string res;
  if (name.size() == 1 &&
      std::isalpha(static_cast<unsigned char>(name[0])) != 0) {
    res = name;
    return res;
  }
  if (name.size() == 7 && name.compare(0, 3, "uni") == 0) {
    try {
      AppendUtf8(res, static_cast<uint32_t>(std::stoul(name.substr(3), nullptr, 16)));
    } catch (const std::exception & /*ex*/) {
      res.clear();
    }
    return res;
  }
  const auto &names = GlyphNames();
  auto it_name = names.find(name);
  if (it_name != names.cend()) {
    AppendUtf8(res, it_name->second);
  }
  return res;
}

} // namespace

std::map<uint32_t, std::string> ParseToUnicodeCMap(const std::string &cmap) {
  std::map<uint32_t, std::string> res;
  const auto tokens = TokenizeCMap(cmap);
  using Kind = CMapToken::Kind;
  size_t pos = 0;
  const auto is_hex = [&tokens](size_t ind) {
    return ind < tokens.size() && tokens[ind].kind == Kind::kHex;
  };
  while (pos < tokens.size()) {
    const auto &token = tokens[pos];
    if (token.kind == Kind::kWord && token.value == "beginbfchar") {
      ++pos;
      while (is_hex(pos) && is_hex(pos + 1)) {
        res[BytesToCode(tokens[pos].value)] =
          Utf16BeToUtf8(tokens[pos + 1].value);
        pos += 2;
      }
      continue;
    }
    if (token.kind == Kind::kWord && token.value == "beginbfrange") {
      ++pos;
      while (is_hex(pos) && is_hex(pos + 1) && pos + 2 < tokens.size()) {
        const uint32_t low = BytesToCode(tokens[pos].value);
        const uint32_t high = BytesToCode(tokens[pos + 1].value);
        pos += 2;
        if (high < low) {
          // skip the malformed destination
          ++pos;
          continue;
        }
        if (tokens[pos].kind == Kind::kHex) {
          for (uint32_t code = low; code <= high; ++code) {
            res[code] = Utf16BeToUtf8(IncrementUtf16(tokens[pos].value, code - low));
          }
          ++pos;
          continue;
        }
        if (tokens[pos].kind == Kind::kArrayOpen) {
          ++pos;
          uint32_t code = low;
          while (pos < tokens.size() && tokens[pos].kind == Kind::kHex) {
            if (code <= high) {
              res[code] = Utf16BeToUtf8(tokens[pos].value);
            }
            ++code;
            ++pos;
          }
          if (pos < tokens.size() && tokens[pos].kind == Kind::kArrayClose) {
            ++pos;
          }
          continue;
        }
        break;
      }
      continue;
    }
    ++pos;
  }
  return res;
}

FontInfo::FontInfo(QPDFObjectHandle font) {
  if (font.isNull() || !font.isDictionary()) {
    return;
  }
  const bool type0 = font.hasKey(kTagSubType) &&
                     font.getKey(kTagSubType).isName() &&
                     font.getKey(kTagSubType).getName() == kTagType0;
  if (type0) {
    two_byte_ = true;
    default_width_ = kDefaultCidWidth;
    auto descendants = font.getKey(kTagDescendantFonts);
    if (descendants.isArray() && descendants.getArrayNItems() > 0) {
      auto cid_font = descendants.getArrayItem(0);
      if (cid_font.isDictionary()) {
        ReadCidWidths(cid_font);
        ReadDescriptor(cid_font.getKey(kTagFontDescriptor));
      }
    }
  } else {
    ReadSimpleWidths(font);
    ReadDescriptor(font.getKey(kTagFontDescriptor));
    ReadDifferences(font.getKey(kTagEncoding));
    const auto subtype = font.getKey(kTagSubType);
    if (subtype.isName() && subtype.getName() == kTagType3) {
      ReadType3Metrics(font);
    }
  }
  auto to_unicode = font.getKey(kTagToUnicode);
  if (to_unicode.isStream()) {
    try {
      to_unicode_ = ParseToUnicodeCMap(StreamDataToString(to_unicode));
    } catch (const std::exception & /*ex*/) {
      // a broken CMap leaves the encoding based fallback
      to_unicode_.clear();
    }
  }
}

void FontInfo::ReadSimpleWidths(QPDFObjectHandle &font) {
  auto base_font = font.getKey(kTagBaseFont);
  if (base_font.isName() &&
      base_font.getName().find("Courier") != std::string::npos) {
    default_width_ = kCourierGlyphWidth;
  }
  auto descriptor = font.getKey(kTagFontDescriptor);
  if (descriptor.isDictionary() &&
      descriptor.getKey(kTagMissingWidth).isNumber()) {
    default_width_ = descriptor.getKey(kTagMissingWidth).getNumericValue();
  }
  auto widths = font.getKey(kTagWidths);
  auto first_char = font.getKey(kTagFirstChar);
  if (!widths.isArray() || !first_char.isInteger()) {
    return;
  }
  const auto first = first_char.getIntValue();
  const int count = widths.getArrayNItems();
  for (int i = 0; i < count; ++i) {
    auto width = widths.getArrayItem(i);
    if (width.isNumber() && first + i >= 0) {
      widths_[static_cast<uint32_t>(first + i)] = width.getNumericValue();
    }
  }
}

// /W [c [w1 w2 ...]  cfirst clast w ...]
void FontInfo::ReadCidWidths(QPDFObjectHandle &cid_font) {
  if (cid_font.getKey(kTagDW).isNumber()) {
    default_width_ = cid_font.getKey(kTagDW).getNumericValue();
  }
  auto w_arr = cid_font.getKey(kTagW);
  if (!w_arr.isArray()) {
    return;
  }
  const int count = w_arr.getArrayNItems();
  int ind = 0;
  while (ind < count) {
    auto first = w_arr.getArrayItem(ind);
    if (!first.isInteger() || ind + 1 >= count) {
      break;
    }
    const auto first_cid = static_cast<uint32_t>(first.getIntValue());
    auto next = w_arr.getArrayItem(ind + 1);
    if (next.isArray()) {
      const int n_widths = next.getArrayNItems();
      for (int i = 0; i < n_widths; ++i) {
        widths_[first_cid + static_cast<uint32_t>(i)] =
          NumberOrZero(next.getArrayItem(i));
      }
      ind += 2;
      continue;
    }
    if (!next.isInteger() || ind + 2 >= count) {
      break;
    }
    const auto last_cid = static_cast<uint32_t>(next.getIntValue());
    const double width = NumberOrZero(w_arr.getArrayItem(ind + 2));
    for (uint32_t cid = first_cid; cid <= last_cid && cid - first_cid < 0xFFFF;
         ++cid) {
      widths_[cid] = width;
    }
    ind += 3;
  }
}

void FontInfo::ReadDescriptor(QPDFObjectHandle descriptor) {
  if (!descriptor.isDictionary()) {
    return;
  }
  if (descriptor.getKey(kTagAscent).isNumber()) {
    const double ascent = descriptor.getKey(kTagAscent).getNumericValue();
    if (ascent > 0) {
      ascent_ = ascent;
    }
  }
  if (descriptor.getKey(kTagDescent).isNumber()) {
    const double descent = descriptor.getKey(kTagDescent).getNumericValue();
    if (descent < 0) {
      descent_ = descent;
    }
  }
}

// Type3 glyph space is defined by /FontMatrix, the vertical metrics come
// from /FontBBox
void FontInfo::ReadType3Metrics(QPDFObjectHandle &font) {
  const auto matrix = Matrix::FromArray(font.getKey(kTagFontMatrix));
  if (matrix && matrix->a != 0 && matrix->d != 0) {
    font_matrix_ = *matrix;
  }
  const double to_glyph_x = 1 / (kGlyphUnits * font_matrix_.a);
  const double to_glyph_y = 1 / (kGlyphUnits * font_matrix_.d);
  auto descriptor = font.getKey(kTagFontDescriptor);
  if (!descriptor.isDictionary() ||
      !descriptor.getKey(kTagMissingWidth).isNumber()) {
    default_width_ = kDefaultGlyphWidth * to_glyph_x;
  }
  ascent_ = kDefaultAscent * to_glyph_y;
  descent_ = kDefaultDescent * to_glyph_y;
  auto font_bbox = font.getKey(kTagFontBBox);
  if (font_bbox.isArray() && font_bbox.getArrayNItems() == 4) {
    const double bottom = NumberOrZero(font_bbox.getArrayItem(1));
    const double top = NumberOrZero(font_bbox.getArrayItem(3));
    // [0 0 0 0] is allowed and means unknown
    if (top > bottom) {
      ascent_ = top;
      descent_ = bottom;
    }
  }
}

void FontInfo::ReadDifferences(QPDFObjectHandle encoding) {
  if (!encoding.isDictionary()) {
    return;
  }
  auto differences = encoding.getKey(kTagDifferences);
  if (!differences.isArray()) {
    return;
  }
  uint32_t code = 0;
  const int count = differences.getArrayNItems();
  for (int i = 0; i < count; ++i) {
    auto item = differences.getArrayItem(i);
    if (item.isInteger()) {
      code = static_cast<uint32_t>(item.getIntValue());
      continue;
    }
    if (item.isName()) {
      // drop the leading slash
      std::string text = GlyphNameToUtf8(item.getName().substr(1));
      if (!text.empty()) {
        differences_[code] = std::move(text);
      }
      ++code;
    }
  }
}

std::vector<CharCode> FontInfo::SplitCodes(const std::string &bytes) const {
  std::vector<CharCode> res;
  if (!two_byte_) {
    res.reserve(bytes.size());
    for (const char sym : bytes) {
      res.push_back({static_cast<unsigned char>(sym), std::string(1, sym)});
    }
    return res;
  }
  res.reserve(bytes.size() / 2 + 1);
  for (size_t i = 0; i < bytes.size(); i += 2) {
    std::string code_bytes = bytes.substr(i, 2);
    res.push_back({BytesToCode(code_bytes), std::move(code_bytes)});
  }
  return res;
}

double FontInfo::Width(uint32_t code) const noexcept {
  auto it_width = widths_.find(code);
  return it_width != widths_.cend() ? it_width->second : default_width_;
}

std::string FontInfo::ToUnicode(uint32_t code) const {
  auto it_cmap = to_unicode_.find(code);
  if (it_cmap != to_unicode_.cend()) {
    return it_cmap->second;
  }
  if (two_byte_) {
    return {};
  }
  auto it_diff = differences_.find(code);
  if (it_diff != differences_.cend()) {
    return it_diff->second;
  }
  std::string res;
  if (code >= 0x20 && code < 0x7F) {
    res.push_back(static_cast<char>(code));
    return res;
  }
  if (code >= 0x80 && code <= 0xFF) {
    const uint32_t code_point = WinAnsiToUnicode(static_cast<unsigned char>(code));
    if (code_point != 0) {
      AppendUtf8(res, code_point);
    }
  }
  return res;
}

std::shared_ptr<const FontInfo> FontCache::Get(QPDFObjectHandle font) {
  if (font.isNull()) {
    static const auto empty_font =
      std::make_shared<const FontInfo>(QPDFObjectHandle::newNull());
    return empty_font;
  }
  const std::string key = ObjectKey(font);
  auto it_font = fonts_.find(key);
  if (it_font != fonts_.cend()) {
    return it_font->second;
  }
  auto res = std::make_shared<const FontInfo>(font);
  fonts_.emplace(key, res);
  return res;
}

} // namespace pdfcensor::pdf
