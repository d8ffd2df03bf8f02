/* File: pdf_utils.cpp
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

#include "pdf_utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ios>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::pdf {

namespace {

// WinAnsiEncoding 0x80..0x9F, 0 - undefined
constexpr std::array<uint32_t, 32> kWinAnsiHigh = {
  0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
  0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
  0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
  0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178};

} // namespace

// read file to vector
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept {
  namespace fs = std::filesystem;
  std::error_code err;
  if (path.empty() || !fs::exists(path, err) ||
      !fs::is_regular_file(path, err)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios_base::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::vector<unsigned char> res;
  try {
    res.reserve(std::filesystem::file_size(path));
    for (auto it = std::istreambuf_iterator<char>(file);
         it != std::istreambuf_iterator<char>(); ++it) {
      res.push_back(*it);
    }
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    file.close();
    return std::nullopt;
  }
  file.close();
  return res;
}

std::string DoubleToString10(double val) {
  std::ostringstream builder;
  builder << std::setprecision(10) << std::fixed << val;
  std::string res = builder.str();
  res.erase(res.find_last_not_of('0') + 1, std::string::npos);
  if (res.back() == '.') {
    res.pop_back();
  }
  if (res == "-0") {
    res = "0";
  }
  return res;
}

std::optional<BBox> PageMediaBox(const QPDFObjectHandle &page_obj) noexcept {
  try {
    if (page_obj.isNull() || !page_obj.isDictionary() ||
        !page_obj.hasKey(kTagType) || !page_obj.getKey(kTagType).isName() ||
        page_obj.getKey(kTagType).getName() != kTagPage) {
      return std::nullopt;
    }
    QPDFPageObjectHelper page_helper(page_obj);
    auto media_box = page_helper.getMediaBox();
    if (!media_box.isRectangle()) {
      return std::nullopt;
    }
    auto rect = media_box.getArrayAsRectangle();
    BBox res;
    res.left_bottom.x = std::min(rect.llx, rect.urx);
    res.left_bottom.y = std::min(rect.lly, rect.ury);
    res.right_top.x = std::max(rect.llx, rect.urx);
    res.right_top.y = std::max(rect.lly, rect.ury);
    return res;
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    return std::nullopt;
  }
}

/**
 * @brief Converts pdf dictionary to unparsed map "/Key" -> "Value"
 * @param dict object
 * @return std::map<std::string, std::string>  unparsed dictionary
 */
std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict) {
  if (!dict.isDictionary()) {
    return {};
  }
  auto src_map = dict.getDictAsMap();
  std::map<std::string, std::string> unparsed_map;
  std::for_each(
    src_map.begin(), src_map.end(),
    [&unparsed_map](std::pair<const std::string, QPDFObjectHandle> &pair_val) {
      unparsed_map[pair_val.first] = pair_val.second.unparse();
    });
  return unparsed_map;
}

std::string UnparsedMapToString(const std::map<std::string, std::string> &map) {
  std::ostringstream builder;
  std::for_each(map.cbegin(), map.cend(),
                [&builder](const std::pair<std::string, std::string> &pair) {
                  builder << pair.first << " " << pair.second << "\n";
                });
  return builder.str();
}

std::string StreamDataToString(QPDFObjectHandle stream) {
  auto buf = stream.getStreamData(qpdf_dl_generalized);
  if (!buf || buf->getSize() == 0) {
    return {};
  }
  return {reinterpret_cast<const char *>(buf->getBuffer()), // NOLINT
          buf->getSize()};
}

std::string ObjectKey(const QPDFObjectHandle &obj) {
  if (obj.isIndirect()) {
    return std::to_string(obj.getObjectID()) + " " +
           std::to_string(obj.getGeneration());
  }
  return obj.unparse();
}

double NumberOrZero(const QPDFObjectHandle &obj) noexcept {
  return obj.isNumber() ? obj.getNumericValue() : 0;
}

void AppendUtf8(std::string &dest, uint32_t code_point) {
  if (code_point < 0x80) {
    dest.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    dest.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    dest.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    dest.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    dest.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    dest.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x110000) {
    dest.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    dest.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    dest.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    dest.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::string Utf16BeToUtf8(const std::string &utf16be) {
  std::string res;
  const size_t units = utf16be.size() / 2;
  for (size_t i = 0; i < units; ++i) {
    const auto high = static_cast<unsigned char>(utf16be[2 * i]);
    const auto low = static_cast<unsigned char>(utf16be[2 * i + 1]);
    uint32_t unit = (static_cast<uint32_t>(high) << 8) | low;
    if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < units) {
      const auto high2 = static_cast<unsigned char>(utf16be[2 * (i + 1)]);
      const auto low2 = static_cast<unsigned char>(utf16be[2 * (i + 1) + 1]);
      const uint32_t unit2 = (static_cast<uint32_t>(high2) << 8) | low2;
      if (unit2 >= 0xDC00 && unit2 <= 0xDFFF) {
        unit = 0x10000 + ((unit - 0xD800) << 10) + (unit2 - 0xDC00);
        ++i;
      }
    }
    AppendUtf8(res, unit);
  }
  return res;
}

uint32_t WinAnsiToUnicode(unsigned char code) noexcept {
  if (code >= 0x80 && code <= 0x9F) {
    return kWinAnsiHigh[code - 0x80];
  }
  return code;
}

std::string Utf8ToWinAnsi(const std::string &utf8) {
  std::string res;
  size_t pos = 0;
  while (pos < utf8.size()) {
    const auto lead = static_cast<unsigned char>(utf8[pos]);
    uint32_t code_point = 0;
    size_t len = 1;
    if (lead < 0x80) {
      code_point = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      code_point = lead & 0x1F;
      len = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      code_point = lead & 0x0F;
      len = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      code_point = lead & 0x07;
      len = 4;
    } else {
      res.push_back('?');
      ++pos;
      continue;
    }
    if (pos + len > utf8.size()) {
      res.push_back('?');
      break;
    }
    for (size_t i = 1; i < len; ++i) {
      code_point = (code_point << 6) |
                   (static_cast<unsigned char>(utf8[pos + i]) & 0x3F);
    }
    pos += len;
    if (code_point < 0x80 || (code_point >= 0xA0 && code_point <= 0xFF)) {
      res.push_back(static_cast<char>(code_point));
      continue;
    }
    auto it_high =
      std::find(kWinAnsiHigh.cbegin(), kWinAnsiHigh.cend(), code_point);
    if (it_high != kWinAnsiHigh.cend()) {
      res.push_back(static_cast<char>(
        0x80 + std::distance(kWinAnsiHigh.cbegin(), it_high)));
    } else {
      res.push_back('?');
    }
  }
  return res;
}

} // namespace pdfcensor::pdf
