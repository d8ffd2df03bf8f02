/* File: pdf_utils.hpp
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
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <string>
#include <vector>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::pdf {
/**
 * @brief Load file to vector
 *
 * @return optional std::vector<unsigned char> - empty if fail
 */
std::optional<std::vector<unsigned char>> FileToVector(
  const std::string &path) noexcept;

/**
 * @brief Return double as string with max 10 digits after point
 * @param val
 * @return std::string
 */
std::string DoubleToString10(double val);

/**
 * @brief Return the page MediaBox (inherited value included)
 * @param page_obj
 * @return BBox in default user space
 */
std::optional<BBox> PageMediaBox(const QPDFObjectHandle &page_obj) noexcept;

/**
 * @brief Converts pdf dictionary to unparsed map "/Key" -> "Value"
 * @param dict object
 * @return std::map<std::string, std::string>  unparsed dictionary
 */
std::map<std::string, std::string> DictToUnparsedMap(QPDFObjectHandle &dict);

/**
 * @brief Join an unparsed dictionary map to signle string
 * @param map
 * @return std::string
 */
std::string UnparsedMapToString(const std::map<std::string, std::string> &map);

/**
 * @brief Read the stream data with generalized filters decoded
 * @param stream
 * @return std::string decoded bytes
 * @throws QPDFExc if the data can not be decoded
 */
std::string StreamDataToString(QPDFObjectHandle stream);

/**
 * @brief Unique key for the object - "id gen" for indirect objects, unparsed
 * value for direct ones
 */
std::string ObjectKey(const QPDFObjectHandle &obj);

/// @brief numeric value of a number object, 0 for anything else
double NumberOrZero(const QPDFObjectHandle &obj) noexcept;

/// @brief append a code point to the UTF-8 string
void AppendUtf8(std::string &dest, uint32_t code_point);

/**
 * @brief Decode UTF-16BE bytes (surrogate pairs included) to UTF-8
 * @param utf16be raw bytes
 * @return std::string UTF-8
 */
std::string Utf16BeToUtf8(const std::string &utf16be);

/**
 * @brief Map one WinAnsiEncoding byte to the Unicode code point
 * @return 0 if the code is not defined
 */
uint32_t WinAnsiToUnicode(unsigned char code) noexcept;

/**
 * @brief Encode UTF-8 text with WinAnsiEncoding
 * @details characters without WinAnsi code are replaced with '?'
 */
std::string Utf8ToWinAnsi(const std::string &utf8);

} // namespace pdfcensor::pdf
