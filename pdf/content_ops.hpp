/* File: content_ops.hpp
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

#include <string>
#include <vector>

#include "pdf_defs.hpp"

namespace pdfcensor::pdf {

constexpr const char *const kOpInlineImage = "BI";

/**
 * @brief One content stream operation: operands followed by the operator
 * @details An inline image (BI ... ID ... EI) is kept as a single operation
 * with operator "BI", the image dictionary entries as operands and the raw
 * image bytes in inline_image.
 */
struct ContentOp {
  std::vector<QPDFObjectHandle> operands;
  std::string op;
  std::string inline_image;

  [[nodiscard]] bool IsInlineImage() const noexcept {
    return op == kOpInlineImage;
  }
};

/**
 * @brief Parse a content stream (or an array of streams)
 * @param stream_or_array page /Contents or a form XObject stream
 * @return std::vector<ContentOp>
 * @throws QPDFExc for damaged content
 */
std::vector<ContentOp> ParseContentOps(QPDFObjectHandle stream_or_array);

/**
 * @brief Write operations back to the content stream syntax
 * @param ops
 * @return std::string ready to be a stream data
 */
std::string SerializeContentOps(const std::vector<ContentOp> &ops);

/// @brief one operation, newline terminated
std::string SerializeContentOp(const ContentOp &op);

} // namespace pdfcensor::pdf
