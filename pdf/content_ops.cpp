/* File: content_ops.cpp
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

#include "content_ops.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pdfcensor::pdf {

namespace {

class OpCollector : public QPDFObjectHandle::ParserCallbacks {
 public:
  explicit OpCollector(std::vector<ContentOp> &dest) : dest_(dest) {}

  void handleObject(QPDFObjectHandle obj) override {
    if (obj.isInlineImage()) {
      // the tokenizer may hand over the image data together with EI
      std::string data = obj.getInlineImageValue();
      const bool has_ei =
        data.size() >= 2 && data.compare(data.size() - 2, 2, "EI") == 0;
      if (has_ei) {
        data.erase(data.size() - 2);
      }
      current_.inline_image = std::move(data);
      if (has_ei && in_inline_image_) {
        FinishInlineImage();
      }
      return;
    }
    if (!obj.isOperator()) {
      operands_.push_back(obj);
      return;
    }
    const std::string oper = obj.getOperatorValue();
    if (oper == kOpInlineImage) {
      in_inline_image_ = true;
      current_ = ContentOp{};
      current_.op = kOpInlineImage;
      operands_.clear();
      return;
    }
    if (in_inline_image_) {
      if (oper == "ID") {
        current_.operands = std::move(operands_);
        operands_.clear();
      } else if (oper == "EI") {
        FinishInlineImage();
      }
      return;
    }
    if (oper == "EI") {
      // already closed together with the image data
      operands_.clear();
      return;
    }
    ContentOp content_op;
    content_op.operands = std::move(operands_);
    content_op.op = oper;
    operands_.clear();
    dest_.push_back(std::move(content_op));
  }

  void handleEOF() override {}

 private:
  void FinishInlineImage() {
    in_inline_image_ = false;
    operands_.clear();
    dest_.push_back(std::move(current_));
    current_ = ContentOp{};
  }

  std::vector<ContentOp> &dest_;
  std::vector<QPDFObjectHandle> operands_;
  ContentOp current_;
  bool in_inline_image_ = false;
};

} // namespace

std::vector<ContentOp> ParseContentOps(QPDFObjectHandle stream_or_array) {
  std::vector<ContentOp> res;
  if (stream_or_array.isNull()) {
    return res;
  }
  OpCollector collector(res);
  QPDFObjectHandle::parseContentStream(stream_or_array, &collector);
  return res;
}

std::string SerializeContentOp(const ContentOp &op) {
  std::ostringstream builder;
  if (op.IsInlineImage()) {
    builder << kOpInlineImage;
    for (const auto &operand : op.operands) {
      builder << " " << operand.unparse();
    }
    builder << " ID " << op.inline_image;
    if (op.inline_image.empty() ||
        std::isspace(static_cast<unsigned char>(op.inline_image.back())) ==
          0) {
      builder << "\n";
    }
    builder << "EI\n";
    return builder.str();
  }
  for (const auto &operand : op.operands) {
    builder << operand.unparse() << " ";
  }
  builder << op.op << "\n";
  return builder.str();
}

std::string SerializeContentOps(const std::vector<ContentOp> &ops) {
  std::string res;
  for (const auto &op : ops) {
    res += SerializeContentOp(op);
  }
  return res;
}

} // namespace pdfcensor::pdf
