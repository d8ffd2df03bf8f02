/* File: content_walker.cpp
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

#include "content_walker.hpp"

#include <cmath>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pdf_utils.hpp"

namespace pdfcensor::pdf {

namespace {

double Operand(const ContentOp &op, size_t ind) noexcept {
  return ind < op.operands.size() ? NumberOrZero(op.operands[ind]) : 0;
}

std::optional<Matrix> MatrixFromOperands(const ContentOp &op) {
  if (op.operands.size() != 6) {
    return std::nullopt;
  }
  return Matrix::FromArray(QPDFObjectHandle::newArray(op.operands));
}

} // namespace

ContentWalker::ContentWalker(QPDFObjectHandle resources, GraphicsState initial,
                             FontCache &fonts)
  : resources_(std::move(resources)), state_(std::move(initial)),
    fonts_(fonts) {}

void ContentWalker::ApplyState(const ContentOp &op) {
  const std::string &oper = op.op;
  if (oper == "q") {
    stack_.push_back(state_);
  } else if (oper == "Q") {
    // unbalanced Q is ignored
    if (!stack_.empty()) {
      state_ = std::move(stack_.back());
      stack_.pop_back();
    }
  } else if (oper == "cm") {
    auto matrix = MatrixFromOperands(op);
    if (matrix) {
      state_.ctm = matrix->Multiply(state_.ctm);
    }
  } else if (oper == "BT") {
    text_matrix_ = Matrix{};
    line_matrix_ = Matrix{};
  } else if (oper == "Tf") {
    if (op.operands.size() == 2 && op.operands[0].isName()) {
      QPDFObjectHandle font = QPDFObjectHandle::newNull();
      if (resources_.isDictionary()) {
        auto font_dict = resources_.getKey(kTagFont);
        if (font_dict.isDictionary()) {
          font = font_dict.getKey(op.operands[0].getName());
        }
      }
      state_.text.font = fonts_.Get(font);
      state_.text.font_size = NumberOrZero(op.operands[1]);
    }
  } else if (oper == "Tc") {
    state_.text.char_spacing = Operand(op, 0);
  } else if (oper == "Tw") {
    state_.text.word_spacing = Operand(op, 0);
  } else if (oper == "Tz") {
    state_.text.h_scale = Operand(op, 0) / 100;
  } else if (oper == "TL") {
    state_.text.leading = Operand(op, 0);
  } else if (oper == "Ts") {
    state_.text.rise = Operand(op, 0);
  } else if (oper == "Td") {
    NextLine(Operand(op, 0), Operand(op, 1));
  } else if (oper == "TD") {
    state_.text.leading = -Operand(op, 1);
    NextLine(Operand(op, 0), Operand(op, 1));
  } else if (oper == "Tm") {
    auto matrix = MatrixFromOperands(op);
    if (matrix) {
      text_matrix_ = *matrix;
      line_matrix_ = *matrix;
    }
  } else if (oper == "T*" || oper == "'") {
    NextLine(0, -state_.text.leading);
  } else if (oper == "\"") {
    state_.text.word_spacing = Operand(op, 0);
    state_.text.char_spacing = Operand(op, 1);
    NextLine(0, -state_.text.leading);
  }
}

std::vector<PositionedGlyph> ContentWalker::Apply(const ContentOp &op) {
  ApplyState(op);
  std::vector<PositionedGlyph> res;
  if (op.operands.empty()) {
    return res;
  }
  const auto &last = op.operands.back();
  if ((op.op == "Tj" || op.op == "'" || op.op == "\"") && last.isString()) {
    return ShowString(last.getStringValue());
  }
  if (op.op == "TJ" && last.isArray()) {
    const int count = last.getArrayNItems();
    for (int i = 0; i < count; ++i) {
      auto item = last.getArrayItem(i);
      if (item.isString()) {
        auto glyphs = ShowString(item.getStringValue());
        std::move(glyphs.begin(), glyphs.end(), std::back_inserter(res));
      } else if (item.isNumber()) {
        ApplyAdjustment(item.getNumericValue());
      }
    }
  }
  return res;
}

std::vector<PositionedGlyph> ContentWalker::ShowString(
  const std::string &bytes) {
  std::vector<PositionedGlyph> res;
  if (!state_.text.font) {
    state_.text.font = fonts_.Get(QPDFObjectHandle::newNull());
  }
  const FontInfo &font = *state_.text.font;
  const TextState &text = state_.text;
  for (auto &code : font.SplitCodes(bytes)) {
    const double width = font.Width(code.code);
    const Matrix trm = RenderingMatrix();
    PositionedGlyph glyph;
    glyph.unicode = font.ToUnicode(code.code);
    // glyph space -> text space -> device
    glyph.box = font.FontMatrix().Multiply(trm).TransformBox(
      BBox{{0, font.Descent()}, {width, font.Ascent()}});
    glyph.origin = trm.Transform({0, 0});
    const XYReal dir = trm.TransformVector({1, 0});
    const double dir_len = std::hypot(dir.x, dir.y);
    glyph.direction =
      dir_len > 0 ? XYReal{dir.x / dir_len, dir.y / dir_len} : XYReal{1, 0};
    const XYReal up = trm.TransformVector({0, 1});
    glyph.size = std::hypot(up.x, up.y);
    double advance =
      font.FontMatrix().TransformVector({width, 0}).x * text.font_size +
      text.char_spacing;
    if (!font.IsTwoByte() && code.code == 32) {
      advance += text.word_spacing;
    }
    advance *= text.h_scale;
    glyph.advance = advance;
    glyph.bytes = std::move(code.bytes);
    text_matrix_ = Matrix::Translate(advance, 0).Multiply(text_matrix_);
    res.push_back(std::move(glyph));
  }
  return res;
}

void ContentWalker::ApplyAdjustment(double num) noexcept {
  const double t_x =
    -num / kGlyphUnits * state_.text.font_size * state_.text.h_scale;
  text_matrix_ = Matrix::Translate(t_x, 0).Multiply(text_matrix_);
}

double ContentWalker::AdjustmentFor(double advance) const noexcept {
  const double scale = state_.text.font_size * state_.text.h_scale;
  if (scale == 0) {
    return 0;
  }
  return -advance * kGlyphUnits / scale;
}

QPDFObjectHandle ContentWalker::LookupXObject(const std::string &name) const {
  if (!resources_.isDictionary()) {
    return QPDFObjectHandle::newNull();
  }
  auto xobjects = resources_.getKey(kTagXObject);
  if (!xobjects.isDictionary()) {
    return QPDFObjectHandle::newNull();
  }
  return xobjects.getKey(name);
}

GraphicsState ContentWalker::FormState(QPDFObjectHandle form) const {
  GraphicsState res = state_;
  if (form.isStream()) {
    auto matrix = Matrix::FromArray(form.getDict().getKey(kTagMatrix));
    if (matrix) {
      res.ctm = matrix->Multiply(state_.ctm);
    }
  }
  return res;
}

QPDFObjectHandle ContentWalker::FormResources(QPDFObjectHandle form) const {
  if (form.isStream()) {
    auto resources = form.getDict().getKey(kTagResources);
    if (resources.isDictionary()) {
      return resources;
    }
  }
  return resources_;
}

void ContentWalker::NextLine(double t_x, double t_y) noexcept {
  line_matrix_ = Matrix::Translate(t_x, t_y).Multiply(line_matrix_);
  text_matrix_ = line_matrix_;
}

Matrix ContentWalker::RenderingMatrix() const noexcept {
  const TextState &text = state_.text;
  const Matrix params{text.font_size * text.h_scale, 0, 0, text.font_size, 0,
                      text.rise};
  return params.Multiply(text_matrix_).Multiply(state_.ctm);
}

} // namespace pdfcensor::pdf
