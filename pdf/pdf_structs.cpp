/* File: pdf_structs.cpp
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


#include "pdf_structs.hpp"
#include "pdf_utils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
namespace pdfcensor::pdf {

std::string XYReal::ToString() const {
  std::ostringstream builder;
  builder << DoubleToString10(x) << " " << DoubleToString10(y);
  return builder.str();
}

bool BBox::Intersects(const BBox &other) const noexcept {
  const double ix1 = std::max(left_bottom.x, other.left_bottom.x);
  const double ix2 = std::min(right_top.x, other.right_top.x);
  const double iy1 = std::max(left_bottom.y, other.left_bottom.y);
  const double iy2 = std::min(right_top.y, other.right_top.y);
  if (ix1 > ix2 || iy1 > iy2) {
    return false;
  }
  // a degenerate box (zero-width glyph) hits when it lies on the other box
  const bool x_ok = ix1 < ix2 || Width() == 0 || other.Width() == 0;
  const bool y_ok = iy1 < iy2 || Height() == 0 || other.Height() == 0;
  return x_ok && y_ok;
}

bool BBox::Contains(const BBox &other) const noexcept {
  return other.left_bottom.x >= left_bottom.x &&
         other.left_bottom.y >= left_bottom.y &&
         other.right_top.x <= right_top.x && other.right_top.y <= right_top.y;
}

BBox BBox::Union(const BBox &other) const noexcept {
  BBox res;
  res.left_bottom.x = std::min(left_bottom.x, other.left_bottom.x);
  res.left_bottom.y = std::min(left_bottom.y, other.left_bottom.y);
  res.right_top.x = std::max(right_top.x, other.right_top.x);
  res.right_top.y = std::max(right_top.y, other.right_top.y);
  return res;
}

std::string BBox::ToString() const {
  std::ostringstream builder;
  builder << "[ " << left_bottom.ToString() << " " << right_top.ToString()
          << " ]";
  return builder.str();
}

BBox BBox::FromXYWH(double x_pos, double y_pos, double width,
                    double height) noexcept {
  BBox res;
  res.left_bottom = {x_pos, y_pos};
  res.right_top = {x_pos + width, y_pos + height};
  return res;
}

std::string Matrix::toString() const {
  std::ostringstream builder;
  builder << DoubleToString10(a) << " " << DoubleToString10(b) << " "
          << DoubleToString10(c) << " " << DoubleToString10(d) << " "
          << DoubleToString10(e) << " " << DoubleToString10(f);
  return builder.str();
}

Matrix Matrix::Multiply(const Matrix &other) const noexcept {
  Matrix res;
  res.a = a * other.a + b * other.c;
  res.b = a * other.b + b * other.d;
  res.c = c * other.a + d * other.c;
  res.d = c * other.b + d * other.d;
  res.e = e * other.a + f * other.c + other.e;
  res.f = e * other.b + f * other.d + other.f;
  return res;
}

XYReal Matrix::Transform(const XYReal &point) const noexcept {
  return {a * point.x + c * point.y + e, b * point.x + d * point.y + f};
}

XYReal Matrix::TransformVector(const XYReal &vec) const noexcept {
  return {a * vec.x + c * vec.y, b * vec.x + d * vec.y};
}

BBox Matrix::TransformBox(const BBox &box) const noexcept {
  const XYReal corners[4] = {
    Transform(box.left_bottom),
    Transform({box.right_top.x, box.left_bottom.y}),
    Transform(box.right_top),
    Transform({box.left_bottom.x, box.right_top.y})};
  BBox res{corners[0], corners[0]};
  for (const auto &corner : corners) {
    res.left_bottom.x = std::min(res.left_bottom.x, corner.x);
    res.left_bottom.y = std::min(res.left_bottom.y, corner.y);
    res.right_top.x = std::max(res.right_top.x, corner.x);
    res.right_top.y = std::max(res.right_top.y, corner.y);
  }
  return res;
}

std::optional<Matrix> Matrix::Inverse() const noexcept {
  const double det = a * d - b * c;
  if (std::fabs(det) < 1e-12) {
    return std::nullopt;
  }
  Matrix res;
  res.a = d / det;
  res.b = -b / det;
  res.c = -c / det;
  res.d = a / det;
  res.e = (c * f - d * e) / det;
  res.f = (b * e - a * f) / det;
  return res;
}

std::optional<Matrix> Matrix::FromArray(QPDFObjectHandle arr) noexcept {
  if (!arr.isArray() || arr.getArrayNItems() != 6) {
    return std::nullopt;
  }
  double vals[6] = {};
  for (int i = 0; i < 6; ++i) {
    auto item = arr.getArrayItem(i);
    if (!item.isNumber()) {
      return std::nullopt;
    }
    vals[i] = item.getNumericValue();
  }
  return Matrix{vals[0], vals[1], vals[2], vals[3], vals[4], vals[5]};
}

} // namespace pdfcensor::pdf
