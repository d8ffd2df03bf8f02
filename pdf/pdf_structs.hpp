/* File: pdf_structs.hpp
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

#include "pdf_defs.hpp"
#include <optional>
#include <qpdf/QPDFObjectHandle.hh>
#include <string>

namespace pdfcensor::pdf {

struct XYReal {
  double x = 0;
  double y = 0;

  [[nodiscard]] std::string ToString() const;
};

struct BBox {
  XYReal left_bottom;
  XYReal right_top;

  [[nodiscard]] double Width() const noexcept {
    return right_top.x - left_bottom.x;
  }
  [[nodiscard]] double Height() const noexcept {
    return right_top.y - left_bottom.y;
  }

  /// @brief true if the boxes share some area (touching edges do not count)
  [[nodiscard]] bool Intersects(const BBox &other) const noexcept;

  /// @brief true if other lies completely inside this box
  [[nodiscard]] bool Contains(const BBox &other) const noexcept;

  /// @brief smallest box covering both
  [[nodiscard]] BBox Union(const BBox &other) const noexcept;

  [[nodiscard]] std::string ToString() const;

  static BBox FromXYWH(double x_pos, double y_pos, double width,
                       double height) noexcept;
};

/*
Transformation matrix in pdf
[a b 0]
[c d 0]
[e f 1]
*/

struct Matrix {
  double a = 1;
  double b = 0;
  double c = 0;
  double d = 1;
  double e = 0;
  double f = 0;

  [[nodiscard]] std::string toString() const;

  /**
   * @brief this x other (row vector convention, this is applied first)
   */
  [[nodiscard]] Matrix Multiply(const Matrix &other) const noexcept;

  [[nodiscard]] XYReal Transform(const XYReal &point) const noexcept;

  /// @brief transform without translation
  [[nodiscard]] XYReal TransformVector(const XYReal &vec) const noexcept;

  /// @brief axis-aligned hull of the transformed corners
  [[nodiscard]] BBox TransformBox(const BBox &box) const noexcept;

  /// @return std::nullopt for singular matrix
  [[nodiscard]] std::optional<Matrix> Inverse() const noexcept;

  static Matrix Translate(double t_x, double t_y) noexcept {
    return Matrix{1, 0, 0, 1, t_x, t_y};
  }

  /**
   * @brief Read [a b c d e f] array or 6 operands
   * @return std::nullopt if the array is not 6 numbers
   */
  static std::optional<Matrix> FromArray(QPDFObjectHandle arr) noexcept;
};

} // namespace pdfcensor::pdf
