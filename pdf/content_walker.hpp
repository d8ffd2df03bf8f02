/* File: content_walker.hpp
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

#include <memory>
#include <string>
#include <vector>

#include "content_ops.hpp"
#include "font_info.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::pdf {

struct TextState {
  double char_spacing = 0;
  double word_spacing = 0;
  double h_scale = 1;
  double leading = 0;
  double font_size = 0;
  double rise = 0;
  std::shared_ptr<const FontInfo> font;
};

struct GraphicsState {
  Matrix ctm;
  TextState text;
};

/**
 * @brief A glyph painted by a text showing operator
 */
struct PositionedGlyph {
  /// raw character code bytes
  std::string bytes;
  /// UTF-8, empty if the code can not be mapped
  std::string unicode;
  /// glyph box in default user space
  BBox box;
  /// baseline origin in default user space
  XYReal origin;
  /// unit vector along the baseline
  XYReal direction;
  /// font height in default user space
  double size = 0;
  /// horizontal displacement in unscaled text space
  double advance = 0;
};

/**
 * @brief Tracks the graphics and text state while walking a content stream
 */
class ContentWalker {
 public:
  /**
   * @brief Construct a new Content Walker
   * @param resources /Resources of the page or form, may be null
   * @param initial state at the beginning of the stream
   * @param fonts cache shared by the whole document
   */
  ContentWalker(QPDFObjectHandle resources, GraphicsState initial,
                FontCache &fonts);

  /**
   * @brief Update the state with a non painting operator
   * @details For ' and " only the line move (and the spacing of ") is
   * applied, the string must be shown with ShowString.
   */
  void ApplyState(const ContentOp &op);

  /**
   * @brief ApplyState and show the strings of Tj, TJ, ' and "
   * @return std::vector<PositionedGlyph> glyphs painted by the operator
   */
  std::vector<PositionedGlyph> Apply(const ContentOp &op);

  /// @brief show a string, the text matrix moves after each glyph
  std::vector<PositionedGlyph> ShowString(const std::string &bytes);

  /// @brief apply a number from the TJ array
  void ApplyAdjustment(double num) noexcept;

  /**
   * @brief TJ number that moves as far as a glyph with the advance
   * @return 0 if the current font size or scale is 0
   */
  [[nodiscard]] double AdjustmentFor(double advance) const noexcept;

  /// @brief find a XObject in the resources, null if missing
  [[nodiscard]] QPDFObjectHandle LookupXObject(const std::string &name) const;

  /**
   * @brief State for the form XObject content
   * @details The form /Matrix is concatenated with the current CTM.
   */
  [[nodiscard]] GraphicsState FormState(QPDFObjectHandle form) const;

  /// @brief form resources, the current resources if the form has none
  [[nodiscard]] QPDFObjectHandle FormResources(QPDFObjectHandle form) const;

  [[nodiscard]] const GraphicsState &State() const noexcept { return state_; }
  [[nodiscard]] const QPDFObjectHandle &Resources() const noexcept {
    return resources_;
  }
  [[nodiscard]] FontCache &Fonts() noexcept { return fonts_; }

 private:
  void NextLine(double t_x, double t_y) noexcept;
  [[nodiscard]] Matrix RenderingMatrix() const noexcept;

  QPDFObjectHandle resources_;
  GraphicsState state_;
  std::vector<GraphicsState> stack_;
  Matrix text_matrix_;
  Matrix line_matrix_;
  FontCache &fonts_;
};

} // namespace pdfcensor::pdf
