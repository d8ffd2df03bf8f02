/* File: text_extractor.cpp
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

#include "text_extractor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iterator>
#include <optional>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <stdexcept>
#include <utility>

#include "content_ops.hpp"
#include "pdf_defs.hpp"

namespace pdfcensor::censor {

namespace {

constexpr double kHalfPi = 1.57079632679489661923;
// a gap wider than this share of the font size is a space
constexpr double kSpaceGapFactor = 0.2;
// baselines closer than this share of the font size form one line
constexpr double kLineToleranceFactor = 0.5;

struct PlacedGlyph {
  size_t index = 0;
  int direction = 0;
  double perp = 0;
  double along = 0;
  double end = 0;
  double size = 0;
};

const std::array<pdf::XYReal, 4> &DirectionAxes() {
  static const std::array<pdf::XYReal, 4> axes{
    pdf::XYReal{1, 0}, pdf::XYReal{0, 1}, pdf::XYReal{-1, 0},
    pdf::XYReal{0, -1}};
  return axes;
}

int QuantizeDirection(const pdf::XYReal &dir) noexcept {
  const double angle = std::atan2(dir.y, dir.x);
  const auto quarter = static_cast<int>(std::lround(angle / kHalfPi));
  return ((quarter % 4) + 4) % 4;
}

double Dot(const pdf::XYReal &lhs, const pdf::XYReal &rhs) noexcept {
  return lhs.x * rhs.x + lhs.y * rhs.y;
}

bool IsBlank(const std::string &text) noexcept {
  return std::all_of(text.cbegin(), text.cend(), [](char sym) {
    return std::isspace(static_cast<unsigned char>(sym)) != 0;
  });
}

void WalkContent(const std::vector<pdf::ContentOp> &ops,
                 pdf::ContentWalker &walker, int depth,
                 std::vector<pdf::PositionedGlyph> &dest) {
  for (const auto &op : ops) {
    if (op.op == "Do" && !op.operands.empty() && op.operands[0].isName()) {
      auto xobj = walker.LookupXObject(op.operands[0].getName());
      if (!xobj.isStream() || depth >= pdf::kMaxFormDepth) {
        continue;
      }
      auto subtype = xobj.getDict().getKey(pdf::kTagSubType);
      if (!subtype.isName() || subtype.getName() != pdf::kTagForm) {
        continue;
      }
      pdf::ContentWalker form_walker(walker.FormResources(xobj),
                                     walker.FormState(xobj), walker.Fonts());
      WalkContent(pdf::ParseContentOps(xobj), form_walker, depth + 1, dest);
      continue;
    }
    auto glyphs = walker.Apply(op);
    std::move(glyphs.begin(), glyphs.end(), std::back_inserter(dest));
  }
}

std::vector<TextLine> BuildLines(
  const std::vector<pdf::PositionedGlyph> &glyphs) {
  const auto &axes = DirectionAxes();
  std::vector<PlacedGlyph> placed;
  for (size_t i = 0; i < glyphs.size(); ++i) {
    const auto &glyph = glyphs[i];
    if (glyph.unicode.empty()) {
      continue;
    }
    PlacedGlyph item;
    item.index = i;
    item.direction = QuantizeDirection(glyph.direction);
    const pdf::XYReal axis = axes[item.direction];
    const pdf::XYReal normal{-axis.y, axis.x};
    item.perp = Dot(glyph.origin, normal);
    item.along = Dot(glyph.origin, axis);
    const std::array<pdf::XYReal, 4> corners{
      glyph.box.left_bottom, glyph.box.right_top,
      pdf::XYReal{glyph.box.left_bottom.x, glyph.box.right_top.y},
      pdf::XYReal{glyph.box.right_top.x, glyph.box.left_bottom.y}};
    item.end = item.along;
    for (const auto &corner : corners) {
      item.end = std::max(item.end, Dot(corner, axis));
    }
    item.size = std::max(glyph.size, 1.0);
    placed.push_back(item);
  }
  // direction first, then top to bottom
  std::stable_sort(placed.begin(), placed.end(),
                   [](const PlacedGlyph &lhs, const PlacedGlyph &rhs) {
                     if (lhs.direction != rhs.direction) {
                       return lhs.direction < rhs.direction;
                     }
                     return lhs.perp > rhs.perp;
                   });
  std::vector<std::vector<PlacedGlyph>> groups;
  for (const auto &item : placed) {
    if (!groups.empty()) {
      const auto &head = groups.back().front();
      if (head.direction == item.direction &&
          std::abs(head.perp - item.perp) <=
            kLineToleranceFactor * std::max(head.size, item.size)) {
        groups.back().push_back(item);
        continue;
      }
    }
    groups.push_back({item});
  }
  std::vector<TextLine> res;
  res.reserve(groups.size());
  for (auto &group : groups) {
    std::stable_sort(group.begin(), group.end(),
                     [](const PlacedGlyph &lhs, const PlacedGlyph &rhs) {
                       return lhs.along < rhs.along;
                     });
    TextLine line;
    std::optional<PlacedGlyph> prev;
    for (const auto &item : group) {
      const std::string &unicode = glyphs[item.index].unicode;
      if (prev && !line.text.empty() && line.text.back() != ' ' &&
          !IsBlank(unicode) &&
          item.along - prev->end > kSpaceGapFactor * item.size) {
        line.text.push_back(' ');
        line.glyph_of_byte.push_back(TextLine::kNoGlyph);
      }
      line.text += unicode;
      line.glyph_of_byte.insert(line.glyph_of_byte.end(), unicode.size(),
                                item.index);
      prev = item;
    }
    res.push_back(std::move(line));
  }
  return res;
}

} // namespace

bool PageText::HasRecoverableGlyphs() const noexcept {
  return std::any_of(glyphs.cbegin(), glyphs.cend(),
                     [](const pdf::PositionedGlyph &glyph) {
                       return !glyph.unicode.empty() && !IsBlank(glyph.unicode);
                     });
}

std::string PageText::Text() const {
  std::string res;
  for (const auto &line : lines) {
    if (!res.empty()) {
      res.push_back('\n');
    }
    res += line.text;
  }
  return res;
}

PageText ExtractPageText(QPDFObjectHandle page) {
  PageText res;
  QPDFPageObjectHelper page_helper(page);
  auto resources = page_helper.getAttribute(pdf::kTagResources, false);
  pdf::FontCache fonts;
  pdf::ContentWalker walker(resources, pdf::GraphicsState{}, fonts);
  WalkContent(pdf::ParseContentOps(page.getKey(pdf::kTagContents)), walker, 0,
              res.glyphs);
  res.lines = BuildLines(res.glyphs);
  return res;
}

PageText ExtractPageText(const pdf::Document &doc) {
  auto page = doc.GetPage(0);
  if (!page) {
    throw std::runtime_error("[ExtractPageText] no page in " +
                             doc.Description());
  }
  return ExtractPageText(*page);
}

std::vector<ExtractedField> ExtractFields(const PageText &page_text,
                                          const MatcherSet &matchers) {
  std::vector<ExtractedField> res;
  for (const auto &[kind, matcher] : matchers) {
    if (!matcher) {
      continue;
    }
    for (const auto &line : page_text.lines) {
      auto match = matcher->FindFirst(line.text);
      if (!match) {
        continue;
      }
      std::optional<pdf::BBox> box;
      const size_t last = std::min(match->position + match->length,
                                   line.glyph_of_byte.size());
      for (size_t pos = match->position; pos < last; ++pos) {
        const size_t glyph_index = line.glyph_of_byte[pos];
        if (glyph_index == TextLine::kNoGlyph) {
          continue;
        }
        const auto &glyph_box = page_text.glyphs[glyph_index].box;
        box = box ? box->Union(glyph_box) : glyph_box;
      }
      if (!box) {
        continue;
      }
      res.push_back({kind, match->value, *box});
      break;
    }
  }
  return res;
}

std::vector<ExtractedField> ExtractFields(const pdf::Document &doc,
                                          const MatcherSet &matchers) {
  return ExtractFields(ExtractPageText(doc), matchers);
}

} // namespace pdfcensor::censor
