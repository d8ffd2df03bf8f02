/* File: redactor.cpp
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

#include "redactor.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <optional>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "content_ops.hpp"
#include "content_walker.hpp"
#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfcensor::censor {

namespace {

constexpr const char *const kRedactedNamePrefix = "/Rdx";

const pdf::BBox kUnitSquare{{0, 0}, {1, 1}};

struct StreamResult {
  std::string content;
  QPDFObjectHandle resources;
};

bool IsTextShowing(const std::string &oper) {
  return oper == "Tj" || oper == "TJ" || oper == "'" || oper == "\"";
}

bool IsSubtype(QPDFObjectHandle stream, const char *subtype) {
  auto value = stream.getDict().getKey(pdf::kTagSubType);
  return value.isName() && value.getName() == subtype;
}

// new (indirect) stream with the decoded data and the dictionary of the source
QPDFObjectHandle CopyStreamWithData(QPDF &qpdf, QPDFObjectHandle source,
                                    const std::string &data) {
  auto res = QPDFObjectHandle::newStream(&qpdf, data);
  auto src_dict = source.getDict();
  auto dest_dict = res.getDict();
  for (const auto &key : src_dict.getKeys()) {
    if (key == pdf::kTagFilter || key == pdf::kTagDecodeParms ||
        key == pdf::kTagLength) {
      continue;
    }
    dest_dict.replaceKey(key, src_dict.getKey(key));
  }
  return res;
}

/**
 * @brief Rewrites content streams of one page
 */
class StreamRedactor {
 public:
  StreamRedactor(QPDF &qpdf, const std::vector<pdf::BBox> &regions,
                 std::shared_ptr<spdlog::logger> logger)
    : qpdf_(qpdf), regions_(regions), logger_(std::move(logger)) {}

  StreamResult Redact(const std::vector<pdf::ContentOp> &ops,
                      QPDFObjectHandle resources,
                      const pdf::GraphicsState &initial, int depth);

  [[nodiscard]] size_t RemovedGlyphs() const noexcept {
    return removed_glyphs_;
  }
  [[nodiscard]] size_t RemovedImages() const noexcept {
    return removed_images_;
  }
  [[nodiscard]] size_t BlackedImages() const noexcept {
    return blacked_images_;
  }

 private:
  [[nodiscard]] bool Hit(const pdf::BBox &box) const noexcept {
    return std::any_of(
      regions_.cbegin(), regions_.cend(),
      [&box](const pdf::BBox &region) { return region.Intersects(box); });
  }

  std::string RedactText(const pdf::ContentOp &op, pdf::ContentWalker &walker);

  // returns the name to paint or std::nullopt to drop the Do
  std::optional<std::string> RedactXObject(const std::string &name,
                                           pdf::ContentWalker &walker,
                                           QPDFObjectHandle &new_xobjects,
                                           int depth);

  std::optional<QPDFObjectHandle> BlackoutImage(QPDFObjectHandle image,
                                                const pdf::Matrix &ctm);

  std::string FreshName(QPDFObjectHandle &xobjects);

  QPDF &qpdf_;
  const std::vector<pdf::BBox> &regions_;
  std::shared_ptr<spdlog::logger> logger_;
  pdf::FontCache fonts_;
  size_t name_counter_ = 0;
  size_t removed_glyphs_ = 0;
  size_t removed_images_ = 0;
  size_t blacked_images_ = 0;
};

StreamResult StreamRedactor::Redact(const std::vector<pdf::ContentOp> &ops,
                                    QPDFObjectHandle resources,
                                    const pdf::GraphicsState &initial,
                                    int depth) {
  StreamResult res;
  res.resources = resources.isDictionary() ? resources.shallowCopy()
                                           : QPDFObjectHandle::newDictionary();
  auto old_xobjects = res.resources.getKey(pdf::kTagXObject);
  QPDFObjectHandle new_xobjects = old_xobjects.isDictionary()
                                    ? old_xobjects.shallowCopy()
                                    : QPDFObjectHandle::newDictionary();
  res.resources.replaceKey(pdf::kTagXObject, new_xobjects);
  std::set<std::string> used_xobjects;
  pdf::ContentWalker walker(resources, initial, fonts_);
  std::ostringstream builder;
  for (const auto &op : ops) {
    if (IsTextShowing(op.op)) {
      builder << RedactText(op, walker);
      continue;
    }
    if (op.IsInlineImage()) {
      if (Hit(walker.State().ctm.TransformBox(kUnitSquare))) {
        ++removed_images_;
        continue;
      }
      builder << pdf::SerializeContentOp(op);
      continue;
    }
    if (op.op == "Do" && !op.operands.empty() && op.operands[0].isName()) {
      auto name = RedactXObject(op.operands[0].getName(), walker,
                                new_xobjects, depth);
      if (!name) {
        continue;
      }
      used_xobjects.insert(*name);
      builder << *name << " Do\n";
      continue;
    }
    walker.ApplyState(op);
    builder << pdf::SerializeContentOp(op);
  }
  // unreferenced XObjects are not written
  for (const auto &key : new_xobjects.getKeys()) {
    if (used_xobjects.count(key) == 0) {
      new_xobjects.removeKey(key);
    }
  }
  res.content = builder.str();
  return res;
}

std::string StreamRedactor::RedactText(const pdf::ContentOp &op,
                                       pdf::ContentWalker &walker) {
  walker.ApplyState(op);
  std::vector<QPDFObjectHandle> items;
  if (!op.operands.empty()) {
    const auto &last = op.operands.back();
    if (op.op == "TJ" && last.isArray()) {
      items = last.getArrayAsVector();
    } else if (op.op != "TJ" && last.isString()) {
      items.push_back(last);
    }
  }
  std::vector<QPDFObjectHandle> out_items;
  std::string pending;
  double adjustment = 0;
  bool has_adjustment = false;
  bool changed = false;
  const auto flush_string = [&out_items, &pending]() {
    if (!pending.empty()) {
      out_items.push_back(QPDFObjectHandle::newString(pending));
      pending.clear();
    }
  };
  const auto flush_adjustment = [&out_items, &adjustment, &has_adjustment]() {
    if (has_adjustment) {
      out_items.push_back(QPDFObjectHandle::newReal(adjustment, 4));
      adjustment = 0;
      has_adjustment = false;
    }
  };
  for (const auto &item : items) {
    if (item.isNumber()) {
      flush_string();
      adjustment += item.getNumericValue();
      has_adjustment = true;
      walker.ApplyAdjustment(item.getNumericValue());
      continue;
    }
    if (!item.isString()) {
      continue;
    }
    for (const auto &glyph : walker.ShowString(item.getStringValue())) {
      if (Hit(glyph.box)) {
        changed = true;
        ++removed_glyphs_;
        flush_string();
        adjustment += walker.AdjustmentFor(glyph.advance);
        has_adjustment = true;
        continue;
      }
      flush_adjustment();
      pending += glyph.bytes;
    }
    flush_string();
  }
  if (!changed) {
    return pdf::SerializeContentOp(op);
  }
  flush_adjustment();
  std::ostringstream builder;
  if (op.op == "'") {
    builder << "T*\n";
  } else if (op.op == "\"" && op.operands.size() == 3) {
    builder << op.operands[0].unparse() << " Tw\n"
            << op.operands[1].unparse() << " Tc\nT*\n";
  }
  if (!out_items.empty()) {
    pdf::ContentOp show;
    show.operands.push_back(QPDFObjectHandle::newArray(out_items));
    show.op = "TJ";
    builder << pdf::SerializeContentOp(show);
  }
  return builder.str();
}

std::optional<std::string> StreamRedactor::RedactXObject(
  const std::string &name, pdf::ContentWalker &walker,
  QPDFObjectHandle &new_xobjects, int depth) {
  auto xobj = walker.LookupXObject(name);
  if (!xobj.isStream()) {
    return name;
  }
  const pdf::Matrix &ctm = walker.State().ctm;
  if (IsSubtype(xobj, pdf::kTagImage)) {
    if (!Hit(ctm.TransformBox(kUnitSquare))) {
      return name;
    }
    auto blacked = BlackoutImage(xobj, ctm);
    if (!blacked) {
      ++removed_images_;
      return std::nullopt;
    }
    ++blacked_images_;
    std::string new_name = FreshName(new_xobjects);
    new_xobjects.replaceKey(new_name, *blacked);
    return new_name;
  }
  if (!IsSubtype(xobj, pdf::kTagForm)) {
    return name;
  }
  const pdf::GraphicsState form_state = walker.FormState(xobj);
  auto form_bbox = xobj.getDict().getKey(pdf::kTagBBox);
  if (form_bbox.isArray() && form_bbox.getArrayNItems() == 4) {
    const pdf::BBox bbox{
      {std::min(pdf::NumberOrZero(form_bbox.getArrayItem(0)),
                pdf::NumberOrZero(form_bbox.getArrayItem(2))),
       std::min(pdf::NumberOrZero(form_bbox.getArrayItem(1)),
                pdf::NumberOrZero(form_bbox.getArrayItem(3)))},
      {std::max(pdf::NumberOrZero(form_bbox.getArrayItem(0)),
                pdf::NumberOrZero(form_bbox.getArrayItem(2))),
       std::max(pdf::NumberOrZero(form_bbox.getArrayItem(1)),
                pdf::NumberOrZero(form_bbox.getArrayItem(3)))}};
    if (!Hit(form_state.ctm.TransformBox(bbox))) {
      return name;
    }
  }
  if (depth >= pdf::kMaxFormDepth) {
    if (logger_) {
      logger_->warn("[Redact] form {} is nested too deep, dropped", name);
    }
    ++removed_images_;
    return std::nullopt;
  }
  StreamResult form_res = Redact(pdf::ParseContentOps(xobj),
                                 walker.FormResources(xobj), form_state,
                                 depth + 1);
  auto new_form = QPDFObjectHandle::newStream(&qpdf_, form_res.content);
  auto src_dict = xobj.getDict();
  auto dest_dict = new_form.getDict();
  for (const auto &key : src_dict.getKeys()) {
    if (key == pdf::kTagFilter || key == pdf::kTagDecodeParms ||
        key == pdf::kTagLength || key == pdf::kTagResources) {
      continue;
    }
    dest_dict.replaceKey(key, src_dict.getKey(key));
  }
  dest_dict.replaceKey(pdf::kTagResources, form_res.resources);
  std::string new_name = FreshName(new_xobjects);
  new_xobjects.replaceKey(new_name, new_form);
  return new_name;
}

std::optional<QPDFObjectHandle> StreamRedactor::BlackoutImage(
  QPDFObjectHandle image, const pdf::Matrix &ctm) {
  auto dict = image.getDict();
  if (dict.getKey(pdf::kTagImageMask).isBool() &&
      dict.getKey(pdf::kTagImageMask).getBoolValue()) {
    return std::nullopt;
  }
  auto color_space = dict.getKey(pdf::kTagColorSpace);
  auto bits = dict.getKey(pdf::kTagBitsPerComponent);
  auto width_obj = dict.getKey(pdf::kTagWidth);
  auto height_obj = dict.getKey(pdf::kTagHeight);
  if (!color_space.isName() || !bits.isInteger() || bits.getIntValue() != 8 ||
      !width_obj.isInteger() || !height_obj.isInteger()) {
    return std::nullopt;
  }
  size_t components = 0;
  if (color_space.getName() == pdf::kDeviceGray) {
    components = 1;
  } else if (color_space.getName() == pdf::kDeviceRgb) {
    components = 3;
  } else {
    return std::nullopt;
  }
  const auto width = width_obj.getIntValue();
  const auto height = height_obj.getIntValue();
  if (width <= 0 || height <= 0) {
    return std::nullopt;
  }
  auto inverse = ctm.Inverse();
  if (!inverse) {
    return std::nullopt;
  }
  std::string data;
  try {
    auto buffer = image.getStreamData(qpdf_dl_all);
    data.assign(reinterpret_cast<const char *>(buffer->getBuffer()), // NOLINT
                buffer->getSize());
  } catch (const std::exception &ex) {
    if (logger_) {
      logger_->debug("[Redact] can't decode image {}", ex.what());
    }
    return std::nullopt;
  }
  const auto u_width = static_cast<size_t>(width);
  const auto u_height = static_cast<size_t>(height);
  const size_t row_size = u_width * components;
  if (data.size() < row_size * u_height) {
    return std::nullopt;
  }
  // black is the low end of the /Decode range
  std::vector<char> black(components, 0);
  auto decode = dict.getKey(pdf::kTagDecode);
  if (decode.isArray() &&
      decode.getArrayNItems() == static_cast<int>(components * 2)) {
    for (size_t i = 0; i < components; ++i) {
      const int ind = static_cast<int>(i * 2);
      if (pdf::NumberOrZero(decode.getArrayItem(ind)) >
          pdf::NumberOrZero(decode.getArrayItem(ind + 1))) {
        black[i] = static_cast<char>(0xFF);
      }
    }
  }
  const auto d_width = static_cast<double>(width);
  const auto d_height = static_cast<double>(height);
  for (const auto &region : regions_) {
    // region in the image unit square, rows go from the top
    const pdf::BBox unit = inverse->TransformBox(region);
    if (!unit.Intersects(kUnitSquare)) {
      continue;
    }
    const auto col_first = static_cast<long long>(
      std::max(0.0, std::floor(unit.left_bottom.x * d_width)));
    const auto col_last = static_cast<long long>(
      std::min(d_width, std::ceil(unit.right_top.x * d_width)));
    const auto row_first = static_cast<long long>(
      std::max(0.0, std::floor((1 - unit.right_top.y) * d_height)));
    const auto row_last = static_cast<long long>(
      std::min(d_height, std::ceil((1 - unit.left_bottom.y) * d_height)));
    for (long long row = row_first; row < row_last; ++row) {
      for (long long col = col_first; col < col_last; ++col) {
        const size_t offset = static_cast<size_t>(row) * row_size +
                              static_cast<size_t>(col) * components;
        std::copy(black.cbegin(), black.cend(),
                  data.begin() + static_cast<std::ptrdiff_t>(offset));
      }
    }
  }
  return CopyStreamWithData(qpdf_, image, data);
}

std::string StreamRedactor::FreshName(QPDFObjectHandle &xobjects) {
  std::string res;
  do {
    res = kRedactedNamePrefix + std::to_string(++name_counter_);
  } while (xobjects.hasKey(res));
  return res;
}

// removes the annotations from the page and the AcroForm fields
size_t RemoveAnnotations(QPDF &qpdf, QPDFObjectHandle &page,
                         const std::vector<pdf::BBox> &regions) {
  auto annots = page.getKey(pdf::kTagAnnots);
  if (!annots.isArray()) {
    return 0;
  }
  std::vector<QPDFObjectHandle> kept;
  std::set<std::string> removed;
  for (auto &annot : annots.getArrayAsVector()) {
    auto rect = annot.isDictionary() ? annot.getKey(pdf::kTagRect)
                                     : QPDFObjectHandle::newNull();
    if (!rect.isRectangle()) {
      kept.push_back(annot);
      continue;
    }
    const auto q_rect = rect.getArrayAsRectangle();
    const pdf::BBox box{{std::min(q_rect.llx, q_rect.urx),
                         std::min(q_rect.lly, q_rect.ury)},
                        {std::max(q_rect.llx, q_rect.urx),
                         std::max(q_rect.lly, q_rect.ury)}};
    const bool hit = std::any_of(
      regions.cbegin(), regions.cend(),
      [&box](const pdf::BBox &region) { return region.Intersects(box); });
    if (hit) {
      removed.insert(pdf::ObjectKey(annot));
    } else {
      kept.push_back(annot);
    }
  }
  if (removed.empty()) {
    return 0;
  }
  page.replaceKey(pdf::kTagAnnots, QPDFObjectHandle::newArray(kept));
  auto acro_form = qpdf.getRoot().getKey(pdf::kTagAcroForm);
  if (!acro_form.isDictionary() ||
      !acro_form.getKey(pdf::kTagFields).isArray()) {
    return removed.size();
  }
  std::vector<QPDFObjectHandle> kept_fields;
  for (auto &field : acro_form.getKey(pdf::kTagFields).getArrayAsVector()) {
    if (removed.count(pdf::ObjectKey(field)) > 0) {
      continue;
    }
    auto kids = field.isDictionary() ? field.getKey("/Kids")
                                     : QPDFObjectHandle::newNull();
    if (kids.isArray()) {
      std::vector<QPDFObjectHandle> kept_kids;
      for (auto &kid : kids.getArrayAsVector()) {
        if (removed.count(pdf::ObjectKey(kid)) == 0) {
          kept_kids.push_back(kid);
        }
      }
      if (kept_kids.empty()) {
        continue;
      }
      field.replaceKey("/Kids", QPDFObjectHandle::newArray(kept_kids));
    }
    kept_fields.push_back(field);
  }
  acro_form.replaceKey(pdf::kTagFields,
                       QPDFObjectHandle::newArray(kept_fields));
  return removed.size();
}

std::string FillRegions(const std::vector<pdf::BBox> &regions) {
  std::ostringstream builder;
  builder << "q\n0 0 0 rg\n";
  for (const auto &region : regions) {
    builder << pdf::DoubleToString10(region.left_bottom.x) << " "
            << pdf::DoubleToString10(region.left_bottom.y) << " "
            << pdf::DoubleToString10(region.Width()) << " "
            << pdf::DoubleToString10(region.Height()) << " re\n";
  }
  builder << "f\nQ\n";
  return builder.str();
}

} // namespace

std::string RedactionRegion::ToString() const {
  std::ostringstream builder;
  builder << "x=" << pdf::DoubleToString10(x)
          << " y=" << pdf::DoubleToString10(y)
          << " width=" << pdf::DoubleToString10(width)
          << " height=" << pdf::DoubleToString10(height);
  return builder.str();
}

void ValidateRegions(const std::vector<RedactionRegion> &regions) {
  for (size_t i = 0; i < regions.size(); ++i) {
    const auto &region = regions[i];
    const bool finite = std::isfinite(region.x) && std::isfinite(region.y) &&
                        std::isfinite(region.width) &&
                        std::isfinite(region.height);
    if (!finite || region.width <= 0 || region.height <= 0) {
      throw std::invalid_argument("[Redact] invalid region #" +
                                  std::to_string(i) + " " + region.ToString());
    }
  }
}

CensoredDocument Redact(const pdf::Document &doc,
                        const std::vector<RedactionRegion> &regions,
                        const std::shared_ptr<spdlog::logger> &logger) {
  ValidateRegions(regions);
  CensoredDocument res(doc);
  QPDFObjectHandle page = res.GetPage();
  const auto media_box = pdf::PageMediaBox(page);
  std::vector<pdf::BBox> active;
  for (size_t i = 0; i < regions.size(); ++i) {
    const pdf::BBox box = regions[i].ToBBox();
    if (media_box && !media_box->Intersects(box)) {
      if (logger) {
        logger->debug("[Redact] region #{} is outside the page, skipped", i);
      }
      continue;
    }
    active.push_back(box);
  }
  if (active.empty()) {
    return res;
  }
  QPDF &qpdf = res.GetQPDF();
  QPDFPageObjectHelper page_helper(page);
  auto resources = page_helper.getAttribute(pdf::kTagResources, false);
  StreamRedactor redactor(qpdf, active, logger);
  StreamResult page_res =
    redactor.Redact(pdf::ParseContentOps(page.getKey(pdf::kTagContents)),
                    resources, pdf::GraphicsState{}, 0);
  const std::string content =
    "q\n" + page_res.content + "\nQ\n" + FillRegions(active);
  page.replaceKey(pdf::kTagContents,
                  QPDFObjectHandle::newStream(&qpdf, content));
  page.replaceKey(pdf::kTagResources, page_res.resources);
  const size_t removed_annots = RemoveAnnotations(qpdf, page, active);
  for (const auto &box : active) {
    res.AddAppliedRegion(box);
  }
  if (logger) {
    logger->debug(
      "[Redact] {}: regions {} glyphs removed {} images removed {} images "
      "blacked out {} annotations removed {}",
      doc.Description(), active.size(), redactor.RemovedGlyphs(),
      redactor.RemovedImages(), redactor.BlackedImages(), removed_annots);
  }
  return res;
}

} // namespace pdfcensor::censor
