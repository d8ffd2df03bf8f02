/* File: censored_document.hpp
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

#include "document.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::censor {

/**
 * @brief The output document
 * @details Owns an independent copy of the source, parsed from the source
 * bytes, and the list of regions that were blacked out on its page.
 */
class CensoredDocument {
 public:
  /**
   * @brief Make a mutable copy of the source
   * @throws QPDFExc if the source can not be parsed again
   */
  explicit CensoredDocument(const pdf::Document &source);

  CensoredDocument(const CensoredDocument &) = delete;
  CensoredDocument &operator=(const CensoredDocument &) = delete;
  CensoredDocument(CensoredDocument &&) noexcept = default;
  CensoredDocument &operator=(CensoredDocument &&) noexcept = default;
  ~CensoredDocument() = default;

  [[nodiscard]] QPDF &GetQPDF() noexcept { return *qpdf_; }
  [[nodiscard]] const QPDF &GetQPDF() const noexcept { return *qpdf_; }

  /**
   * @brief The only page
   * @throws std::runtime_error if there is no page
   */
  [[nodiscard]] QPDFObjectHandle GetPage() const;

  [[nodiscard]] const std::vector<pdf::BBox> &AppliedRegions() const noexcept {
    return applied_regions_;
  }

  void AddAppliedRegion(const pdf::BBox &region) {
    applied_regions_.push_back(region);
  }

  /**
   * @brief Append content to the page
   * @details The existing content is wrapped in q/Q once, so the appended
   * operators start with the default graphics state.
   * @param content content stream operators
   */
  void AppendPageContent(const std::string &content);

  /**
   * @brief Serialize the document
   * @details The file ID is generated from the content, streams are
   * compressed.
   * @throws std::runtime_error on write error
   */
  [[nodiscard]] pdf::BytesVector ToBytes();

  /**
   * @brief Write to the file
   * @details Data goes to "<path>.part" first and then is renamed.
   * @throws std::runtime_error if the file can not be written
   */
  void WriteTo(const std::string &path);

 private:
  // the source bytes must outlive the QPDF that was parsed from them
  pdf::Document::SharedBytes bytes_;
  std::unique_ptr<QPDF> qpdf_;
  std::vector<pdf::BBox> applied_regions_;
  bool content_wrapped_ = false;
};

} // namespace pdfcensor::censor
