/* File: document.hpp
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

#include <cstddef>
#include <memory>
#include <string>

#include "pdf_defs.hpp"
#include "pdf_structs.hpp"

namespace pdfcensor::pdf {

/**
 * @brief Read-only source document
 * @details Keeps the raw bytes, so an independent mutable copy can be parsed
 * with OpenCopy(). Nothing in this class changes the source.
 */
class Document {
 public:
  using SharedBytes = std::shared_ptr<const BytesVector>;

  /**
   * @brief Open a pdf file
   *
   * @param path to file
   * @throws std::logic_error if file doesn't exist, is too big or unreadable
   * @throws QPDFExc (std::runtime_error) if the file can not be parsed
   */
  explicit Document(const std::string &path);

  /**
   * @brief Open a pdf from memory
   *
   * @param data raw pdf bytes
   * @param description name used in messages
   * @throws QPDFExc (std::runtime_error) if the data can not be parsed
   */
  Document(BytesVector data, std::string description);

  Document(const Document &) = delete;
  Document(Document &&) = delete;
  Document &operator=(const Document &) = delete;
  Document &operator=(Document &&) = delete;
  ~Document() = default;

  [[nodiscard]] size_t GetPagesCount() const;

  /**
   * @brief Get the page object
   * @param page_index zero based
   * @return nullptr if there is no such page
   */
  [[nodiscard]] PtrPdfObjShared GetPage(int page_index) const noexcept;

  [[nodiscard]] std::string GetPDFVersion() const {
    return qpdf_->getPDFVersion();
  }

  /// @brief file path or description of the in-memory source
  [[nodiscard]] const std::string &Description() const noexcept {
    return description_;
  }

  [[nodiscard]] const SharedBytes &Bytes() const noexcept { return bytes_; }

  /**
   * @brief Parse the source bytes again into a new QPDF instance
   * @details Inherited page attributes are pushed down to the pages.
   * @return std::unique_ptr<QPDF> owned by the caller, the bytes must outlive
   * it (hold Bytes())
   * @throws QPDFExc
   */
  [[nodiscard]] std::unique_ptr<QPDF> OpenCopy() const;

  // for tests
  [[nodiscard]] const std::unique_ptr<QPDF> &getQPDF() const & noexcept {
    return qpdf_;
  }

 private:
  void Parse();

  std::unique_ptr<QPDF> qpdf_;
  std::string description_;
  SharedBytes bytes_;
};

} // namespace pdfcensor::pdf
