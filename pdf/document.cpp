/* File: document.cpp
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

#include "document.hpp"

#include <filesystem>
#include <memory>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <stdexcept>
#include <string>
#include <utility>

#include "common_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfcensor::pdf {

Document::Document(const std::string &path)
  : qpdf_(std::make_unique<QPDF>()), description_(path) {
  namespace fs = std::filesystem;
  if (path.empty()) {
    throw std::logic_error("empty path to file");
  }
  if (!fs::exists(path)) {
    throw std::logic_error("file doesn't exist");
  }
  if (fs::file_size(path) > kMaxPdfFileSize) {
    throw std::logic_error("file is too big");
  }
  auto data = FileToVector(path);
  if (!data) {
    throw std::logic_error("can't read file " + path);
  }
  bytes_ = std::make_shared<const BytesVector>(std::move(data.value()));
  Parse();
}

Document::Document(BytesVector data, std::string description)
  : qpdf_(std::make_unique<QPDF>()),
    description_(std::move(description)),
    bytes_(std::make_shared<const BytesVector>(std::move(data))) {
  Parse();
}

void Document::Parse() {
  qpdf_->setSuppressWarnings(true);
  qpdf_->processMemoryFile(
    description_.c_str(),
    reinterpret_cast<const char *>(bytes_->data()), // NOLINT
    bytes_->size());
}

size_t Document::GetPagesCount() const { return qpdf_->getAllPages().size(); }

PtrPdfObjShared Document::GetPage(int page_index) const noexcept {
  try {
    const auto &all_pages = qpdf_->getAllPages();
    if (all_pages.empty() || page_index < 0 ||
        static_cast<size_t>(page_index) > all_pages.size() - 1) {
      return nullptr;
    }
    auto res = std::make_shared<QPDFObjectHandle>(all_pages[page_index]);
    if (res->isNull() || !res->isPageObject()) {
      return nullptr;
    }
    return res;
  } catch ([[maybe_unused]] const std::exception & /*ex*/) {
    return nullptr;
  }
}

std::unique_ptr<QPDF> Document::OpenCopy() const {
  auto copy = std::make_unique<QPDF>();
  copy->setSuppressWarnings(true);
  copy->processMemoryFile(
    description_.c_str(),
    reinterpret_cast<const char *>(bytes_->data()), // NOLINT
    bytes_->size());
  copy->pushInheritedAttributesToPage();
  return copy;
}

} // namespace pdfcensor::pdf
