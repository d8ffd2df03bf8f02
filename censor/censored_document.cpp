/* File: censored_document.cpp
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

#include "censored_document.hpp"

#include <filesystem>
#include <fstream>
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <stdexcept>
#include <system_error>

namespace pdfcensor::censor {

CensoredDocument::CensoredDocument(const pdf::Document &source)
  : bytes_(source.Bytes()), qpdf_(source.OpenCopy()) {}

QPDFObjectHandle CensoredDocument::GetPage() const {
  const auto &pages = qpdf_->getAllPages();
  if (pages.empty()) {
    throw std::runtime_error("[CensoredDocument::GetPage] no pages");
  }
  return pages.front();
}

void CensoredDocument::AppendPageContent(const std::string &content) {
  QPDFPageObjectHelper page(GetPage());
  if (!content_wrapped_) {
    page.addPageContents(QPDFObjectHandle::newStream(qpdf_.get(), "q\n"),
                         true);
    page.addPageContents(QPDFObjectHandle::newStream(qpdf_.get(), "\nQ\n"),
                         false);
    content_wrapped_ = true;
  }
  page.addPageContents(QPDFObjectHandle::newStream(qpdf_.get(), content),
                       false);
}

pdf::BytesVector CensoredDocument::ToBytes() {
  QPDFWriter writer(*qpdf_);
  writer.setOutputMemory();
  writer.setDeterministicID(true);
  writer.setStreamDataMode(qpdf_s_compress);
  writer.write();
  auto buffer = writer.getBufferSharedPointer();
  if (!buffer) {
    throw std::runtime_error("[CensoredDocument::ToBytes] empty output");
  }
  const unsigned char *data = buffer->getBuffer();
  return {data, data + buffer->getSize()}; // NOLINT
}

void CensoredDocument::WriteTo(const std::string &path) {
  const std::string func_name = "[CensoredDocument::WriteTo] ";
  const std::string tmp_path = path + ".part";
  const pdf::BytesVector data = ToBytes();
  {
    std::ofstream ofile(tmp_path, std::ios_base::binary | std::ios::trunc);
    if (!ofile.is_open()) {
      throw std::runtime_error(func_name + "can not create file " + tmp_path);
    }
    ofile.write(reinterpret_cast<const char *>(data.data()), // NOLINT
                static_cast<std::streamsize>(data.size()));
    ofile.close();
    if (ofile.fail()) {
      std::error_code err;
      std::filesystem::remove(tmp_path, err);
      throw std::runtime_error(func_name + "write failed " + tmp_path);
    }
  }
  std::error_code err;
  std::filesystem::rename(tmp_path, path, err);
  if (err) {
    std::error_code rm_err;
    std::filesystem::remove(tmp_path, rm_err);
    throw std::runtime_error(func_name + "rename to " + path + " failed " +
                             err.message());
  }
}

} // namespace pdfcensor::censor
