/* File: test_pdf_builder.hpp
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

#include <map>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>
#include <string>
#include <vector>

#include "pdf_defs.hpp"

// Builds small PDF files in memory for the tests.
namespace pdfcensor::test {

constexpr double kPageWidth = 612;
constexpr double kPageHeight = 792;

struct TestImage {
  std::string name = "/Im1";
  int width = 2;
  int height = 2;
  std::string color_space = "/DeviceGray";
  int bits = 8;
  std::string data = std::string(4, '\x80');
};

struct TestPdf {
  std::vector<std::string> pages;
  std::map<std::string, std::string> info;
  std::vector<TestImage> images;
  bool with_metadata = false;
  /// gray thumbnail image on every page
  bool with_thumb = false;
  std::vector<std::string> annot_rects;
};

/// @brief one line of Courier text at x,y
inline std::string TextLineOp(double x_pos, double y_pos,
                              const std::string &text, double size = 12) {
  return "BT\n/F1 " + std::to_string(size) + " Tf\n" + std::to_string(x_pos) +
         " " + std::to_string(y_pos) + " Td\n(" + text + ") Tj\nET\n";
}

/// @brief paint the image on the rectangle
inline std::string ImageOp(const std::string &name, double x_pos, double y_pos,
                           double width, double height) {
  return "q\n" + std::to_string(width) + " 0 0 " + std::to_string(height) +
         " " + std::to_string(x_pos) + " " + std::to_string(y_pos) +
         " cm\n" + name + " Do\nQ\n";
}

inline pdf::BytesVector BuildPdf(const TestPdf &params) {
  QPDF qpdf;
  qpdf.emptyPDF();
  auto font = qpdf.makeIndirectObject(QPDFObjectHandle::parse(
    "<< /Type /Font /Subtype /Type1 /BaseFont /Courier "
    "/Encoding /WinAnsiEncoding >>"));
  auto xobjects = QPDFObjectHandle::newDictionary();
  for (const auto &image : params.images) {
    auto stream = QPDFObjectHandle::newStream(&qpdf, image.data);
    auto dict = stream.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(image.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(image.height));
    dict.replaceKey("/ColorSpace",
                    QPDFObjectHandle::newName(image.color_space));
    dict.replaceKey("/BitsPerComponent",
                    QPDFObjectHandle::newInteger(image.bits));
    xobjects.replaceKey(image.name, stream);
  }
  std::vector<QPDFObjectHandle> annots;
  for (const auto &page_content : params.pages) {
    auto fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    resources.replaceKey("/XObject", xobjects);
    auto page = qpdf.makeIndirectObject(
      QPDFObjectHandle::parse("<< /Type /Page /MediaBox [0 0 612 792] >>"));
    page.replaceKey("/Resources", resources);
    page.replaceKey("/Contents",
                    QPDFObjectHandle::newStream(&qpdf, page_content));
    if (!params.annot_rects.empty()) {
      auto page_annots = QPDFObjectHandle::newArray();
      for (const auto &rect : params.annot_rects) {
        auto annot = qpdf.makeIndirectObject(QPDFObjectHandle::parse(
          "<< /Type /Annot /Subtype /Widget /FT /Tx /T (field) /Rect " +
          rect + " /V (secret) >>"));
        page_annots.appendItem(annot);
        annots.push_back(annot);
      }
      page.replaceKey("/Annots", page_annots);
    }
    qpdf.addPage(page, false);
  }
  if (!annots.empty()) {
    auto acro_form = QPDFObjectHandle::newDictionary();
    acro_form.replaceKey("/Fields", QPDFObjectHandle::newArray(annots));
    qpdf.getRoot().replaceKey("/AcroForm", qpdf.makeIndirectObject(acro_form));
  }
  if (!params.info.empty()) {
    auto info = QPDFObjectHandle::newDictionary();
    for (const auto &[key, value] : params.info) {
      info.replaceKey(key, QPDFObjectHandle::newString(value));
    }
    qpdf.getTrailer().replaceKey("/Info", qpdf.makeIndirectObject(info));
  }
  if (params.with_thumb) {
    for (auto page : qpdf.getAllPages()) {
      auto thumb =
        QPDFObjectHandle::newStream(&qpdf, std::string(4, '\x40'));
      auto thumb_dict = thumb.getDict();
      thumb_dict.replaceKey("/Width", QPDFObjectHandle::newInteger(2));
      thumb_dict.replaceKey("/Height", QPDFObjectHandle::newInteger(2));
      thumb_dict.replaceKey("/ColorSpace",
                            QPDFObjectHandle::newName("/DeviceGray"));
      thumb_dict.replaceKey("/BitsPerComponent",
                            QPDFObjectHandle::newInteger(8));
      page.replaceKey("/Thumb", thumb);
    }
  }
  if (params.with_metadata) {
    auto xmp = QPDFObjectHandle::newStream(
      &qpdf, "<x:xmpmeta><dc:creator>Secret Author</dc:creator></x:xmpmeta>");
    xmp.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/Metadata"));
    xmp.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/XML"));
    qpdf.getRoot().replaceKey("/Metadata", xmp);
  }
  QPDFWriter writer(qpdf);
  writer.setOutputMemory();
  writer.setStaticID(true);
  writer.write();
  auto buffer = writer.getBufferSharedPointer();
  return {buffer->getBuffer(), buffer->getBuffer() + buffer->getSize()};
}

/// @brief single page document with the given content
inline pdf::BytesVector BuildSinglePage(const std::string &content) {
  TestPdf params;
  params.pages.push_back(content);
  return BuildPdf(params);
}

} // namespace pdfcensor::test
