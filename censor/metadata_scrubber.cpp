/* File: metadata_scrubber.cpp
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

#include "metadata_scrubber.hpp"

#include "pdf_defs.hpp"
#include "pdf_utils.hpp"

namespace pdfcensor::censor {

std::map<std::string, std::string> ScrubMetadata(QPDF &qpdf) {
  auto trailer = qpdf.getTrailer();
  std::map<std::string, std::string> res;
  auto info = trailer.getKey(pdf::kTagInfo);
  if (info.isDictionary()) {
    for (const auto &key : info.getKeys()) {
      if (key != pdf::kTagTrapped) {
        info.removeKey(key);
      }
    }
    if (info.getKeys().empty()) {
      trailer.removeKey(pdf::kTagInfo);
    } else {
      res = pdf::DictToUnparsedMap(info);
    }
  } else if (trailer.hasKey(pdf::kTagInfo)) {
    trailer.removeKey(pdf::kTagInfo);
  }
  // the writer keeps the first ID of the source otherwise
  trailer.removeKey(pdf::kTagID);
  auto root = qpdf.getRoot();
  root.removeKey(pdf::kTagMetadata);
  root.removeKey(pdf::kTagPieceInfo);
  for (auto page : qpdf.getAllPages()) {
    page.removeKey(pdf::kTagMetadata);
    page.removeKey(pdf::kTagPieceInfo);
    page.removeKey(pdf::kTagLastModified);
    // a thumbnail is a picture of the page before redaction
    page.removeKey(pdf::kTagThumb);
  }
  return res;
}

std::map<std::string, std::string> ScrubMetadata(CensoredDocument &doc) {
  return ScrubMetadata(doc.GetQPDF());
}

} // namespace pdfcensor::censor
