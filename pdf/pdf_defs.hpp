/* File: pdf_defs.hpp
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
#ifndef POINTERHOLDER_TRANSITION
#define POINTERHOLDER_TRANSITION 3 // NOLINT (cppcoreguidelines-macro-usage)
#endif
#include <cstdint>
#include <memory>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QUtil.hh>
#include <vector>

namespace pdfcensor::pdf {
using BytesVector = std::vector<unsigned char>;
using PtrPdfObj = std::unique_ptr<QPDFObjectHandle>;
using PtrPdfObjShared = std::shared_ptr<QPDFObjectHandle>;

constexpr const char *const kTagType = "/Type";
constexpr const char *const kTagSubType = "/Subtype";
constexpr const char *const kTagFilter = "/Filter";
constexpr const char *const kTagDecodeParms = "/DecodeParms";
constexpr const char *const kTagLength = "/Length";
constexpr const char *const kTagContents = "/Contents";
constexpr const char *const kTagXObject = "/XObject";
constexpr const char *const kTagForm = "/Form";
constexpr const char *const kTagBBox = "/BBox";
constexpr const char *const kTagMatrix = "/Matrix";
constexpr const char *const kTagImage = "/Image";
constexpr const char *const kTagImageMask = "/ImageMask";
constexpr const char *const kTagWidth = "/Width";
constexpr const char *const kTagHeight = "/Height";
constexpr const char *const kTagColorSpace = "/ColorSpace";
constexpr const char *const kTagBitsPerComponent = "/BitsPerComponent";
constexpr const char *const kTagDecode = "/Decode";
constexpr const char *const kTagResources = "/Resources";
constexpr const char *const kTagFont = "/Font";
constexpr const char *const kTagAnnots = "/Annots";
constexpr const char *const kTagAcroForm = "/AcroForm";
constexpr const char *const kTagFields = "/Fields";
constexpr const char *const kTagRect = "/Rect";
constexpr const char *const kTagPage = "/Page";
constexpr const char *const kTagMediaBox = "/MediaBox";
constexpr const char *const kTagInfo = "/Info";
constexpr const char *const kTagMetadata = "/Metadata";
constexpr const char *const kTagPieceInfo = "/PieceInfo";
constexpr const char *const kTagLastModified = "/LastModified";
constexpr const char *const kTagThumb = "/Thumb";
constexpr const char *const kTagTrapped = "/Trapped";
constexpr const char *const kTagID = "/ID";

// fonts
constexpr const char *const kTagType0 = "/Type0";
constexpr const char *const kTagType1 = "/Type1";
constexpr const char *const kTagType3 = "/Type3";
constexpr const char *const kTagFontMatrix = "/FontMatrix";
constexpr const char *const kTagFontBBox = "/FontBBox";
constexpr const char *const kTagBaseFont = "/BaseFont";
constexpr const char *const kTagEncoding = "/Encoding";
constexpr const char *const kTagDifferences = "/Differences";
constexpr const char *const kTagWidths = "/Widths";
constexpr const char *const kTagFirstChar = "/FirstChar";
constexpr const char *const kTagToUnicode = "/ToUnicode";
constexpr const char *const kTagDescendantFonts = "/DescendantFonts";
constexpr const char *const kTagFontDescriptor = "/FontDescriptor";
constexpr const char *const kTagMissingWidth = "/MissingWidth";
constexpr const char *const kTagAscent = "/Ascent";
constexpr const char *const kTagDescent = "/Descent";
constexpr const char *const kTagW = "/W";
constexpr const char *const kTagDW = "/DW";
constexpr const char *const kWinAnsiEncoding = "/WinAnsiEncoding";

constexpr const char *const kDeviceRgb = "/DeviceRGB";
constexpr const char *const kDeviceGray = "/DeviceGray";

constexpr const char *const kErrPageSize = "Can't determine page size";

// glyph metrics in glyph space units (1/1000 of text space)
constexpr double kGlyphUnits = 1000.0;
constexpr double kDefaultGlyphWidth = 500.0;
constexpr double kCourierGlyphWidth = 600.0;
constexpr double kDefaultCidWidth = 1000.0;
constexpr double kDefaultAscent = 800.0;
constexpr double kDefaultDescent = -200.0;

// nesting limit for form XObjects
constexpr int kMaxFormDepth = 16;

} // namespace pdfcensor::pdf
