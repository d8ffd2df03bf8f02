/* File: metadata_scrubber.hpp
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
#include <string>

#include "censored_document.hpp"

namespace pdfcensor::censor {

/**
 * @brief Remove identifying metadata
 * @details Every /Info entry except /Trapped is removed, an empty /Info is
 * dropped from the trailer. XMP /Metadata streams of the catalog and the
 * pages, /PieceInfo, page /LastModified and the trailer /ID are removed.
 * @param qpdf document to change
 * @return std::map<std::string, std::string> remaining /Info entries
 * (unparsed)
 */
std::map<std::string, std::string> ScrubMetadata(QPDF &qpdf);

/// @brief scrub the censored document
std::map<std::string, std::string> ScrubMetadata(CensoredDocument &doc);

} // namespace pdfcensor::censor
