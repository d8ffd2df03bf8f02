/* File: classifier.hpp
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
#include <string>

#include "document.hpp"
#include "text_extractor.hpp"

namespace pdfcensor::censor {

enum class Verdict { kEligible, kFailedMultiPage, kFailedNoExtractableText };

/// @brief stable reason code, e.g. "MULTI_PAGE"
std::string VerdictReason(Verdict verdict);

/**
 * @brief Decide whether the document can be censored
 * @details Does not change the document.
 * @param doc
 * @return Verdict
 * @throws QPDFExc if the page content is damaged
 */
Verdict Classify(const pdf::Document &doc);

/**
 * @brief Classify by the page count and the already extracted text
 */
Verdict Classify(size_t page_count, const PageText &page_text) noexcept;

} // namespace pdfcensor::censor
