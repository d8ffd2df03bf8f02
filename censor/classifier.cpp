/* File: classifier.cpp
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

#include "classifier.hpp"

#include "common_defs.hpp"

namespace pdfcensor::censor {

std::string VerdictReason(Verdict verdict) {
  switch (verdict) {
    case Verdict::kEligible:
      return kReasonEligible;
    case Verdict::kFailedMultiPage:
      return kReasonMultiPage;
    case Verdict::kFailedNoExtractableText:
      return kReasonNoText;
  }
  return kReasonDamaged;
}

Verdict Classify(size_t page_count, const PageText &page_text) noexcept {
  if (page_count != 1) {
    return Verdict::kFailedMultiPage;
  }
  if (!page_text.HasRecoverableGlyphs()) {
    return Verdict::kFailedNoExtractableText;
  }
  return Verdict::kEligible;
}

Verdict Classify(const pdf::Document &doc) {
  const size_t page_count = doc.GetPagesCount();
  // a multi-page document is never read further
  if (page_count != 1) {
    return Verdict::kFailedMultiPage;
  }
  return Classify(page_count, ExtractPageText(doc));
}

} // namespace pdfcensor::censor
