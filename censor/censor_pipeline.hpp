/* File: censor_pipeline.hpp
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

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "censored_document.hpp"
#include "classifier.hpp"
#include "document.hpp"
#include "field_matcher.hpp"
#include "field_preserver.hpp"
#include "redactor.hpp"

namespace pdfcensor::censor {

/// @brief the document was not processed
struct Rejection {
  Verdict verdict = Verdict::kFailedMultiPage;
  std::string reason;
};

using CensorResult = std::variant<CensoredDocument, Rejection>;

struct CensorParams {
  std::vector<RedactionRegion> regions;
  /// add the DefaultTemplate() regions of the page to regions
  bool use_default_template = false;
  bool include_info = true;
  PreserveLayout layout;
  MatcherSet matchers = DefaultMatchers();
};

/**
 * @brief Classify, extract fields, redact, preserve fields, scrub metadata
 * @param doc source, not changed
 * @param params
 * @param log may be nullptr, then logger::InitLog() is used
 * @return CensorResult the censored document or the rejection verdict
 * @throws std::invalid_argument for invalid regions
 * @throws std::runtime_error for damaged documents and write errors
 */
CensorResult CensorDocument(const pdf::Document &doc,
                            const CensorParams &params,
                            const std::shared_ptr<spdlog::logger> &log);

} // namespace pdfcensor::censor
