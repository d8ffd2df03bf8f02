/* File: censor_pipeline.cpp
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

#include "censor_pipeline.hpp"

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "logger_utils.hpp"
#include "metadata_scrubber.hpp"
#include "pdf_utils.hpp"
#include "region_template.hpp"
#include "text_extractor.hpp"

namespace pdfcensor::censor {

CensorResult CensorDocument(const pdf::Document &doc,
                            const CensorParams &params,
                            const std::shared_ptr<spdlog::logger> &log) {
  // library callers may pass no logger, fall back to the journal/stderr one
  const auto logger = log ? log : logger::InitLog();
  const std::string &name = doc.Description();
  const size_t page_count = doc.GetPagesCount();
  if (page_count != 1) {
    if (logger) {
      logger->debug("[CensorDocument] {} has {} pages", name, page_count);
    }
    return Rejection{Verdict::kFailedMultiPage,
                     VerdictReason(Verdict::kFailedMultiPage)};
  }
  const PageText page_text = ExtractPageText(doc);
  const Verdict verdict = Classify(page_count, page_text);
  if (verdict != Verdict::kEligible) {
    if (logger) {
      logger->debug("[CensorDocument] {} rejected {}", name,
                    VerdictReason(verdict));
    }
    return Rejection{verdict, VerdictReason(verdict)};
  }
  if (logger) {
    logger->debug("[CensorDocument] {} classified {}", name,
                  VerdictReason(verdict));
  }
  const auto fields = ExtractFields(page_text, params.matchers);
  if (logger) {
    for (const auto &field : fields) {
      logger->debug("[CensorDocument] {} found {} at {}", name,
                    FieldKindName(field.kind), field.box.ToString());
    }
  }
  std::vector<RedactionRegion> regions = params.regions;
  if (params.use_default_template) {
    const auto page = doc.GetPage(0);
    const auto media_box =
      page ? pdf::PageMediaBox(*page) : std::optional<pdf::BBox>();
    if (!media_box) {
      throw std::runtime_error("[CensorDocument] " + name + " " +
                               pdf::kErrPageSize);
    }
    const auto template_regions = TemplateRegions(DefaultTemplate(), *media_box);
    regions.insert(regions.end(), template_regions.cbegin(),
                   template_regions.cend());
    if (logger) {
      logger->debug("[CensorDocument] {} {} template regions added", name,
                    template_regions.size());
    }
  }
  CensoredDocument censored = Redact(doc, regions, logger);
  if (logger) {
    logger->debug("[CensorDocument] {} redacted, {} regions applied", name,
                  censored.AppliedRegions().size());
  }
  censored = ApplyPreservedFields(std::move(censored), fields,
                                  params.include_info, params.layout, logger);
  const auto remaining = ScrubMetadata(censored);
  if (logger) {
    logger->debug("[CensorDocument] {} metadata scrubbed, {} info keys left",
                  name, remaining.size());
    if (!remaining.empty()) {
      logger->trace("[CensorDocument] info left:\n{}",
                    pdf::UnparsedMapToString(remaining));
    }
  }
  return CensorResult{std::move(censored)};
}

} // namespace pdfcensor::censor
