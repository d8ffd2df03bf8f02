/* File: batch.cpp
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

#include "batch.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <variant>

#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "document.hpp"
#include "tr.hpp"

namespace pdfcensor::cli {

namespace {

std::string FailedDir(const std::string &output_dir) {
  return (std::filesystem::path(output_dir) / kFailedDirName).string();
}

// copy the untouched source to Failed, the outcome gets the destination
void CopyToFailed(FileOutcome &outcome, const std::string &output_dir,
                  const std::shared_ptr<spdlog::logger> &log) {
  const std::string failed_dir = FailedDir(output_dir);
  std::error_code err;
  std::filesystem::create_directories(failed_dir, err);
  if (err) {
    log->error(trs("Can not create directory") + " " + failed_dir + " " +
               err.message());
    return;
  }
  const std::filesystem::path dest =
    std::filesystem::path(failed_dir) /
    std::filesystem::path(outcome.source).filename();
  std::filesystem::copy_file(
    outcome.source, dest, std::filesystem::copy_options::overwrite_existing,
    err);
  if (err) {
    log->error(trs("Can not copy file to") + " " + dest.string() + " " +
               err.message());
    return;
  }
  outcome.destination = dest.string();
}

// reason code for parameters no document can be censored with, empty if OK
std::string CheckParams(const censor::CensorParams &params,
                        std::string &message) {
  try {
    censor::ValidateRegions(params.regions);
  } catch (const std::invalid_argument &ex) {
    message = ex.what();
    return kReasonInvalidRegion;
  }
  try {
    censor::ValidateLayout(params.layout);
  } catch (const std::invalid_argument &ex) {
    message = ex.what();
    return kReasonInvalidConfig;
  }
  return {};
}

} // namespace

size_t BatchSummary::SucceededCount() const noexcept {
  return static_cast<size_t>(
    std::count_if(outcomes.cbegin(), outcomes.cend(),
                  [](const FileOutcome &outcome) { return outcome.succeeded; }));
}

size_t BatchSummary::FailedCount() const noexcept {
  return outcomes.size() - SucceededCount();
}

FileOutcome ProcessOneFile(const std::string &src_file,
                           const BatchParams &params,
                           const std::shared_ptr<spdlog::logger> &log) noexcept {
  FileOutcome outcome;
  try {
    outcome.source = src_file;
    log->debug(trs("Processing file") + " " + src_file);
    outcome.reason = CheckParams(params.censor, outcome.message);
    if (outcome.reason.empty()) {
      const pdf::Document doc(src_file);
      auto result = censor::CensorDocument(doc, params.censor, log);
      if (const auto *rejection = std::get_if<censor::Rejection>(&result)) {
        outcome.reason = rejection->reason;
        outcome.message = trs("Document is not eligible");
      } else {
        auto &censored = std::get<censor::CensoredDocument>(result);
        const std::string dest = CensoredFilePath(src_file, params.output_dir);
        try {
          censored.WriteTo(dest);
          outcome.succeeded = true;
          outcome.destination = dest;
          log->info(trs("Censored") + " " + src_file + " -> " + dest);
          return outcome;
        } catch (const std::exception &ex) {
          outcome.reason = kReasonWriteFailed;
          outcome.message = ex.what();
        }
      }
    }
  } catch (const std::exception &ex) {
    outcome.reason = kReasonDamaged;
    outcome.message = ex.what();
  }
  try {
    log->warn(trs("Failed") + " " + src_file + " " + outcome.reason + " " +
              outcome.message);
    CopyToFailed(outcome, params.output_dir, log);
  } catch (const std::exception &ex) {
    outcome.message += std::string(" ") + ex.what();
  }
  return outcome;
}

BatchSummary RunBatch(const std::vector<std::string> &files,
                      const BatchParams &params,
                      const std::shared_ptr<spdlog::logger> &log) {
  BatchSummary summary;
  summary.output_dir = params.output_dir;
  summary.failed_dir = FailedDir(params.output_dir);
  summary.outcomes.resize(files.size());
  std::mutex mutex;
  size_t next_index = 0;
  const auto worker = [&]() {
    while (true) {
      size_t index = 0;
      {
        const std::lock_guard<std::mutex> lock(mutex);
        if (next_index >= files.size()) {
          return;
        }
        index = next_index++;
      }
      FileOutcome outcome = ProcessOneFile(files[index], params, log);
      const std::lock_guard<std::mutex> lock(mutex);
      summary.outcomes[index] = std::move(outcome);
    }
  };
  const size_t workers_count = std::max<size_t>(
    1, std::min<size_t>(params.jobs, std::max<size_t>(files.size(), 1)));
  if (workers_count == 1) {
    worker();
    return summary;
  }
  std::vector<std::thread> workers;
  workers.reserve(workers_count);
  for (size_t i = 0; i < workers_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto &thread : workers) {
    thread.join();
  }
  return summary;
}

void PrintSummary(const BatchSummary &summary,
                  const std::shared_ptr<spdlog::logger> &log) {
  log->info(trs("Processed files:") + " " +
            std::to_string(summary.SucceededCount()) + " " +
            trs("output directory:") + " " + summary.output_dir);
  if (summary.FailedCount() == 0) {
    return;
  }
  log->warn(trs("Failed files:") + " " +
            std::to_string(summary.FailedCount()) + " " +
            trs("copied to") + " " + summary.failed_dir);
  for (const auto &outcome : summary.outcomes) {
    if (!outcome.succeeded) {
      log->warn(outcome.source + " " + outcome.reason);
    }
  }
}

} // namespace pdfcensor::cli
