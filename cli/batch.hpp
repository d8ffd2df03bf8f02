/* File: batch.hpp
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

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "censor_pipeline.hpp"

namespace pdfcensor::cli {

/// @brief result for one input file
struct FileOutcome {
  std::string source;
  bool succeeded = false;
  /// reason code, empty on success
  std::string reason;
  /// censored file or the copy in Failed
  std::string destination;
  std::string message;
};

struct BatchParams {
  censor::CensorParams censor;
  std::string output_dir;
  unsigned int jobs = 1;
};

struct BatchSummary {
  std::vector<FileOutcome> outcomes;
  std::string output_dir;
  std::string failed_dir;

  [[nodiscard]] size_t SucceededCount() const noexcept;
  [[nodiscard]] size_t FailedCount() const noexcept;
  [[nodiscard]] bool AllSucceeded() const noexcept {
    return FailedCount() == 0;
  }
};

/**
 * @brief Censor one file and write the result
 * @details Never throws, every error is turned into a failed outcome and
 * the source is copied to "<output_dir>/Failed".
 */
FileOutcome ProcessOneFile(const std::string &src_file,
                           const BatchParams &params,
                           const std::shared_ptr<spdlog::logger> &log) noexcept;

/**
 * @brief Process the files on params.jobs worker threads
 * @return BatchSummary outcomes in the order of files
 */
BatchSummary RunBatch(const std::vector<std::string> &files,
                      const BatchParams &params,
                      const std::shared_ptr<spdlog::logger> &log);

/// @brief log the end of run summary
void PrintSummary(const BatchSummary &summary,
                  const std::shared_ptr<spdlog::logger> &log);

} // namespace pdfcensor::cli
