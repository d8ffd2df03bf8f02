/* File: options.hpp
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

#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>
#include <optional>
#include <string>
#include <vector>

#include "redactor.hpp"

namespace pdfcensor::cli {

namespace po = boost::program_options;

const char *const kHelpTag = "help,h";
const char *const kHelpTagL = "help";
const char *const kFileTag = "file,f";
const char *const kFileTagL = "file";
const char *const kFolderTag = "folder,d";
const char *const kFolderTagL = "folder";
const char *const kOutputTag = "output,o";
const char *const kOutputTagL = "output";
const char *const kNoInfoTag = "no-info,n";
const char *const kNoInfoTagL = "no-info";
const char *const kRegionTag = "region,r";
const char *const kRegionTagL = "region";
const char *const kConfigTag = "config,c";
const char *const kConfigTagL = "config";
const char *const kJobsTag = "jobs,j";
const char *const kJobsTagL = "jobs";
const char *const kError = "Error:";

/**
 * @brief Parse the region string "x,y,width,height"
 * @return std::nullopt if the string is malformed or the region is invalid
 */
std::optional<censor::RedactionRegion> ParseRegion(const std::string &value);

class Options {
 public:
  Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] bool help() const;
  [[nodiscard]] bool AllMandatoryAreSet() const;
  [[nodiscard]] bool WrongParams() const { return wrong_params_; }

  /// @brief true if --help was passed explicitly
  [[nodiscard]] bool HelpRequested() const {
    return var_map_.count(kHelpTagL) > 0;
  }

  /// @brief true if --folder is set
  [[nodiscard]] bool IsFolder() const;

  /// @brief resolved --file or --folder path
  [[nodiscard]] std::string GetInputPath() const;

  /// @brief resolved --output path, empty if not set
  [[nodiscard]] std::string GetOutputDir() const;

  /// @brief resolved --config path, empty if not set
  [[nodiscard]] std::string GetConfigPath() const;

  [[nodiscard]] bool NoInfo() const;

  /**
   * @brief Regions from --region options
   * @return std::nullopt if at least one value is malformed
   */
  [[nodiscard]] std::optional<std::vector<censor::RedactionRegion>>
  GetRegions() const;

  [[nodiscard]] std::optional<unsigned int> GetJobs() const;

 private:
  [[nodiscard]] std::string ResolvePath(const std::string &path) const;

  std::shared_ptr<spdlog::logger> log_;
  po::options_description description_;
  bool wrong_params_ = false;
  po::variables_map var_map_;
};

} // namespace pdfcensor::cli
