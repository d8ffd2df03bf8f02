/* File: options.cpp
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

#include "options.hpp"

#include "tr.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <locale>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pdfcensor::cli {

std::optional<censor::RedactionRegion> ParseRegion(const std::string &value) {
  std::vector<std::string> parts;
  boost::split(parts, value, boost::is_any_of(","));
  if (parts.size() != 4) {
    return std::nullopt;
  }
  std::vector<double> numbers;
  for (auto &part : parts) {
    boost::trim(part);
    if (part.empty()) {
      return std::nullopt;
    }
    // the C locale may be set to one with a decimal comma
    std::istringstream stream(part);
    stream.imbue(std::locale::classic());
    double number = 0;
    stream >> number;
    if (stream.fail() || stream.peek() != std::char_traits<char>::eof() ||
        !std::isfinite(number)) {
      return std::nullopt;
    }
    numbers.push_back(number);
  }
  censor::RedactionRegion res{numbers[0], numbers[1], numbers[2], numbers[3]};
  if (res.width <= 0 || res.height <= 0) {
    return std::nullopt;
  }
  return res;
}

Options::Options(int argc, char **&argv, std::shared_ptr<spdlog::logger> logger)
  : log_(std::move(logger)), description_(tr("Allowed options")) {
  description_.add_options()
    // clang-format off
      (kHelpTag, tr("produce this help message"))
      (kFileTag, po::value<std::string>(), tr("single PDF file to censor"))
      (kFolderTag, po::value<std::string>(), tr("folder with PDF files to censor"))
      (kOutputTag, po::value<std::string>(), tr("output directory"))
      (kNoInfoTag, tr("do not write the gender and age back"))
      (kRegionTag, po::value<std::vector<std::string>>(),
        tr("region to redact: x,y,width,height (may be repeated), "
           "the built-in template is used if none is given"))
      (kConfigTag, po::value<std::string>(), tr("JSON configuration file"))
      (kJobsTag, po::value<unsigned int>(), tr("number of parallel workers"));
  // clang-format on
  try {
    po::store(po::command_line_parser(argc, argv).options(description_).run(),
              var_map_);
    po::notify(var_map_);
  } catch (
    boost::wrapexcept<boost::program_options::invalid_command_line_syntax>
      & /*ex*/) {
    log_->error(tr("Wrong parameters, see --help"));
    wrong_params_ = true;
  } catch (boost::wrapexcept<boost::program_options::unknown_option> &ex) {
    log_->error(trs("Unknown option passed.") + ex.what());
    wrong_params_ = true;
  } catch (
    const boost::wrapexcept<boost::program_options::ambiguous_option> &ex) {
    wrong_params_ = true;
    log_->error(
      tr("Ambiguous option passed,use - for short options and -- "
         "for full otions,--help for help"));
  } catch (const po::error &ex) {
    log_->error(trs("Wrong parameters") + " " + ex.what());
    wrong_params_ = true;
  }
}

bool Options::help() const {
  if (var_map_.empty() || var_map_.count(kHelpTagL) > 0 || wrong_params_ ||
      !AllMandatoryAreSet()) {
    std::cout << tr("A tool for redacting single-page PDF documents") << "\n";
    // clang-format off
    std::cout << tr("Usage") << ": "
              << TRANSLATION_DOMAIN << " "
              << "--folder ./reports"
              << " --region 0,600,300,192"
              << " --region 300,0,312,100"
              << " [--output ./censored]"
              << " [--no-info]"
              << " [--config ./censor.json]"
              << " [--jobs 4]\n";
    std::cout << description_ << "\n";
    // clang-format on
    return true;
  }
  return false;
}

std::string Options::ResolvePath(const std::string &path) const {
  std::string local_path = path;
  std::string current_path = std::filesystem::current_path();
  current_path += "/";
  const char *home = getenv("HOME"); // NOLINT
  if (local_path.empty() || local_path == ".") {
    local_path = std::filesystem::current_path();
  }
  if (boost::starts_with(local_path, "./")) {
    boost::replace_first(local_path, "./", current_path);
  }
  if (home != nullptr && boost::starts_with(local_path, "~/")) {
    std::string home_path = std::filesystem::path(home);
    home_path += "/";
    boost::replace_first(local_path, "~/", home_path);
  }
  std::filesystem::path fs_path = local_path;
  std::error_code err_code;
  fs_path = std::filesystem::absolute(fs_path, err_code);
  if (err_code) {
    log_->error(err_code.message());
  }
  local_path = fs_path.lexically_normal();
  // a trailing slash would give an empty file name
  while (local_path.size() > 1 && local_path.back() == '/') {
    local_path.pop_back();
  }
  return local_path;
}

bool Options::AllMandatoryAreSet() const {
  const bool has_file = var_map_.count(kFileTagL) > 0;
  const bool has_folder = var_map_.count(kFolderTagL) > 0;
  if (!has_file && !has_folder) {
    log_->error(tr("No input is set, use --file or --folder"));
    return false;
  }
  if (has_file && has_folder) {
    log_->error(tr("--file and --folder can not be used together"));
    return false;
  }
  if (!GetRegions()) {
    return false;
  }
  if (var_map_.count(kJobsTagL) > 0 &&
      var_map_.at(kJobsTagL).as<unsigned int>() == 0) {
    log_->error(tr("Number of jobs should be greater than null"));
    return false;
  }
  if (var_map_.count(kConfigTagL) > 0 &&
      !std::filesystem::exists(
        ResolvePath(var_map_.at(kConfigTagL).as<std::string>()))) {
    log_->error(trs("Configuration file not found") + " " +
                ResolvePath(var_map_.at(kConfigTagL).as<std::string>()));
    return false;
  }
  return true;
}

bool Options::IsFolder() const { return var_map_.count(kFolderTagL) > 0; }

std::string Options::GetInputPath() const {
  if (var_map_.count(kFolderTagL) > 0) {
    return ResolvePath(var_map_.at(kFolderTagL).as<std::string>());
  }
  if (var_map_.count(kFileTagL) > 0) {
    return ResolvePath(var_map_.at(kFileTagL).as<std::string>());
  }
  return {};
}

std::string Options::GetOutputDir() const {
  if (var_map_.count(kOutputTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kOutputTagL).as<std::string>());
}

std::string Options::GetConfigPath() const {
  if (var_map_.count(kConfigTagL) == 0) {
    return {};
  }
  return ResolvePath(var_map_.at(kConfigTagL).as<std::string>());
}

bool Options::NoInfo() const { return var_map_.count(kNoInfoTagL) > 0; }

std::optional<std::vector<censor::RedactionRegion>> Options::GetRegions()
  const {
  std::vector<censor::RedactionRegion> res;
  if (var_map_.count(kRegionTagL) == 0) {
    return res;
  }
  for (const auto &value :
       var_map_.at(kRegionTagL).as<std::vector<std::string>>()) {
    auto region = ParseRegion(value);
    if (!region) {
      log_->error(trs("Invalid region") + " '" + value + "', " +
                  trs("expected x,y,width,height with positive width and "
                      "height"));
      return std::nullopt;
    }
    res.push_back(*region);
  }
  return res;
}

std::optional<unsigned int> Options::GetJobs() const {
  if (var_map_.count(kJobsTagL) == 0) {
    return std::nullopt;
  }
  return var_map_.at(kJobsTagL).as<unsigned int>();
}

} // namespace pdfcensor::cli
