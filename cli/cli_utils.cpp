/* File: cli_utils.cpp
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

#include "cli_utils.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <exception>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "tr.hpp"

namespace pdfcensor::cli {

bool CheckInputPath(const std::string &path, bool is_folder,
                    const std::shared_ptr<spdlog::logger> &log) {
  try {
    if (!std::filesystem::exists(path)) {
      log->error((is_folder ? trs("Folder not found") : trs("File not found")) +
                 " " + path);
      return false;
    }
    if (is_folder && !std::filesystem::is_directory(path)) {
      log->error(trs("This is not a directory") + " " + path);
      return false;
    }
    if (!is_folder && !std::filesystem::is_regular_file(path)) {
      log->error(trs("This file is not a regular file") + " " + path);
      return false;
    }
  } catch (const std::exception &ex) {
    log->error(ex.what());
    return false;
  }
  return true;
}

std::vector<std::string> ListPdfFiles(const std::string &folder) {
  std::vector<std::string> res;
  for (const auto &entry : std::filesystem::directory_iterator(folder)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    if (boost::iequals(entry.path().extension().string(), ".pdf")) {
      res.push_back(entry.path().string());
    }
  }
  std::sort(res.begin(), res.end());
  return res;
}

std::string DefaultOutputDir(const std::string &input_path, bool is_folder) {
  const std::filesystem::path input(input_path);
  if (is_folder) {
    return (input.parent_path() / kCensoredDirName).string();
  }
  return input.parent_path().string();
}

std::string CensoredFilePath(const std::string &src_file,
                             const std::string &output_dir) {
  const std::filesystem::path src(src_file);
  std::string name = src.stem().string();
  name += kCensoredPostfix;
  name += src.extension().string();
  return (std::filesystem::path(output_dir) / name).string();
}

bool PrepareOutputDir(const std::string &output_dir,
                      const std::shared_ptr<spdlog::logger> &log) {
  std::error_code err;
  std::filesystem::create_directories(output_dir, err);
  if (err) {
    log->error(trs("Can not create directory") + " " + output_dir + " " +
               err.message());
    return false;
  }
  if (!std::filesystem::is_directory(output_dir)) {
    log->error(trs("Directory not found") + " " + output_dir);
    return false;
  }
  const std::string tmp_filename =
    (std::filesystem::path(output_dir) / "test_temporary_file_for_pdfcensor")
      .string();
  std::ofstream ofile(tmp_filename);
  if (!ofile.is_open()) {
    log->error(trs("Can not create file in directory") + " " + output_dir);
    return false;
  }
  ofile.close();
  std::filesystem::remove(tmp_filename, err);
  return true;
}

} // namespace pdfcensor::cli
