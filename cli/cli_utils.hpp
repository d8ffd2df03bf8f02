/* File: cli_utils.hpp
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
#include <vector>

namespace pdfcensor::cli {

constexpr const char *const kCensoredDirName = "Censored PDFs";
constexpr const char *const kFailedDirName = "Failed";
constexpr const char *const kCensoredPostfix = "_censored";

/**
 * @brief Check the --file or --folder input
 *
 * @param path resolved path
 * @param is_folder
 * @param log logger
 * @return true if the file is a regular file or the folder is a directory
 */
bool CheckInputPath(const std::string &path, bool is_folder,
                    const std::shared_ptr<spdlog::logger> &log);

/**
 * @brief List the PDF files of the folder
 * @details Regular files with .pdf extension (any case), sorted by name.
 * Subfolders are not scanned.
 * @param folder
 * @return std::vector<std::string> full paths
 */
std::vector<std::string> ListPdfFiles(const std::string &folder);

/**
 * @brief Default output directory
 * @return "<parent of folder>/Censored PDFs" for a folder, the file's
 * directory for a file
 */
std::string DefaultOutputDir(const std::string &input_path, bool is_folder);

/**
 * @brief Name of the output file
 * @return "<output_dir>/<stem>_censored<ext>"
 */
std::string CensoredFilePath(const std::string &src_file,
                             const std::string &output_dir);

/**
 * @brief Create the output directory if needed and check that it is
 * writable
 *
 * @param output_dir
 * @param log logger
 * @return true - existing,writable
 * @return false
 */
bool PrepareOutputDir(const std::string &output_dir,
                      const std::shared_ptr<spdlog::logger> &log);

} // namespace pdfcensor::cli
