/* File: pdfcensor.cpp
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

#include <libintl.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clocale>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "batch.hpp"
#include "censor_config.hpp"
#include "cli_utils.hpp"
#include "options.hpp"
#include "tr.hpp"

int main(int argc, char* argv[]) {
  using pdfcensor::cli::tr;
  using pdfcensor::cli::trs;
  // setup the transtlator
  if (setlocale(LC_ALL, "") == nullptr) {  // NOLINT
    std::cerr << "Failed to set locale.\n";
    return 1;
  }
  bindtextdomain(TRANSLATION_DOMAIN, TRANSLATIONS_INSTALL_DIR);
  bind_textdomain_codeset(TRANSLATION_DOMAIN, "UTF-8");
  textdomain(TRANSLATION_DOMAIN);
  try {
    // ----------------
    // setup logging
    auto console = spdlog::stdout_color_mt(TRANSLATION_DOMAIN);
    if (!console) {
      std::cerr << tr("Setup logger failed");
      return 1;
    }
    const pdfcensor::cli::Options options(argc, argv, console);
    if (options.help()) {
      return options.HelpRequested() && !options.WrongParams() ? 0 : 1;
    }
    // ----------------
    // configuration, command line values take precedence
    pdfcensor::cli::BatchParams params;
    const std::string config_path = options.GetConfigPath();
    if (!config_path.empty()) {
      auto config = pdfcensor::censor::LoadConfig(config_path);
      params.censor = std::move(config.params);
      if (config.jobs) {
        params.jobs = *config.jobs;
      }
      console->info(trs("Configuration loaded") + " " + config_path);
    }
    const auto cli_regions = options.GetRegions();
    if (!cli_regions) {
      return 1;
    }
    params.censor.regions.insert(params.censor.regions.end(),
                                 cli_regions->cbegin(), cli_regions->cend());
    if (params.censor.regions.empty() && !params.censor.use_default_template) {
      console->info(tr("No regions given, the built-in template is used"));
      params.censor.use_default_template = true;
    }
    if (options.NoInfo()) {
      params.censor.include_info = false;
    }
    if (options.GetJobs()) {
      params.jobs = *options.GetJobs();
    }
    // ----------------
    // input
    const std::string input_path = options.GetInputPath();
    const bool is_folder = options.IsFolder();
    if (!pdfcensor::cli::CheckInputPath(input_path, is_folder, console)) {
      console->error(tr("Input is not OK"));
      return 1;
    }
    std::vector<std::string> input_files;
    if (is_folder) {
      input_files = pdfcensor::cli::ListPdfFiles(input_path);
      if (input_files.empty()) {
        console->warn(trs("No PDF files found in") + " " + input_path);
      }
    } else {
      input_files.push_back(input_path);
    }
    // ----------------
    // output
    params.output_dir = options.GetOutputDir();
    if (params.output_dir.empty()) {
      params.output_dir =
        pdfcensor::cli::DefaultOutputDir(input_path, is_folder);
    }
    if (pdfcensor::cli::PrepareOutputDir(params.output_dir, console)) {
      console->info(tr("Output directory is OK"));
    } else {
      console->error(tr("Output directory is not OK"));
      return 1;
    }
    // ----------------
    // censor files
    const auto summary =
      pdfcensor::cli::RunBatch(input_files, params, console);
    pdfcensor::cli::PrintSummary(summary, console);
    // return 0 if all files succeeded
    return summary.AllSucceeded() ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << tr("Error:") << ex.what() << "\n";
    return 1;
  }
  return 0;
}
