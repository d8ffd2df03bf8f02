/* File: test_cli.cpp
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

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <clocale>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "batch.hpp"
#include "cli_utils.hpp"
#include "common_defs.hpp"
#include "options.hpp"
#include "test_pdf_builder.hpp"

#ifndef TEST_DIR
#define TEST_DIR "/tmp/"
#endif

using namespace pdfcensor::cli;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> TestLogger() {
  static auto logger = spdlog::stdout_color_mt("test_cli");
  return logger;
}

// keeps the argv storage alive for the Options constructor
struct Args {
  explicit Args(std::vector<std::string> values) : storage(std::move(values)) {
    for (auto &value : storage) {
      pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(storage.size()); }
  std::vector<std::string> storage;
  std::vector<char *> pointers;
};

Options MakeOptions(Args &args) {
  char **argv = args.pointers.data();
  return Options(args.argc(), argv, TestLogger());
}

void WriteFile(const fs::path &path, const pdfcensor::pdf::BytesVector &data) {
  std::ofstream ofile(path, std::ios::binary | std::ios::trunc);
  REQUIRE(ofile.is_open());
  ofile.write(reinterpret_cast<const char *>(data.data()), // NOLINT
              static_cast<std::streamsize>(data.size()));
}

pdfcensor::pdf::BytesVector ReadFile(const fs::path &path) {
  std::ifstream ifile(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(ifile),
          std::istreambuf_iterator<char>()};
}

pdfcensor::pdf::BytesVector ReportPdf() {
  return pdfcensor::test::BuildSinglePage(
    pdfcensor::test::TextLineOp(72, 700, "Patient: John Smith") +
    pdfcensor::test::TextLineOp(72, 680, "Gender: F Age: 34"));
}

pdfcensor::pdf::BytesVector ThreePagePdf() {
  pdfcensor::test::TestPdf params;
  params.pages = {"", "", ""};
  return pdfcensor::test::BuildPdf(params);
}

} // namespace

TEST_CASE("ParseRegion") {
  const auto region = ParseRegion("0,600,300,192");
  REQUIRE(region);
  REQUIRE(region->y == Approx(600));
  REQUIRE(region->height == Approx(192));
  REQUIRE(ParseRegion(" 1.5 , 2 , 3 , 4 "));
  REQUIRE(ParseRegion("-5,-5,10,10"));
  REQUIRE_FALSE(ParseRegion("1,2,3"));
  REQUIRE_FALSE(ParseRegion("1,2,3,4,5"));
  REQUIRE_FALSE(ParseRegion("a,b,c,d"));
  REQUIRE_FALSE(ParseRegion("1,2,0,4"));
  REQUIRE_FALSE(ParseRegion("1,2,3,-4"));
  REQUIRE_FALSE(ParseRegion("1,2,3x,4"));
  REQUIRE_FALSE(ParseRegion("1,2,inf,4"));
  REQUIRE_FALSE(ParseRegion("1,,3,4"));
  REQUIRE_FALSE(ParseRegion(""));
}

TEST_CASE("ParseRegion with a decimal comma locale") {
  const std::string saved = std::setlocale(LC_ALL, nullptr);
  bool comma_locale = false;
  for (const char *name : {"es_ES.UTF-8", "de_DE.UTF-8", "ru_RU.UTF-8",
                           "fr_FR.UTF-8"}) {
    if (std::setlocale(LC_ALL, name) != nullptr) {
      comma_locale = true;
      break;
    }
  }
  if (!comma_locale) {
    WARN("no locale with a decimal comma is installed");
  }
  const auto region = ParseRegion("39.28,7.81,56.07,100.04");
  std::setlocale(LC_ALL, saved.c_str());
  REQUIRE(region);
  REQUIRE(region->x == Approx(39.28));
  REQUIRE(region->height == Approx(100.04));
}

TEST_CASE("Options") {
  SECTION("All set") {
    Args args({"pdfcensor", "--file", "/tmp/report.pdf", "--region",
               "0,0,10,10", "-r", "1,2,3,4", "--no-info", "--jobs", "3"});
    const auto options = MakeOptions(args);
    REQUIRE_FALSE(options.WrongParams());
    REQUIRE(options.AllMandatoryAreSet());
    REQUIRE_FALSE(options.help());
    REQUIRE_FALSE(options.IsFolder());
    REQUIRE(options.GetInputPath() == "/tmp/report.pdf");
    REQUIRE(options.GetOutputDir().empty());
    REQUIRE(options.GetConfigPath().empty());
    REQUIRE(options.NoInfo());
    const auto regions = options.GetRegions();
    REQUIRE(regions);
    REQUIRE(regions->size() == 2);
    REQUIRE((*regions)[1].width == Approx(3));
    REQUIRE(options.GetJobs() == 3U);
  }
  SECTION("Folder and relative paths") {
    Args args({"pdfcensor", "-d", "./reports/", "-o", "./out"});
    const auto options = MakeOptions(args);
    REQUIRE(options.AllMandatoryAreSet());
    REQUIRE(options.IsFolder());
    const std::string current = fs::current_path().string();
    REQUIRE(options.GetInputPath() == current + "/reports");
    REQUIRE(options.GetOutputDir() == current + "/out");
    REQUIRE_FALSE(options.NoInfo());
    REQUIRE_FALSE(options.GetJobs());
    REQUIRE(options.GetRegions()->empty());
  }
  SECTION("File and folder together") {
    Args args({"pdfcensor", "-f", "a.pdf", "-d", "dir"});
    const auto options = MakeOptions(args);
    REQUIRE_FALSE(options.AllMandatoryAreSet());
    REQUIRE(options.help());
  }
  SECTION("No input") {
    Args args({"pdfcensor", "-r", "1,2,3,4"});
    REQUIRE_FALSE(MakeOptions(args).AllMandatoryAreSet());
  }
  SECTION("Bad region") {
    Args args({"pdfcensor", "-f", "a.pdf", "-r", "1,2,3"});
    const auto options = MakeOptions(args);
    REQUIRE_FALSE(options.GetRegions());
    REQUIRE_FALSE(options.AllMandatoryAreSet());
  }
  SECTION("Zero jobs") {
    Args args({"pdfcensor", "-f", "a.pdf", "-j", "0"});
    REQUIRE_FALSE(MakeOptions(args).AllMandatoryAreSet());
  }
  SECTION("Missing config") {
    Args args({"pdfcensor", "-f", "a.pdf", "-c", "/var/sadl/config.json"});
    REQUIRE_FALSE(MakeOptions(args).AllMandatoryAreSet());
  }
  SECTION("Unknown option") {
    Args args({"pdfcensor", "--colour", "red"});
    const auto options = MakeOptions(args);
    REQUIRE(options.WrongParams());
    REQUIRE(options.help());
  }
  SECTION("Help") {
    Args args({"pdfcensor", "--help"});
    const auto options = MakeOptions(args);
    REQUIRE(options.HelpRequested());
    REQUIRE(options.help());
  }
}

TEST_CASE("Paths") {
  REQUIRE(DefaultOutputDir("/data/reports", true) ==
          "/data/" + std::string(kCensoredDirName));
  REQUIRE(DefaultOutputDir("/data/reports/a.pdf", false) == "/data/reports");
  REQUIRE(CensoredFilePath("/data/reports/a.pdf", "/out") ==
          "/out/a_censored.pdf");
  REQUIRE(CensoredFilePath("/data/B.PDF", "/out") == "/out/B_censored.PDF");
  SECTION("Input and output checks") {
    const fs::path dir = fs::path(TEST_DIR) / "paths_test";
    fs::remove_all(dir);
    REQUIRE_FALSE(CheckInputPath(dir.string(), true, TestLogger()));
    REQUIRE(PrepareOutputDir((dir / "nested").string(), TestLogger()));
    REQUIRE(fs::is_directory(dir / "nested"));
    REQUIRE(fs::is_empty(dir / "nested"));
    REQUIRE(CheckInputPath(dir.string(), true, TestLogger()));
    REQUIRE_FALSE(CheckInputPath(dir.string(), false, TestLogger()));
    WriteFile(dir / "a.pdf", ReportPdf());
    REQUIRE(CheckInputPath((dir / "a.pdf").string(), false, TestLogger()));
    REQUIRE_FALSE(CheckInputPath((dir / "a.pdf").string(), true, TestLogger()));
    fs::remove_all(dir);
  }
}

TEST_CASE("Batch") {
  const fs::path input_dir = fs::path(TEST_DIR) / "batch_in";
  const fs::path output_dir = fs::path(TEST_DIR) / "batch_out";
  fs::remove_all(input_dir);
  fs::remove_all(output_dir);
  fs::create_directories(input_dir);
  WriteFile(input_dir / "report.pdf", ReportPdf());
  WriteFile(input_dir / "UPPER.PDF", ReportPdf());
  WriteFile(input_dir / "multi.pdf", ThreePagePdf());
  const std::string garbage = "%PDF-1.7 this file is broken";
  WriteFile(input_dir / "broken.pdf",
            pdfcensor::pdf::BytesVector(garbage.cbegin(), garbage.cend()));
  WriteFile(input_dir / "notes.txt", ReportPdf());
  fs::create_directories(input_dir / "sub.pdf");

  BatchParams params;
  params.censor.regions = {{0, 690, 300, 30}};
  params.output_dir = output_dir.string();
  params.jobs = 2;

  SECTION("List files") {
    const auto files = ListPdfFiles(input_dir.string());
    REQUIRE(files.size() == 4);
    REQUIRE(files[0] == (input_dir / "UPPER.PDF").string());
    REQUIRE(files[1] == (input_dir / "broken.pdf").string());
    REQUIRE(files[3] == (input_dir / "report.pdf").string());
  }
  SECTION("Run") {
    REQUIRE(PrepareOutputDir(params.output_dir, TestLogger()));
    const auto files = ListPdfFiles(input_dir.string());
    const auto summary = RunBatch(files, params, TestLogger());
    PrintSummary(summary, TestLogger());
    REQUIRE(summary.outcomes.size() == 4);
    REQUIRE(summary.SucceededCount() == 2);
    REQUIRE(summary.FailedCount() == 2);
    REQUIRE_FALSE(summary.AllSucceeded());
    REQUIRE(summary.failed_dir == (output_dir / kFailedDirName).string());
    // outcomes keep the order of the input
    REQUIRE(summary.outcomes[0].succeeded);
    REQUIRE(summary.outcomes[0].destination ==
            (output_dir / "UPPER_censored.PDF").string());
    REQUIRE(summary.outcomes[1].reason == kReasonDamaged);
    REQUIRE(summary.outcomes[2].reason == kReasonMultiPage);
    REQUIRE(summary.outcomes[3].succeeded);
    REQUIRE(summary.outcomes[3].reason.empty());
    REQUIRE(fs::exists(output_dir / "report_censored.pdf"));
    REQUIRE_FALSE(fs::exists(output_dir / "multi_censored.pdf"));
    // failed inputs are copied unchanged
    const fs::path failed_multi = output_dir / kFailedDirName / "multi.pdf";
    REQUIRE(fs::exists(failed_multi));
    REQUIRE(ReadFile(failed_multi) == ReadFile(input_dir / "multi.pdf"));
    REQUIRE(fs::exists(output_dir / kFailedDirName / "broken.pdf"));
    REQUIRE(summary.outcomes[2].destination == failed_multi.string());
    // the source files are not touched
    REQUIRE(ReadFile(input_dir / "report.pdf") == ReportPdf());
  }
  SECTION("Single worker gives the same result") {
    params.jobs = 1;
    REQUIRE(PrepareOutputDir(params.output_dir, TestLogger()));
    const auto summary =
      RunBatch(ListPdfFiles(input_dir.string()), params, TestLogger());
    REQUIRE(summary.SucceededCount() == 2);
    REQUIRE(summary.outcomes[2].reason == kReasonMultiPage);
  }
  SECTION("Empty input") {
    const auto summary = RunBatch({}, params, TestLogger());
    REQUIRE(summary.outcomes.empty());
    REQUIRE(summary.AllSucceeded());
  }
  SECTION("Invalid region") {
    params.censor.regions = {{0, 0, 0, 0}};
    const auto outcome = ProcessOneFile((input_dir / "report.pdf").string(),
                                        params, TestLogger());
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(outcome.reason == kReasonInvalidRegion);
  }
  SECTION("Invalid layout") {
    params.censor.layout.font_size = -2;
    const auto outcome = ProcessOneFile((input_dir / "report.pdf").string(),
                                        params, TestLogger());
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(outcome.reason == kReasonInvalidConfig);
  }
  SECTION("Full page region") {
    params.censor.regions = {{0, 0, 612, 792}};
    REQUIRE(PrepareOutputDir(params.output_dir, TestLogger()));
    const auto outcome = ProcessOneFile((input_dir / "report.pdf").string(),
                                        params, TestLogger());
    REQUIRE(outcome.succeeded);
    REQUIRE(fs::exists(output_dir / "report_censored.pdf"));
  }
  SECTION("Write failure") {
    // the output directory was not prepared
    params.output_dir = (output_dir / "missing").string();
    const auto outcome = ProcessOneFile((input_dir / "report.pdf").string(),
                                        params, TestLogger());
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(outcome.reason == kReasonWriteFailed);
    REQUIRE_FALSE(fs::exists(output_dir / "missing" / "report_censored.pdf"));
    REQUIRE(fs::exists(output_dir / "missing" / kFailedDirName / "report.pdf"));
  }
  SECTION("Missing file") {
    const auto outcome = ProcessOneFile((input_dir / "nope.pdf").string(),
                                        params, TestLogger());
    REQUIRE_FALSE(outcome.succeeded);
    REQUIRE(outcome.reason == kReasonDamaged);
  }
  fs::remove_all(input_dir);
  fs::remove_all(output_dir);
}
