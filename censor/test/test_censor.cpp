/* File: test_censor.cpp
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

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "censor_config.hpp"
#include "censor_pipeline.hpp"
#include "censored_document.hpp"
#include "classifier.hpp"
#include "common_defs.hpp"
#include "document.hpp"
#include "field_matcher.hpp"
#include "field_preserver.hpp"
#include "metadata_scrubber.hpp"
#include "redactor.hpp"
#include "region_template.hpp"
#include "test_pdf_builder.hpp"
#include "text_extractor.hpp"

#ifndef TEST_DIR
#define TEST_DIR "/tmp/"
#endif

using namespace pdfcensor::censor;
using pdfcensor::pdf::BBox;
using pdfcensor::pdf::BytesVector;
using pdfcensor::pdf::Document;
using pdfcensor::test::BuildPdf;
using pdfcensor::test::BuildSinglePage;
using pdfcensor::test::ImageOp;
using pdfcensor::test::TestPdf;
using pdfcensor::test::TextLineOp;

namespace {

// Courier 12: every glyph is 7.2 wide, from y-2.4 to y+9.6
constexpr double kGlyphWidth = 7.2;

const std::string kPatientLine = "Patient: John Smith";
const std::string kGenderAgeLine = "Gender: F Age: 34";
const std::string kDiagnosisLine = "Diagnosis: healthy";

std::string ReportContent() {
  return TextLineOp(72, 700, kPatientLine) +
         TextLineOp(72, 680, kGenderAgeLine) +
         TextLineOp(72, 100, kDiagnosisLine) +
         TextLineOp(400, 700, "Clinic: North");
}

BytesVector ReportPdf() { return BuildSinglePage(ReportContent()); }

PageText TextOf(const BytesVector &bytes) {
  const Document doc(bytes, "output");
  return ExtractPageText(doc);
}

bool Contains(const std::string &text, const std::string &what) {
  return text.find(what) != std::string::npos;
}

// glyph origins and texts, compared between outputs
std::vector<std::string> GlyphSignature(const PageText &page_text) {
  std::vector<std::string> res;
  for (const auto &glyph : page_text.glyphs) {
    res.push_back(glyph.unicode + "@" + glyph.origin.ToString());
  }
  std::sort(res.begin(), res.end());
  return res;
}

std::vector<QPDFObjectHandle> PageImages(const BytesVector &bytes,
                                         std::unique_ptr<QPDF> &holder) {
  holder = std::make_unique<QPDF>();
  holder->processMemoryFile("images",
                            reinterpret_cast<const char *>(bytes.data()), // NOLINT
                            bytes.size());
  std::vector<QPDFObjectHandle> res;
  auto page = holder->getAllPages().at(0);
  auto xobjects = page.getKey("/Resources").getKey("/XObject");
  if (!xobjects.isDictionary()) {
    return res;
  }
  for (const auto &key : xobjects.getKeys()) {
    auto xobj = xobjects.getKey(key);
    if (xobj.isStream() && xobj.getDict().getKey("/Subtype").isName() &&
        xobj.getDict().getKey("/Subtype").getName() == "/Image") {
      res.push_back(xobj);
    }
  }
  return res;
}

std::string DecodedData(QPDFObjectHandle stream) {
  auto buf = stream.getStreamData(qpdf_dl_all);
  return {reinterpret_cast<const char *>(buf->getBuffer()), // NOLINT
          buf->getSize()};
}

} // namespace

TEST_CASE("Field matchers") {
  const auto matchers = DefaultMatchers();
  const auto &gender = *matchers.at(FieldKind::kGender);
  const auto &age = *matchers.at(FieldKind::kAge);
  SECTION("Defaults") {
    REQUIRE(gender.Kind() == FieldKind::kGender);
    REQUIRE(gender.FindFirst("Sexo: Femenino")->value == "Femenino");
    REQUIRE(gender.FindFirst("gender: m")->value == "m");
    REQUIRE(gender.FindFirst("Sex F, Age 40")->value == "F");
    REQUIRE(gender.FindFirst("Male patient")->value == "Male");
    REQUIRE_FALSE(gender.FindFirst("Formal M. Fernandez"));
    REQUIRE(age.FindFirst("Juan (45 a\xC3\xB1os)")->value == "(45 a\xC3\xB1os)");
    REQUIRE(age.FindFirst("Edad: 7")->value == "7");
    REQUIRE(age.FindFirst("34 years old")->value == "34");
    REQUIRE_FALSE(age.FindFirst("Room 1234"));
  }
  SECTION("Leftmost match wins") {
    const auto match = gender.FindFirst("Female, then Gender: M");
    REQUIRE(match);
    REQUIRE(match->value == "Female");
    REQUIRE(match->position == 0);
    REQUIRE(match->length == 6);
  }
  SECTION("Custom patterns") {
    const RegexFieldMatcher custom(FieldKind::kGender,
                                   {{R"(Geschlecht:\s*(w|m))", 1, false}});
    REQUIRE(custom.FindFirst("Geschlecht: w")->value == "w");
    REQUIRE_THROWS_AS(RegexFieldMatcher(FieldKind::kAge, {}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(RegexFieldMatcher(FieldKind::kAge, {{"(unclosed", 0}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(RegexFieldMatcher(FieldKind::kAge, {{"(\\d+)", 2}}),
                      std::invalid_argument);
  }
  REQUIRE(FieldKindName(FieldKind::kGender) == "gender");
  REQUIRE(FieldKindName(FieldKind::kAge) == "age");
}

TEST_CASE("Text extraction") {
  SECTION("Reading order") {
    // painted bottom first
    const auto page_text = TextOf(BuildSinglePage(
      TextLineOp(72, 100, "bottom") + TextLineOp(200, 400, "right") +
      TextLineOp(72, 400, "left") + TextLineOp(72, 700, "top")));
    REQUIRE(page_text.lines.size() == 3);
    REQUIRE(page_text.Text() == "top\nleft right\nbottom");
    REQUIRE(page_text.HasRecoverableGlyphs());
  }
  SECTION("Spaces from gaps") {
    const auto page_text = TextOf(BuildSinglePage(
      "BT\n/F1 12 Tf\n72 500 Td\n[(Age:) -1000 (34)] TJ\nET\n"));
    REQUIRE(page_text.Text() == "Age: 34");
  }
  SECTION("Form XObject text counts") {
    TestPdf params;
    params.pages.push_back("q 1 0 0 1 100 100 cm /Fm1 Do Q\n");
    const auto bytes = BuildPdf(params);
    QPDF qpdf;
    qpdf.processMemoryFile("form",
                           reinterpret_cast<const char *>(bytes.data()), // NOLINT
                           bytes.size());
    auto page = qpdf.getAllPages().at(0);
    auto form = QPDFObjectHandle::newStream(
      &qpdf, "BT /F1 12 Tf 0 0 Td (Sex: M) Tj ET");
    form.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    form.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/Form"));
    form.getDict().replaceKey("/BBox",
                              QPDFObjectHandle::parse("[0 0 200 50]"));
    auto resources = page.getKey("/Resources");
    resources.replaceKey("/XObject", QPDFObjectHandle::newDictionary());
    resources.getKey("/XObject").replaceKey("/Fm1", form);
    const auto page_text = ExtractPageText(page);
    REQUIRE(page_text.Text() == "Sex: M");
    REQUIRE(page_text.glyphs.at(0).origin.x == Approx(100));
    const auto fields = ExtractFields(page_text, DefaultMatchers());
    REQUIRE(fields.size() == 1);
    REQUIRE(fields[0].value == "M");
  }
  SECTION("Fields") {
    const Document doc(ReportPdf(), "report");
    const auto fields = ExtractFields(doc, DefaultMatchers());
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0].kind == FieldKind::kGender);
    REQUIRE(fields[0].value == "F");
    // "Gender: " is 8 glyphs long
    REQUIRE(fields[0].box.left_bottom.x == Approx(72 + 8 * kGlyphWidth));
    REQUIRE(fields[0].box.Width() == Approx(kGlyphWidth));
    REQUIRE(fields[1].kind == FieldKind::kAge);
    REQUIRE(fields[1].value == "34");
    REQUIRE(fields[1].box.Width() == Approx(2 * kGlyphWidth));
  }
  SECTION("First in reading order wins") {
    const auto page_text = TextOf(BuildSinglePage(
      TextLineOp(72, 100, "Gender: Male") +
      TextLineOp(72, 700, "Gender: Female")));
    const auto fields = ExtractFields(page_text, DefaultMatchers());
    REQUIRE(fields.size() == 1);
    REQUIRE(fields[0].value == "Female");
  }
  SECTION("Missing fields are not an error") {
    const auto page_text = TextOf(BuildSinglePage(TextLineOp(72, 700, "x")));
    REQUIRE(ExtractFields(page_text, DefaultMatchers()).empty());
  }
}

TEST_CASE("Classification") {
  SECTION("Eligible") {
    const Document doc(ReportPdf(), "report");
    REQUIRE(Classify(doc) == Verdict::kEligible);
    REQUIRE(VerdictReason(Verdict::kEligible) == kReasonEligible);
  }
  SECTION("Multi page") {
    TestPdf params;
    params.pages = {ReportContent(), ReportContent(), ReportContent()};
    const Document doc(BuildPdf(params), "three pages");
    REQUIRE(Classify(doc) == Verdict::kFailedMultiPage);
    REQUIRE(VerdictReason(Verdict::kFailedMultiPage) == kReasonMultiPage);
    REQUIRE(Classify(0, PageText{}) == Verdict::kFailedMultiPage);
  }
  SECTION("No extractable text") {
    REQUIRE(Classify(Document(BuildSinglePage(""), "empty")) ==
            Verdict::kFailedNoExtractableText);
    REQUIRE(Classify(Document(BuildSinglePage(TextLineOp(72, 700, "   ")),
                              "blank")) == Verdict::kFailedNoExtractableText);
    TestPdf scanned;
    scanned.images.emplace_back();
    scanned.pages.push_back(ImageOp("/Im1", 0, 0, 612, 792));
    REQUIRE(Classify(Document(BuildPdf(scanned), "scanned")) ==
            Verdict::kFailedNoExtractableText);
    REQUIRE(VerdictReason(Verdict::kFailedNoExtractableText) == kReasonNoText);
  }
}

TEST_CASE("Redaction") {
  const Document doc(ReportPdf(), "report");
  SECTION("Invalid regions") {
    REQUIRE_THROWS_AS(ValidateRegions({{0, 0, 0, 10}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ValidateRegions({{0, 0, 10, 10}, {0, 0, 10, -1}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(
      ValidateRegions({{0, 0, std::numeric_limits<double>::quiet_NaN(), 1}}),
      std::invalid_argument);
    REQUIRE_THROWS_AS(
      ValidateRegions({{std::numeric_limits<double>::infinity(), 0, 1, 1}}),
      std::invalid_argument);
    REQUIRE_NOTHROW(ValidateRegions({{-10, -10, 5, 5}}));
    REQUIRE_THROWS_AS(Redact(doc, {{10, 10, -5, 5}}), std::invalid_argument);
  }
  SECTION("Whole line") {
    const RedactionRegion region{0, 690, 300, 30};
    auto censored = Redact(doc, {region});
    REQUIRE(censored.AppliedRegions().size() == 1);
    const auto page_text = TextOf(censored.ToBytes());
    const std::string text = page_text.Text();
    REQUIRE_FALSE(Contains(text, "John"));
    REQUIRE_FALSE(Contains(text, "Patient"));
    REQUIRE(Contains(text, kGenderAgeLine));
    REQUIRE(Contains(text, kDiagnosisLine));
    REQUIRE(Contains(text, "Clinic: North"));
    // nothing left under the rectangle
    for (const auto &glyph : page_text.glyphs) {
      REQUIRE_FALSE(glyph.box.Intersects(region.ToBBox()));
    }
  }
  SECTION("Part of a string keeps positions") {
    // "John" is glyphs 9..12 of the patient line
    const RedactionRegion region{72 + 9 * kGlyphWidth + 0.5, 695,
                                 4 * kGlyphWidth - 1, 10};
    auto censored = Redact(doc, {region});
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "John"));
    REQUIRE(Contains(page_text.Text(), "Patient:"));
    REQUIRE(Contains(page_text.Text(), "Smith"));
    const auto it_smith = std::find_if(
      page_text.glyphs.cbegin(), page_text.glyphs.cend(),
      [](const auto &glyph) { return glyph.unicode == "S"; });
    REQUIRE(it_smith != page_text.glyphs.cend());
    REQUIRE(it_smith->origin.x == Approx(72 + 14 * kGlyphWidth));
    REQUIRE(it_smith->origin.y == Approx(700));
  }
  SECTION("Idempotent") {
    const std::vector<RedactionRegion> regions{{0, 690, 200, 30},
                                               {60, 90, 50, 20}};
    auto once = Redact(doc, regions).ToBytes();
    const Document once_doc(once, "once");
    auto twice = Redact(once_doc, regions).ToBytes();
    REQUIRE(GlyphSignature(TextOf(once)) == GlyphSignature(TextOf(twice)));
    REQUIRE(TextOf(once).Text() == TextOf(twice).Text());
  }
  SECTION("Commutative") {
    const RedactionRegion first{0, 690, 200, 30};
    const RedactionRegion second{100, 670, 300, 60};
    auto forward = Redact(doc, {first, second}).ToBytes();
    auto backward = Redact(doc, {second, first}).ToBytes();
    REQUIRE(GlyphSignature(TextOf(forward)) ==
            GlyphSignature(TextOf(backward)));
    const Document forward_doc(forward, "forward");
    auto sequential = Redact(Document(Redact(doc, {second}).ToBytes(), "one"),
                             {first})
                        .ToBytes();
    REQUIRE(GlyphSignature(TextOf(sequential)) ==
            GlyphSignature(TextOf(forward)));
  }
  SECTION("Top left quadrant") {
    const RedactionRegion quadrant{0, 396, 306, 396};
    const auto page_text = TextOf(Redact(doc, {quadrant}).ToBytes());
    const std::string text = page_text.Text();
    REQUIRE_FALSE(Contains(text, "John"));
    REQUIRE_FALSE(Contains(text, "Gender"));
    REQUIRE(Contains(text, "Clinic: North"));
    REQUIRE(Contains(text, kDiagnosisLine));
  }
  SECTION("Outside the page") {
    auto censored = Redact(doc, {{1000, 1000, 50, 50}});
    REQUIRE(censored.AppliedRegions().empty());
    REQUIRE(TextOf(censored.ToBytes()).Text() ==
            ExtractPageText(doc).Text());
  }
  SECTION("Full page") {
    auto censored = Redact(doc, {{0, 0, 612, 792}});
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE(page_text.glyphs.empty());
    REQUIRE_FALSE(page_text.HasRecoverableGlyphs());
  }
  SECTION("Source is not changed") {
    const std::string before = ExtractPageText(doc).Text();
    auto censored = Redact(doc, {{0, 0, 612, 792}});
    REQUIRE(ExtractPageText(doc).Text() == before);
  }
}

TEST_CASE("Image redaction") {
  SECTION("Covered pixels are blacked out") {
    TestPdf params;
    params.images.emplace_back();
    params.pages.push_back(TextLineOp(72, 700, "Sex: M") +
                           ImageOp("/Im1", 50, 500, 100, 100));
    const Document doc(BuildPdf(params), "image");
    // left half of the 2x2 image
    auto bytes = Redact(doc, {{40, 490, 60, 120}}).ToBytes();
    std::unique_ptr<QPDF> holder;
    const auto images = PageImages(bytes, holder);
    REQUIRE(images.size() == 1);
    const std::string data = DecodedData(images[0]);
    REQUIRE(data == std::string("\x00\x80\x00\x80", 4));
  }
  SECTION("Other images are dropped") {
    TestPdf params;
    pdfcensor::test::TestImage mono;
    mono.bits = 1;
    mono.data = std::string(2, '\xFF');
    params.images.push_back(mono);
    params.pages.push_back(TextLineOp(72, 700, "Sex: M") +
                           ImageOp("/Im1", 50, 500, 100, 100));
    const Document doc(BuildPdf(params), "mono");
    auto bytes = Redact(doc, {{60, 510, 10, 10}}).ToBytes();
    std::unique_ptr<QPDF> holder;
    REQUIRE(PageImages(bytes, holder).empty());
  }
  SECTION("Untouched images stay") {
    TestPdf params;
    params.images.emplace_back();
    params.pages.push_back(TextLineOp(72, 700, "Sex: M") +
                           ImageOp("/Im1", 50, 500, 100, 100));
    const Document doc(BuildPdf(params), "image");
    auto bytes = Redact(doc, {{300, 300, 10, 10}}).ToBytes();
    std::unique_ptr<QPDF> holder;
    const auto images = PageImages(bytes, holder);
    REQUIRE(images.size() == 1);
    REQUIRE(DecodedData(images[0]) == std::string(4, '\x80'));
  }
  SECTION("Inline image is dropped") {
    const std::string content =
      TextLineOp(72, 700, "Sex: M") +
      "q\n100 0 0 100 50 500 cm\nBI /W 1 /H 1 /CS /G /BPC 8 ID \x7f EI\nQ\n";
    const Document doc(BuildSinglePage(content), "inline");
    auto censored = Redact(doc, {{60, 510, 10, 10}});
    const auto page = censored.GetPage();
    for (const auto &op : pdfcensor::pdf::ParseContentOps(
           page.getKey("/Contents"))) {
      REQUIRE_FALSE(op.IsInlineImage());
    }
  }
}

TEST_CASE("Annotations") {
  TestPdf params;
  params.pages.push_back(ReportContent());
  params.annot_rects = {"[70 690 200 715]", "[300 100 400 120]"};
  const Document doc(BuildPdf(params), "annots");
  auto censored = Redact(doc, {{0, 690, 250, 30}});
  const auto page = censored.GetPage();
  REQUIRE(page.getKey("/Annots").getArrayNItems() == 1);
  auto fields =
    censored.GetQPDF().getRoot().getKey("/AcroForm").getKey("/Fields");
  REQUIRE(fields.getArrayNItems() == 1);
}

TEST_CASE("Preserved fields") {
  const Document doc(ReportPdf(), "report");
  const auto fields = ExtractFields(doc, DefaultMatchers());
  // both fields lie inside the region
  const RedactionRegion region{0, 670, 300, 50};
  SECTION("Text") {
    REQUIRE(PreservedText(fields) == "F 34");
    REQUIRE(PreservedText({}).empty());
    REQUIRE(PreservedText({{FieldKind::kAge, "34", {}},
                           {FieldKind::kGender, "Male", {}}}) == "Male 34");
  }
  SECTION("Include info") {
    auto censored =
      ApplyPreservedFields(Redact(doc, {region}), fields, true);
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "Gender"));
    REQUIRE(Contains(page_text.Text(), "F 34"));
    const auto it_f = std::find_if(
      page_text.glyphs.cbegin(), page_text.glyphs.cend(),
      [](const auto &glyph) { return glyph.unicode == "F"; });
    REQUIRE(it_f != page_text.glyphs.cend());
    REQUIRE(it_f->origin.x == Approx(36));
    REQUIRE(it_f->origin.y == Approx(18));
  }
  SECTION("Without info") {
    auto censored =
      ApplyPreservedFields(Redact(doc, {region}), fields, false);
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "34"));
    REQUIRE_FALSE(Contains(page_text.Text(), "F"));
    REQUIRE(ExtractFields(page_text, DefaultMatchers()).empty());
  }
  SECTION("No fields") {
    auto censored = ApplyPreservedFields(Redact(doc, {region}), {}, true);
    REQUIRE_FALSE(Contains(TextOf(censored.ToBytes()).Text(), "34"));
  }
  SECTION("Line moves out of a region") {
    auto censored =
      ApplyPreservedFields(Redact(doc, {{0, 0, 612, 40}}), fields, true);
    const auto page_text = TextOf(censored.ToBytes());
    const auto it_f = std::find_if(
      page_text.glyphs.cbegin(), page_text.glyphs.cend(),
      [](const auto &glyph) { return glyph.unicode == "F"; });
    REQUIRE(it_f != page_text.glyphs.cend());
    REQUIRE(it_f->origin.y == Approx(48));
  }
  SECTION("No free line") {
    auto censored =
      ApplyPreservedFields(Redact(doc, {{0, 0, 612, 792}}), fields, true);
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE(page_text.glyphs.empty());
  }
  SECTION("Bad layout") {
    PreserveLayout layout;
    layout.font_size = 0;
    REQUIRE_THROWS_AS(
      ApplyPreservedFields(Redact(doc, {region}), fields, true, layout),
      std::invalid_argument);
  }
}

TEST_CASE("Metadata") {
  TestPdf params;
  params.pages.push_back(ReportContent());
  params.info = {{"/Title", "Secret Title"},
                 {"/Author", "Secret Author"},
                 {"/Producer", "Secret Producer"},
                 {"/CreationDate", "D:20240101000000Z"},
                 {"/Custom", "Secret Custom"}};
  params.with_metadata = true;
  const Document doc(BuildPdf(params), "metadata");
  SECTION("Scrub") {
    auto censored = Redact(doc, {{0, 0, 10, 10}});
    const auto remaining = ScrubMetadata(censored);
    REQUIRE(remaining.empty());
    auto &qpdf = censored.GetQPDF();
    REQUIRE_FALSE(qpdf.getTrailer().hasKey("/Info"));
    REQUIRE_FALSE(qpdf.getTrailer().hasKey("/ID"));
    REQUIRE_FALSE(qpdf.getRoot().hasKey("/Metadata"));
  }
  SECTION("Page thumbnail") {
    TestPdf thumb_params;
    thumb_params.pages.push_back(ReportContent());
    thumb_params.with_thumb = true;
    const Document thumb_doc(BuildPdf(thumb_params), "thumbnail");
    REQUIRE(thumb_doc.GetPage(0)->hasKey("/Thumb"));
    CensorParams censor_params;
    censor_params.regions = {{0, 690, 300, 30}};
    auto result = CensorDocument(thumb_doc, censor_params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    const Document output(std::get<CensoredDocument>(result).ToBytes(),
                          "output");
    REQUIRE_FALSE(output.GetPage(0)->hasKey("/Thumb"));
    // the source keeps it
    REQUIRE(thumb_doc.GetPage(0)->hasKey("/Thumb"));
  }
  SECTION("Trapped stays") {
    auto censored = Redact(doc, {{0, 0, 10, 10}});
    auto info = censored.GetQPDF().getTrailer().getKey("/Info");
    info.replaceKey("/Trapped", QPDFObjectHandle::newName("/False"));
    const auto remaining = ScrubMetadata(censored);
    REQUIRE(remaining.size() == 1);
    REQUIRE(remaining.at("/Trapped") == "/False");
  }
  SECTION("Nothing left in the output") {
    CensorParams censor_params;
    censor_params.regions = {{0, 690, 300, 30}};
    auto result = CensorDocument(doc, censor_params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    const auto bytes = std::get<CensoredDocument>(result).ToBytes();
    const std::string raw(bytes.cbegin(), bytes.cend());
    REQUIRE_FALSE(Contains(raw, "Secret"));
    REQUIRE_FALSE(Contains(raw, "D:2024"));
    const Document output(bytes, "output");
    REQUIRE_FALSE(output.getQPDF()->getTrailer().hasKey("/Info"));
    REQUIRE_FALSE(output.getQPDF()->getRoot().hasKey("/Metadata"));
  }
}

TEST_CASE("Censor pipeline") {
  CensorParams params;
  params.regions = {{0, 670, 300, 50}};
  SECTION("Eligible") {
    const Document doc(ReportPdf(), "report");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    const auto page_text =
      TextOf(std::get<CensoredDocument>(result).ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "John"));
    REQUIRE(Contains(page_text.Text(), "F 34"));
  }
  SECTION("No info") {
    params.include_info = false;
    const Document doc(ReportPdf(), "report");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    const auto page_text =
      TextOf(std::get<CensoredDocument>(result).ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "34"));
  }
  SECTION("Multi page is rejected") {
    TestPdf three;
    three.pages = {ReportContent(), ReportContent(), ReportContent()};
    const Document doc(BuildPdf(three), "three pages");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<Rejection>(result));
    REQUIRE(std::get<Rejection>(result).verdict == Verdict::kFailedMultiPage);
    REQUIRE(std::get<Rejection>(result).reason == kReasonMultiPage);
  }
  SECTION("Scanned is rejected") {
    const Document doc(BuildSinglePage(""), "empty");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<Rejection>(result));
    REQUIRE(std::get<Rejection>(result).reason == kReasonNoText);
  }
  SECTION("Full page region") {
    params.regions = {{0, 0, 612, 792}};
    const Document doc(ReportPdf(), "report");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    const auto page_text =
      TextOf(std::get<CensoredDocument>(result).ToBytes());
    REQUIRE(page_text.glyphs.empty());
  }
  SECTION("Invalid region") {
    params.regions.push_back({0, 0, 0, 0});
    const Document doc(ReportPdf(), "report");
    REQUIRE_THROWS_AS(CensorDocument(doc, params, nullptr),
                      std::invalid_argument);
  }
}

TEST_CASE("Region template") {
  SECTION("Regions of a letter page") {
    const pdfcensor::pdf::BBox letter{{0, 0}, {612, 792}};
    const auto regions = TemplateRegions(DefaultTemplate(), letter);
    REQUIRE(regions.size() == 3);
    REQUIRE(regions[0].x == Approx(39.2821));
    REQUIRE(regions[0].y == Approx(792 - 612 + 7.81606));
    REQUIRE(regions[0].width == Approx(95.3558 - 39.2821));
    REQUIRE(regions[0].height == Approx(107.861 - 7.81606));
    REQUIRE_NOTHROW(ValidateRegions(regions));
  }
  SECTION("MediaBox origin") {
    const pdfcensor::pdf::BBox shifted{{100, 50}, {300, 250}};
    const auto regions = TemplateRegions({{10, 20, 30, 60}}, shifted);
    REQUIRE(regions.size() == 1);
    REQUIRE(regions[0].x == Approx(110));
    // the band lies 140..180 below the top edge
    REQUIRE(regions[0].y == Approx(70));
    REQUIRE(regions[0].height == Approx(40));
  }
  SECTION("Empty rectangle") {
    const pdfcensor::pdf::BBox letter{{0, 0}, {612, 792}};
    REQUIRE_THROWS_AS(TemplateRegions({{10, 20, 10, 60}}, letter),
                      std::invalid_argument);
  }
  SECTION("Pipeline without regions") {
    CensorParams params;
    params.use_default_template = true;
    const Document doc(BuildSinglePage(TextLineOp(50, 220, "Secret") +
                                       TextLineOp(300, 500, "Keep")),
                       "template");
    auto result = CensorDocument(doc, params, nullptr);
    REQUIRE(std::holds_alternative<CensoredDocument>(result));
    auto &censored = std::get<CensoredDocument>(result);
    // the third template band is above a letter page
    REQUIRE(censored.AppliedRegions().size() == 2);
    const auto page_text = TextOf(censored.ToBytes());
    REQUIRE_FALSE(Contains(page_text.Text(), "Secret"));
    REQUIRE(Contains(page_text.Text(), "Keep"));
  }
}

TEST_CASE("Write censored document") {
  const Document doc(ReportPdf(), "report");
  const std::string path = std::string(TEST_DIR) + "censored_write.pdf";
  SECTION("Write") {
    auto censored = Redact(doc, {{0, 690, 300, 30}});
    censored.WriteTo(path);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path + ".part"));
    const Document written(path);
    REQUIRE(written.GetPagesCount() == 1);
    std::filesystem::remove(path);
  }
  SECTION("Missing directory") {
    auto censored = Redact(doc, {{0, 690, 300, 30}});
    const std::string bad_path =
      std::string(TEST_DIR) + "no_such_dir/censored.pdf";
    REQUIRE_THROWS(censored.WriteTo(bad_path));
    REQUIRE_FALSE(std::filesystem::exists(bad_path));
  }
}

TEST_CASE("Configuration") {
  SECTION("Full") {
    const auto config = ParseConfig(R"json({
      "regions": [{"x": 0, "y": 600, "width": 300, "height": 192},
                  [300, 0, 312.5, 100]],
      "include_info": false,
      "preserve": {"x": 50, "y": 30, "font_size": 8},
      "patterns": {"gender": [{"pattern": "Geschlecht: (w|m)", "group": 1}],
                   "age": [{"pattern": "ALTER (\\d+)", "group": 1,
                            "ignore_case": true}]},
      "jobs": 4
    })json");
    REQUIRE(config.params.regions.size() == 2);
    REQUIRE(config.params.regions[1].width == Approx(312.5));
    REQUIRE_FALSE(config.params.include_info);
    REQUIRE(config.params.layout.x == Approx(50));
    REQUIRE(config.params.layout.font_size == Approx(8));
    REQUIRE(config.jobs == 4U);
    REQUIRE(ParseConfig(R"({"default_template": true})")
              .params.use_default_template);
    const auto &gender = *config.params.matchers.at(FieldKind::kGender);
    REQUIRE(gender.FindFirst("Geschlecht: w")->value == "w");
    REQUIRE_FALSE(gender.FindFirst("Gender: F"));
    const auto &age = *config.params.matchers.at(FieldKind::kAge);
    REQUIRE(age.FindFirst("alter 40")->value == "40");
  }
  SECTION("Defaults") {
    const auto config = ParseConfig("{}");
    REQUIRE(config.params.regions.empty());
    REQUIRE_FALSE(config.params.use_default_template);
    REQUIRE(config.params.include_info);
    REQUIRE_FALSE(config.jobs);
    REQUIRE(config.params.matchers.size() == 2);
  }
  SECTION("Errors") {
    REQUIRE_THROWS_AS(ParseConfig("{"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig("[]"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"({"regions": [[1, 2, 3]]})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"({"regions": [[1, 2, 0, 3]]})"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ParseConfig(R"({"regions": [{"x": 1, "y": 2}]})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"({"include_info": "yes"})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"({"jobs": 0})"), std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"({"preserve": {"font_size": -1}})"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(ParseConfig(R"json({"patterns": {"age": [
                        {"pattern": "(\\d+)", "group": 1e30}]}})json"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ParseConfig(R"json({"patterns": {"age": [
                        {"pattern": "(\\d+)", "group": 1.5}]}})json"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(
      ParseConfig(R"({"patterns": {"age": [{"pattern": "(unclosed"}]}})"),
      std::invalid_argument);
    REQUIRE_THROWS_AS(LoadConfig("/var/sadl/config.json"),
                      std::runtime_error);
  }
}
