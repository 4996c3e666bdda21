#include <autotag/core/analysis_result.hpp>
#include <autotag/core/annotation.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/error.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string_view>
#include <variant>

namespace ac = autotag::core;

TEST(CategoryDirectory, ResolvesNameThenIdThenUnknown) {
  ac::CategoryDirectory dir({{"c1", "Finance"}, {"c2", "Legal"}});
  EXPECT_EQ(dir.size(), 2u);
  EXPECT_EQ(dir.resolve({"r1", "c1"}), "Finance");
  EXPECT_EQ(dir.resolve({"r2", "c9"}), "c9");
  EXPECT_EQ(dir.resolve({"r3", ""}), "unknown");
}

TEST(CategoryDirectory, AddReplacesAndIgnoresEmptyId) {
  ac::CategoryDirectory dir;
  dir.add({"c1", "Old"});
  dir.add({"c1", "New"});
  dir.add({"", "Nameless"});
  EXPECT_EQ(dir.size(), 1u);
  EXPECT_EQ(dir.find_name("c1"), "New");
  EXPECT_FALSE(dir.find_name("missing").has_value());
}

TEST(AnnotationPattern, KindIdAndLabel) {
  ac::AnnotationPattern p = ac::PdfPattern{"a1", "invoice", "Invoice Number", 2};
  EXPECT_EQ(ac::pattern_kind(p), ac::PatternKind::Pdf);
  EXPECT_EQ(ac::pattern_id(p), "a1");
  EXPECT_EQ(ac::pattern_label(p), "invoice");

  p = ac::VisualPattern{"v1", "logo", {0, 0, 10, 10}};
  EXPECT_EQ(ac::pattern_kind(p), ac::PatternKind::Visual);
  EXPECT_EQ(ac::pattern_kind_name(ac::PatternKind::AudioSegment), "audio_segment");
}

TEST(FileType, FromPathAndName) {
  EXPECT_EQ(ac::file_type_from_path("scan.PNG"), ac::FileType::Image);
  EXPECT_EQ(ac::file_type_from_path("/tmp/report.pdf"), ac::FileType::Pdf);
  EXPECT_EQ(ac::file_type_from_path("data.json"), ac::FileType::Json);
  EXPECT_EQ(ac::file_type_from_path("call.mp3"), ac::FileType::Audio);
  EXPECT_EQ(ac::file_type_from_path("notes"), ac::FileType::Unknown);
  EXPECT_EQ(ac::file_type_from_name("PDF"), ac::FileType::Pdf);
  EXPECT_EQ(ac::file_type_from_name("video"), ac::FileType::Unknown);
}

TEST(FileType, MatchingIsCaseInsensitiveOnWholeWord) {
  static_assert(noexcept(ac::file_type_from_path(std::string_view{})));
  static_assert(noexcept(ac::file_type_from_name(std::string_view{})));
  EXPECT_EQ(ac::file_type_from_path("Photo.JpEg"), ac::FileType::Image);
  EXPECT_EQ(ac::file_type_from_path("Archive.TIFF"), ac::FileType::Image);
  EXPECT_EQ(ac::file_type_from_path("report.pdfx"), ac::FileType::Unknown);
  EXPECT_EQ(ac::file_type_from_path("movie.tif.bak"), ac::FileType::Unknown);
  EXPECT_EQ(ac::file_type_from_name("Audio"), ac::FileType::Audio);
  EXPECT_EQ(ac::file_type_from_name("jso"), ac::FileType::Unknown);
  EXPECT_EQ(ac::file_type_from_name("images"), ac::FileType::Unknown);
  EXPECT_EQ(ac::file_type_from_name(""), ac::FileType::Unknown);
}

TEST(CandidateContent, EmptyContentMatchesType) {
  EXPECT_EQ(ac::content_file_type(ac::empty_content(ac::FileType::Json)), ac::FileType::Json);
  EXPECT_EQ(ac::content_file_type(ac::empty_content(ac::FileType::Audio)), ac::FileType::Audio);
  EXPECT_TRUE(std::holds_alternative<std::monostate>(ac::empty_content(ac::FileType::Unknown)));
}

TEST(AnalysisResult, ClampConfidence) {
  EXPECT_DOUBLE_EQ(ac::clamp_confidence(1.7), 1.0);
  EXPECT_DOUBLE_EQ(ac::clamp_confidence(-0.2), 0.0);
  EXPECT_DOUBLE_EQ(ac::clamp_confidence(0.42), 0.42);
  EXPECT_DOUBLE_EQ(ac::clamp_confidence(std::numeric_limits<double>::quiet_NaN()), 0.0);
}

TEST(AnalysisResult, DefaultsToUncategorized) {
  ac::AnalysisResult r;
  EXPECT_EQ(r.category, "uncategorized");
  EXPECT_DOUBLE_EQ(r.confidence, 0.0);
  EXPECT_TRUE(r.matches.empty());
}

TEST(EngineError, Names) {
  EXPECT_EQ(ac::error_name(ac::EngineError::ContentUnavailable), "ContentUnavailable");
  EXPECT_EQ(ac::error_name(ac::EngineError::UnsupportedFileType), "UnsupportedFileType");
}
