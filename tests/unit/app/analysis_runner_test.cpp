#include <autotag/app/analysis_runner.hpp>
#include <autotag/app/engine_builder.hpp>
#include <autotag/app/mock_content_extractor.hpp>
#include <autotag/match/pdf_keyword_matcher.hpp>
#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include <string>

namespace aa = autotag::app;
namespace ac = autotag::core;

namespace {

const std::string kDataDir = AUTOTAG_TEST_DATA_DIR;

std::vector<ac::AnnotationRecord> finance_corpus() {
  ac::AnnotationRecord r;
  r.data_id = "d1";
  r.rule = {"r1", "fin"};
  r.annotations = {ac::PdfPattern{"a1", "kw", "Invoice Number", std::nullopt}};
  r.type = "pdf";
  return {r};
}

}  // namespace

TEST(AnalysisRunner, AnalysesAndTagsFileId) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  extractor.set_content(autotag::match::make_pdf_content("Invoice Number: 12345"));
  const ac::CategoryDirectory dir(std::vector<ac::Category>{{"fin", "Finance"}});

  std::vector<std::string> phases;
  ac::PhaseTimingCallback timing = [&phases](std::string_view phase, double ms) {
    phases.emplace_back(phase);
    EXPECT_GE(ms, 0.0);
  };
  auto result = aa::run_analysis(engine, extractor, {kDataDir + "/invoice.pdf", ac::FileType::Unknown, "file-1"},
                                 finance_corpus(), dir, &timing);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->category, "Finance");
  EXPECT_EQ(result->file_id, "file-1");
  EXPECT_EQ(extractor.calls(), 1u);
  EXPECT_EQ(phases, (std::vector<std::string>{"match", "aggregate"}));

  auto untagged = aa::run_analysis(engine, extractor, {kDataDir + "/invoice.pdf"},
                                   finance_corpus(), dir);
  ASSERT_TRUE(untagged.has_value());
  EXPECT_FALSE(untagged->file_id.has_value());
}

TEST(AnalysisRunner, MissingFileIsNotExtracted) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  auto result = aa::run_analysis(engine, extractor, {kDataDir + "/missing.pdf"},
                                 finance_corpus(), {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ac::EngineError::ContentUnavailable);
  EXPECT_EQ(extractor.calls(), 0u);
}

TEST(AnalysisRunner, UnknownExtensionIsUnsupported) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  auto result = aa::run_analysis(engine, extractor, {kDataDir + "/engine.conf"},
                                 finance_corpus(), {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ac::EngineError::UnsupportedFileType);

  // An explicit type overrides the extension.
  extractor.set_content(autotag::match::make_pdf_content("nothing relevant"));
  auto forced = aa::run_analysis(engine, extractor,
                                 {kDataDir + "/engine.conf", ac::FileType::Pdf},
                                 finance_corpus(), {});
  ASSERT_TRUE(forced.has_value());
  EXPECT_EQ(forced->category, "uncategorized");
}

TEST(AnalysisRunner, ExtractorFailurePropagates) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  extractor.set_failure(ac::EngineError::ExtractionFailed);
  auto result = aa::run_analysis(engine, extractor, {kDataDir + "/invoice.pdf"},
                                 finance_corpus(), {});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), ac::EngineError::ExtractionFailed);
}

TEST(AnalysisRunner, EmptyContentIsUncategorized) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  extractor.set_content(std::monostate{});
  auto result = aa::run_analysis(engine, extractor, {kDataDir + "/invoice.pdf"},
                                 finance_corpus(), {});
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->category, "uncategorized");
  EXPECT_DOUBLE_EQ(result->confidence, 0.0);
}

TEST(AnalysisRunner, SequentialBatchKeepsOrder) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  extractor.set_content(autotag::match::make_pdf_content("Invoice Number: 1"));
  const std::vector<aa::SourceFile> sources{{kDataDir + "/invoice.pdf", ac::FileType::Unknown, "a"},
                                            {kDataDir + "/missing.pdf", ac::FileType::Unknown, "b"},
                                            {kDataDir + "/invoice.pdf", ac::FileType::Unknown, "c"}};
  std::vector<std::string> order;
  std::size_t failures = 0;
  aa::run_analysis_batch(engine, extractor, sources, finance_corpus(), {},
                         [&](const aa::SourceFile& source, const aa::AnalysisOutcome& outcome) {
                           order.push_back(source.file_id);
                           if (!outcome) ++failures;
                         });
  EXPECT_EQ(order, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(failures, 1u);
}

TEST(AnalysisRunner, ParallelBatchVisitsEveryFile) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  extractor.set_content(autotag::match::make_pdf_content("Invoice Number: 1"));

  std::vector<aa::SourceFile> sources;
  for (int i = 0; i < 24; ++i) {
    sources.push_back({kDataDir + "/invoice.pdf", ac::FileType::Pdf, "f" + std::to_string(i)});
  }
  sources.push_back({kDataDir + "/missing.pdf", ac::FileType::Pdf, "gone"});

  std::mutex mutex;
  std::map<std::string, std::string> categories;
  std::size_t failures = 0;
  aa::run_analysis_batch_parallel(
      engine, extractor, sources, finance_corpus(), ac::CategoryDirectory(std::vector<ac::Category>{{"fin", "Finance"}}),
      [&](const aa::SourceFile& source, const aa::AnalysisOutcome& outcome) {
        std::lock_guard lock(mutex);
        if (outcome) {
          categories[source.file_id] = outcome->category;
          EXPECT_EQ(outcome->file_id, source.file_id);
        } else {
          ++failures;
          EXPECT_EQ(source.file_id, "gone");
        }
      },
      4);

  EXPECT_EQ(categories.size(), 24u);
  EXPECT_EQ(failures, 1u);
  for (const auto& [id, category] : categories) {
    EXPECT_EQ(category, "Finance") << id;
  }
  EXPECT_EQ(extractor.calls(), 24u);
}

TEST(AnalysisRunner, ParallelBatchWithNothingToDo) {
  const auto engine = aa::build_engine(aa::default_config());
  aa::MockContentExtractor extractor;
  std::size_t calls = 0;
  aa::run_analysis_batch_parallel(engine, extractor, {}, {}, {},
                                  [&](const aa::SourceFile&, const aa::AnalysisOutcome&) { ++calls; });
  EXPECT_EQ(calls, 0u);
}
