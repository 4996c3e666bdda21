#include <autotag/app/content_extractor.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <variant>

namespace aa = autotag::app;
namespace ac = autotag::core;
namespace fs = std::filesystem;

namespace {

const std::string kDataDir = AUTOTAG_TEST_DATA_DIR;

class TempFile {
 public:
  TempFile(const std::string& name, const std::string& contents)
      : path_(fs::temp_directory_path() / name) {
    std::ofstream(path_, std::ios::binary) << contents;
  }
  ~TempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  [[nodiscard]] std::string path() const { return path_.string(); }

 private:
  fs::path path_;
};

class ScriptedProvider : public aa::IExtractionProvider {
 public:
  std::expected<std::string, ac::EngineError> pdf_text(const std::string& /*path*/) override {
    return std::string("Provider text\fsecond page");
  }
  std::expected<std::vector<ac::TranscriptWord>, ac::EngineError> transcribe(
      const std::string& /*path*/) override {
    return std::unexpected(ac::EngineError::ExtractionFailed);
  }
};

}  // namespace

TEST(LocalContentExtractor, PdfTextFromSidecar) {
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({kDataDir + "/invoice.pdf"});
  ASSERT_TRUE(content.has_value());
  const auto* pdf = std::get_if<ac::PdfContent>(&*content);
  ASSERT_NE(pdf, nullptr);
  EXPECT_NE(pdf->extracted_text.find("Invoice Number: 12345"), std::string::npos);
}

TEST(LocalContentExtractor, PdfWithoutTextIsEmptyContent) {
  TempFile pdf("autotag_extractor_no_sidecar.pdf", "%PDF-1.4\n");
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({pdf.path()});
  ASSERT_TRUE(content.has_value());
  const auto* p = std::get_if<ac::PdfContent>(&*content);
  ASSERT_NE(p, nullptr);
  EXPECT_TRUE(p->extracted_text.empty());
  EXPECT_TRUE(p->pages.empty());
}

TEST(LocalContentExtractor, JsonIsFlattened) {
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({kDataDir + "/shipment.json"});
  ASSERT_TRUE(content.has_value());
  const auto& pairs = std::get<ac::JsonContent>(*content).pairs;
  EXPECT_NE(std::find(pairs.begin(), pairs.end(), ac::KeyValue{"carrier", "DHL"}), pairs.end());
  EXPECT_NE(std::find(pairs.begin(), pairs.end(), ac::KeyValue{"order.status", "in transit"}),
            pairs.end());
}

TEST(LocalContentExtractor, InvalidJsonIsUnavailable) {
  TempFile bad("autotag_extractor_bad.json", "{\"carrier\": ");
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({bad.path()});
  ASSERT_FALSE(content.has_value());
  EXPECT_EQ(content.error(), ac::EngineError::ContentUnavailable);
}

TEST(LocalContentExtractor, AudioWordsFromSidecar) {
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({kDataDir + "/call.wav"});
  ASSERT_TRUE(content.has_value());
  const auto& words = std::get<ac::AudioContent>(*content).words;
  ASSERT_EQ(words.size(), 5u);
  EXPECT_EQ(words[2].word, "refund");
  EXPECT_DOUBLE_EQ(words[2].start_time, 1.0);
}

TEST(LocalContentExtractor, MissingFileAndUnknownType) {
  aa::LocalContentExtractor extractor;
  auto missing = extractor.extract({kDataDir + "/nothing_here.pdf"});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ac::EngineError::ContentUnavailable);

  auto unknown = extractor.extract({kDataDir + "/engine.conf"});
  ASSERT_FALSE(unknown.has_value());
  EXPECT_EQ(unknown.error(), ac::EngineError::UnsupportedFileType);
}

TEST(LocalContentExtractor, UndecodableImageIsUnavailable) {
  TempFile image("autotag_extractor_garbage.png", "definitely not a png");
  aa::LocalContentExtractor extractor;
  auto content = extractor.extract({image.path()});
  ASSERT_FALSE(content.has_value());
  EXPECT_EQ(content.error(), ac::EngineError::ContentUnavailable);
}

TEST(LocalContentExtractor, ProviderTakesPrecedenceAndFailuresDegrade) {
  aa::LocalContentExtractor extractor(std::make_shared<ScriptedProvider>());

  auto pdf = extractor.extract({kDataDir + "/invoice.pdf"});
  ASSERT_TRUE(pdf.has_value());
  EXPECT_EQ(std::get<ac::PdfContent>(*pdf).pages.size(), 2u);
  EXPECT_EQ(std::get<ac::PdfContent>(*pdf).extracted_text, "Provider text second page");

  // Transcription fails; the sidecar still supplies the words.
  auto audio = extractor.extract({kDataDir + "/call.wav"});
  ASSERT_TRUE(audio.has_value());
  EXPECT_EQ(std::get<ac::AudioContent>(*audio).words.size(), 5u);
}

TEST(ReadTextFile, ReadsWholeFile) {
  TempFile f("autotag_read_text.txt", "line one\nline two\n");
  auto text = aa::read_text_file(f.path());
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(*text, "line one\nline two\n");
  EXPECT_FALSE(aa::read_text_file(f.path() + ".missing").has_value());
}
