/**
 * autotag-cli: categorize candidate file(s) against an annotation corpus; print JSON results.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/autotag_cli --corpus corpus.json [--categories categories.json]
 *                           (--input <path> ... | --content <candidate.json>)
 */

#include <autotag/app/analysis_runner.hpp>
#include <autotag/app/config.hpp>
#include <autotag/app/content_extractor.hpp>
#include <autotag/app/corpus_reader.hpp>
#include <autotag/app/engine_builder.hpp>
#include <autotag/app/json_codec.hpp>
#include <autotag/core/candidate.hpp>
#include <autotag/core/engine.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/json_flatten.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace aa = autotag::app;
namespace ac = autotag::core;

void print_usage() {
  std::cout << "Usage: autotag_cli --corpus <path> [options] (--input <path> ... | --content <path>)\n"
            << "  --config <path>      Engine config (key=value file); default: built-in\n"
            << "  --corpus <path>      Annotation corpus (JSON array of records)\n"
            << "  --categories <path>  Category directory (JSON array of {id, name})\n"
            << "  --input <path>       Candidate file; repeat for a batch\n"
            << "  --type <type>        Force file type: image | pdf | json | audio\n"
            << "  --file-id <id>       Id copied to the result (single --input only)\n"
            << "  --content <path>     Pre-extracted candidate content (JSON description)\n"
            << "  --timing             Log per-phase timings\n"
            << "  --verbose            Debug logging (overrides log_level)\n";
}

/// Analyses a pre-extracted candidate description.
aa::AnalysisOutcome analyze_content_file(const ac::Engine& engine,
                                         const std::string& path,
                                         const std::vector<ac::AnnotationRecord>& corpus,
                                         const ac::CategoryDirectory& directory,
                                         ac::PhaseTimingCallback* timing_cb) {
  auto text = aa::read_text_file(path);
  if (!text) return std::unexpected(text.error());
  auto doc = autotag::match::parse_json_document(*text);
  if (!doc) return std::unexpected(doc.error());
  const std::string base_dir = std::filesystem::path(path).parent_path().string();
  auto content = aa::parse_candidate_content(*doc, base_dir);
  if (!content) return std::unexpected(content.error());
  auto result =
      engine.analyze(ac::content_file_type(*content), *content, corpus, directory, timing_cb);
  if (result) {
    if (const auto it = doc->find("file_id"); it != doc->end() && it->is_string()) {
      result->file_id = it->get<std::string>();
    }
  }
  return result;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string corpus_path;
  std::string categories_path;
  std::string content_path;
  std::string type_override;
  std::string file_id;
  std::vector<std::string> inputs;
  bool verbose = false;
  bool timing = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--corpus" && i + 1 < argc) {
      corpus_path = argv[++i];
    } else if (arg == "--categories" && i + 1 < argc) {
      categories_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--type" && i + 1 < argc) {
      type_override = argv[++i];
    } else if (arg == "--file-id" && i + 1 < argc) {
      file_id = argv[++i];
    } else if (arg == "--content" && i + 1 < argc) {
      content_path = argv[++i];
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (corpus_path.empty() || (inputs.empty() == content_path.empty())) {
    std::cerr << "Need --corpus and exactly one of --input or --content\n";
    print_usage();
    return 1;
  }

  aa::EngineConfig cfg = aa::default_config();
  if (!config_path.empty()) {
    auto loaded = aa::load_config(config_path);
    if (!loaded) {
      std::cerr << "Config error (" << config_path << "): " << ac::error_name(loaded.error())
                << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!ac::set_log_level(verbose ? "debug" : cfg.log_level)) {
    std::cerr << "Unknown log_level " << cfg.log_level << "\n";
    return 1;
  }

  ac::FileType forced_type = ac::FileType::Unknown;
  if (!type_override.empty()) {
    forced_type = ac::file_type_from_name(type_override);
    if (forced_type == ac::FileType::Unknown) {
      std::cerr << "Unknown --type " << type_override << " (use image, pdf, json, or audio)\n";
      return 1;
    }
  }

  aa::JsonCorpusReader corpus_reader(corpus_path);
  auto corpus = corpus_reader.read_all();
  if (!corpus) {
    std::cerr << "Corpus error (" << corpus_path << "): " << ac::error_name(corpus.error())
              << "\n";
    return 1;
  }
  ac::CategoryDirectory directory;
  if (!categories_path.empty()) {
    auto loaded = aa::load_category_directory(categories_path);
    if (!loaded) {
      std::cerr << "Categories error (" << categories_path
                << "): " << ac::error_name(loaded.error()) << "\n";
      return 1;
    }
    directory = std::move(*loaded);
  }

  std::optional<ac::Engine> engine;
  try {
    engine.emplace(aa::build_engine(cfg, aa::make_region_detector(cfg)));
  } catch (const std::exception& e) {
    std::cerr << "Engine setup failed: " << e.what() << "\n";
    return 1;
  }

  ac::PhaseTimingCallback timing_cb = [](std::string_view phase, double ms) {
    ac::logger()->info("phase {} took {:.3f} ms", phase, ms);
  };
  ac::PhaseTimingCallback* timing_ptr = timing ? &timing_cb : nullptr;

  if (!content_path.empty()) {
    auto result = analyze_content_file(*engine, content_path, *corpus, directory, timing_ptr);
    if (!result) {
      std::cerr << "Analysis error: " << ac::error_name(result.error()) << "\n";
      return 1;
    }
    std::cout << aa::result_to_json(*result).dump(2) << "\n";
    return 0;
  }

  aa::LocalContentExtractor extractor;
  if (inputs.size() == 1) {
    const aa::SourceFile source{inputs.front(), forced_type, file_id};
    auto result = aa::run_analysis(*engine, extractor, source, *corpus, directory, timing_ptr);
    if (!result) {
      std::cerr << "Analysis error: " << ac::error_name(result.error()) << "\n";
      return 1;
    }
    std::cout << aa::result_to_json(*result).dump(2) << "\n";
    return 0;
  }

  std::vector<aa::SourceFile> sources;
  sources.reserve(inputs.size());
  for (const auto& path : inputs) {
    sources.push_back({path, forced_type, std::filesystem::path(path).filename().string()});
  }

  // Results are written by index so the output keeps input order.
  std::vector<nlohmann::ordered_json> slots(sources.size());
  std::mutex slots_mutex;
  bool any_failed = false;
  aa::run_analysis_batch_parallel(
      *engine, extractor, sources, *corpus, directory,
      [&](const aa::SourceFile& source, const aa::AnalysisOutcome& outcome) {
        nlohmann::ordered_json entry;
        if (outcome) {
          entry = aa::result_to_json(*outcome);
        } else {
          entry = {{"file_id", source.file_id},
                   {"error", std::string(ac::error_name(outcome.error()))}};
        }
        std::lock_guard lock(slots_mutex);
        const auto idx = static_cast<std::size_t>(&source - sources.data());
        slots[idx] = std::move(entry);
        if (!outcome) any_failed = true;
      },
      cfg.num_workers);

  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (auto& s : slots) out.push_back(std::move(s));
  std::cout << out.dump(2) << "\n";
  return any_failed ? 1 : 0;
}
