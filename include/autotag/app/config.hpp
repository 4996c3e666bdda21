#pragma once

#include <autotag/core/aggregator.hpp>
#include <autotag/core/error.hpp>
#include <cstddef>
#include <expected>
#include <istream>
#include <string>

namespace autotag::app {

/// Region detector used by the image matcher for visual patterns.
enum class RegionDetectorType {
  None,  // image features only
  Onnx,  // ONNX Runtime model (needs detector_model_path)
};

/// Engine configuration: scan parallelism, thresholds, detector and logging.
struct EngineConfig {
  std::size_t num_workers{0};  // 0 = hardware concurrency
  bool use_tbb{false};
  autotag::core::ConfidencePolicy confidence_policy{autotag::core::ConfidencePolicy::GlobalMax};
  double pdf_acceptance_threshold{0.1};
  double similar_image_threshold{0.7};
  RegionDetectorType detector_type{RegionDetectorType::None};
  std::string detector_model_path;
  std::string detector_labels_path;
  float detector_confidence_threshold{0.5f};
  std::string log_level{"info"};
};

/// Default config when no file is provided.
EngineConfig default_config();

/// Parses key=value lines ('#' comments, blank lines ignored) over the defaults.
/// Unknown keys are logged and ignored. Errors: InvalidConfig for an unreadable value.
[[nodiscard]] std::expected<EngineConfig, autotag::core::EngineError> parse_config(std::istream& in);

/// Loads a config file. Errors: ContentUnavailable when the file cannot be opened,
/// InvalidConfig for an unreadable value.
[[nodiscard]] std::expected<EngineConfig, autotag::core::EngineError> load_config(
    const std::string& path);

}  // namespace autotag::app
