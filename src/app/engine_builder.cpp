#include <autotag/app/engine_builder.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/match/audio_segment_matcher.hpp>
#include <autotag/match/image_region_matcher.hpp>
#include <autotag/match/json_key_value_matcher.hpp>
#include <autotag/match/pdf_keyword_matcher.hpp>
#include <autotag/vision/detection_decoder.hpp>
#ifdef AUTOTAG_HAS_ONNXRUNTIME
#include <autotag/vision/onnx_region_detector.hpp>
#endif

#include <stdexcept>

namespace autotag::app {

namespace ac = autotag::core;
namespace av = autotag::vision;
namespace am = autotag::match;

std::shared_ptr<av::IRegionDetector> make_region_detector(const EngineConfig& config) {
  if (config.detector_type == RegionDetectorType::None) {
    return nullptr;
  }
#ifdef AUTOTAG_HAS_ONNXRUNTIME
  if (config.detector_model_path.empty()) {
    throw std::runtime_error("region_detector=onnx requires detector_model_path to be set in config");
  }
  av::ClassLabelMap labels;
  if (!config.detector_labels_path.empty()) {
    auto loaded = av::load_class_labels(config.detector_labels_path);
    if (!loaded) {
      throw std::runtime_error("cannot read detector labels: " + config.detector_labels_path);
    }
    labels = std::move(*loaded);
  }
  auto detector = std::make_shared<av::OnnxRegionDetector>(
      config.detector_model_path,
      av::DetectionDecoder(config.detector_confidence_threshold, std::move(labels)));
  detector->warmup();
  ac::logger()->info("region detector loaded from '{}' ({}x{})", config.detector_model_path,
                     detector->input_width(), detector->input_height());
  return detector;
#else
  throw std::runtime_error(
      "ONNX region detector not available (build with -DAUTOTAG_USE_ONNXRUNTIME=ON and ONNX Runtime)");
#endif
}

ac::Engine build_engine(const EngineConfig& config,
                        std::shared_ptr<av::IRegionDetector> detector) {
  ac::ScanOptions scan;
  scan.num_workers = config.num_workers;
  scan.use_tbb = config.use_tbb;
#ifndef AUTOTAG_HAS_TBB
  if (scan.use_tbb) {
    ac::logger()->warn("use_tbb=true but built without TBB; using the thread pool");
    scan.use_tbb = false;
  }
#endif

  ac::Engine engine(ac::EvidenceAggregator(config.confidence_policy), scan);
  engine.add_matcher(std::make_unique<am::ImageRegionMatcher>(std::move(detector),
                                                              config.similar_image_threshold));
  engine.add_matcher(std::make_unique<am::PdfKeywordMatcher>(config.pdf_acceptance_threshold));
  engine.add_matcher(std::make_unique<am::JsonKeyValueMatcher>());
  engine.add_matcher(std::make_unique<am::AudioSegmentMatcher>());
  return engine;
}

}  // namespace autotag::app
