#pragma once

#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <autotag/vision/detection_decoder.hpp>
#include <autotag/vision/region_detector.hpp>
#include <array>
#include <memory>
#include <string>

namespace autotag::vision {

/// ONNX Runtime object/logo detector implementing IRegionDetector.
///
/// Expected model: detection model with one input (float RGB image, values in [0,1]) and either:
/// - **Three outputs**: boxes [1,N,4] or [N,4], scores [1,N], class_ids [1,N] (SSD style),
/// - **One output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per detection.
///
/// Regions of any size and pixel format are resized to the model input and converted to
/// RGB float; NCHW models receive a transposed copy. Construction throws std::runtime_error
/// (or Ort::Exception) when the model cannot be loaded or has an unsupported layout.
/// detect() is serialised internally, so one instance can be shared by scan workers.
class OnnxRegionDetector : public IRegionDetector {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param decoder Class labels and score threshold applied to the raw output.
  /// \param input_name Optional input tensor name; if empty, the first input is used.
  /// \param output_names Optional {boxes, scores, class_ids}; if any empty, the first three
  ///        outputs are used in order.
  OnnxRegionDetector(std::string model_path,
                     DetectionDecoder decoder,
                     std::string input_name = {},
                     std::array<std::string, 3> output_names = {});

  ~OnnxRegionDetector() override;

  OnnxRegionDetector(const OnnxRegionDetector&) = delete;
  OnnxRegionDetector& operator=(const OnnxRegionDetector&) = delete;

  [[nodiscard]] std::expected<RegionDetection, autotag::core::EngineError> detect(
      const autotag::core::Image& region) override;

  /// Raw model output for a region, before decoding.
  [[nodiscard]] std::expected<RawDetections, autotag::core::EngineError> infer(
      const autotag::core::Image& region);

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace autotag::vision
