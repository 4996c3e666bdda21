#include <autotag/vision/onnx_region_detector.hpp>
#include <autotag/core/error.hpp>
#include <autotag/core/image.hpp>
#include <autotag/core/logging.hpp>
#include <autotag/vision/preprocess.hpp>
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace autotag::vision {

using autotag::core::EngineError;
using autotag::core::Image;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr float kPixelScale = 1.0f / 255.0f;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// RGB8 bytes -> HWC float in [0,1].
void RgbToHwcFloat(const Image& rgb, std::vector<float>& hwc) {
  const auto bytes = rgb.data();
  const std::size_t n = rgb.pixel_count() * kNumChannels;
  hwc.resize(n);
  for (std::size_t i = 0; i < n; ++i) {
    hwc[i] = static_cast<float>(std::to_integer<unsigned>(bytes[i])) * kPixelScale;
  }
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      const std::size_t dst_idx = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst_idx] = hwc[src_idx + 0];
      nchw[1 * hw + dst_idx] = hwc[src_idx + 1];
      nchw[2 * hw + dst_idx] = hwc[src_idx + 2];
    }
  }
}

std::expected<RawDetections, EngineError> ParseSingleOutput(Ort::Value& out) {
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  const float* data = out.GetTensorData<float>();
  int64_t n = -1;
  bool rows_are_n6 = false;  // true: [1, N, 6]; false: [1, 6, N]
  if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
    n = shape[1];
    rows_are_n6 = true;
  } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
    n = shape[2];
  }
  if (n < 0) {
    return std::unexpected(EngineError::ExtractionFailed);
  }

  RawDetections raw;
  raw.num_detections = static_cast<std::uint32_t>(n);
  raw.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  raw.scores.reserve(static_cast<std::size_t>(n));
  raw.class_ids.reserve(static_cast<std::size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    auto at = [&](int64_t field) {
      return rows_are_n6 ? data[i * 6 + field] : data[field * n + i];
    };
    for (int64_t k = 0; k < 4; ++k) raw.boxes.push_back(at(k));
    raw.scores.push_back(at(4));
    raw.class_ids.push_back(static_cast<int64_t>(at(5)));
  }
  return raw;
}

std::expected<RawDetections, EngineError> ParseThreeOutputs(std::vector<Ort::Value>& outputs) {
  if (outputs.size() < 3u) {
    return std::unexpected(EngineError::ExtractionFailed);
  }
  const std::vector<int64_t> boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

  // [1, N, 4], [N, 4] or [1, 4, N].
  int64_t n = -1;
  bool boxes_is_n4 = true;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  } else if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[1] == 4) {
    n = boxes_shape[2];
    boxes_is_n4 = false;
  }
  if (n < 0) {
    return std::unexpected(EngineError::ExtractionFailed);
  }

  const float* boxes_data = outputs[0].GetTensorData<float>();
  const float* scores_data = outputs[1].GetTensorData<float>();
  const int64_t* classes_data = outputs[2].GetTensorData<int64_t>();

  RawDetections raw;
  raw.num_detections = static_cast<std::uint32_t>(n);
  raw.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  raw.scores.reserve(static_cast<std::size_t>(n));
  raw.class_ids.reserve(static_cast<std::size_t>(n));
  for (int64_t i = 0; i < n; ++i) {
    for (int64_t k = 0; k < 4; ++k) {
      raw.boxes.push_back(boxes_is_n4 ? boxes_data[i * 4 + k] : boxes_data[k * n + i]);
    }
    raw.scores.push_back(scores_data[i]);
    raw.class_ids.push_back(classes_data[i]);
  }
  return raw;
}

}  // namespace

struct OnnxRegionDetector::Impl {
  explicit Impl(DetectionDecoder d) : decoder(std::move(d)) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "autotag"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};
  DetectionDecoder decoder;

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  bool use_yolo_single_output{false};

  std::mutex run_mutex;  // guards session runs and the scratch buffers
  std::vector<float> hwc_buffer;
  std::vector<float> nchw_buffer;
};

OnnxRegionDetector::OnnxRegionDetector(std::string model_path,
                                       DetectionDecoder decoder,
                                       std::string input_name,
                                       std::array<std::string, 3> output_names)
    : impl_(std::make_unique<Impl>(std::move(decoder))) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxRegionDetector: model has no inputs");
  }
  impl_->input_name = input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : std::move(input_name);

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const std::vector<int64_t> dims = input_type.GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxRegionDetector: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxRegionDetector: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[1] <= 0 || dims[2] <= 0 || dims[3] <= 0) {
    throw std::runtime_error("OnnxRegionDetector: dynamic input dimensions are not supported");
  }

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->use_yolo_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      impl_->output_names[i] = output_names[i].empty()
                                   ? std::string(impl_->session.GetOutputNameAllocated(i, allocator).get())
                                   : output_names[i];
    }
    for (const auto& name : impl_->output_names) {
      impl_->output_name_ptrs.push_back(name.c_str());
    }
  } else {
    throw std::runtime_error(
        "OnnxRegionDetector: model must have 1 output (YOLO-style) or at least 3 outputs "
        "(boxes, scores, class_ids)");
  }

  autotag::core::logger()->info("region detector loaded: {} ({}x{}, {} output(s))", model_path,
                                impl_->input_width, impl_->input_height, num_outputs);
}

OnnxRegionDetector::~OnnxRegionDetector() = default;

std::uint32_t OnnxRegionDetector::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxRegionDetector::input_height() const noexcept { return impl_->input_height; }

std::expected<RawDetections, EngineError> OnnxRegionDetector::infer(const Image& region) {
  if (region.empty()) {
    return std::unexpected(EngineError::InvalidImage);
  }
  auto resized = resize_image(region, impl_->input_width, impl_->input_height);
  if (!resized) return std::unexpected(resized.error());
  auto rgb = convert_to_rgb(*resized);
  if (!rgb) return std::unexpected(rgb.error());

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;

  std::lock_guard lock(impl_->run_mutex);
  RgbToHwcFloat(*rgb, impl_->hwc_buffer);

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(impl_->hwc_buffer.data(), h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->nchw_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->hwc_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(Ort::RunOptions{nullptr}, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(),
                                 impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    autotag::core::logger()->warn("region detector run failed: {}", e.what());
    return std::unexpected(EngineError::ExtractionFailed);
  }

  if (impl_->use_yolo_single_output) {
    if (outputs.size() != 1u) {
      return std::unexpected(EngineError::ExtractionFailed);
    }
    return ParseSingleOutput(outputs[0]);
  }
  return ParseThreeOutputs(outputs);
}

std::expected<RegionDetection, EngineError> OnnxRegionDetector::detect(const Image& region) {
  auto raw = infer(region);
  if (!raw) {
    return std::unexpected(raw.error());
  }
  return impl_->decoder.decode(*raw);
}

void OnnxRegionDetector::warmup() {
  const std::size_t num_bytes =
      static_cast<std::size_t>(impl_->input_height) * impl_->input_width * kNumChannels;
  Image blank(impl_->input_width, impl_->input_height, autotag::core::PixelFormat::RGB8,
              std::vector<std::byte>(num_bytes, std::byte{0}));
  if (!infer(blank)) {
    autotag::core::logger()->warn("region detector warmup failed");
  }
}

}  // namespace autotag::vision
