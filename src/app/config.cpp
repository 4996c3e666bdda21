#include <autotag/app/config.hpp>
#include <autotag/core/logging.hpp>
#include <charconv>
#include <fstream>
#include <string_view>
#include <system_error>

namespace autotag::app {

using autotag::core::EngineError;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
bool parse_number(const std::string& text, T& out) {
  const char* first = text.data();
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool parse_bool(const std::string& text, bool& out) {
  if (text == "true" || text == "1" || text == "on") {
    out = true;
    return true;
  }
  if (text == "false" || text == "0" || text == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parse_threshold(const std::string& text, double& out) {
  double v = 0.0;
  if (!parse_number(text, v) || v < 0.0 || v > 1.0) return false;
  out = v;
  return true;
}

/// Applies one entry; false when the value cannot be used.
bool apply(EngineConfig& c, const std::string& key, const std::string& value) {
  if (key == "num_workers") return parse_number(value, c.num_workers);
  if (key == "use_tbb") return parse_bool(value, c.use_tbb);
  if (key == "confidence_policy") {
    if (value == "global_max") c.confidence_policy = autotag::core::ConfidencePolicy::GlobalMax;
    else if (value == "winner_max") c.confidence_policy = autotag::core::ConfidencePolicy::WinnerMax;
    else return false;
    return true;
  }
  if (key == "pdf_acceptance_threshold") return parse_threshold(value, c.pdf_acceptance_threshold);
  if (key == "similar_image_threshold") return parse_threshold(value, c.similar_image_threshold);
  if (key == "region_detector") {
    if (value == "none") c.detector_type = RegionDetectorType::None;
    else if (value == "onnx") c.detector_type = RegionDetectorType::Onnx;
    else return false;
    return true;
  }
  if (key == "detector_model_path") {
    c.detector_model_path = value;
    return true;
  }
  if (key == "detector_labels_path") {
    c.detector_labels_path = value;
    return true;
  }
  if (key == "detector_confidence_threshold") {
    double t = 0.0;
    if (!parse_threshold(value, t)) return false;
    c.detector_confidence_threshold = static_cast<float>(t);
    return true;
  }
  if (key == "log_level") {
    c.log_level = value;
    return value == "trace" || value == "debug" || value == "info" || value == "warn" ||
           value == "warning" || value == "error" || value == "critical" || value == "off";
  }
  autotag::core::logger()->warn("config: unknown key '{}' ignored", key);
  return true;
}

}  // namespace

EngineConfig default_config() {
  return EngineConfig{};
}

std::expected<EngineConfig, EngineError> parse_config(std::istream& in) {
  EngineConfig c = default_config();
  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      autotag::core::logger()->warn("config line {}: expected key=value", line_no);
      continue;
    }
    if (!apply(c, key, value)) {
      autotag::core::logger()->error("config line {}: invalid value '{}' for '{}'", line_no,
                                     value, key);
      return std::unexpected(EngineError::InvalidConfig);
    }
  }
  return c;
}

std::expected<EngineConfig, EngineError> load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    autotag::core::logger()->error("cannot open config file '{}'", path);
    return std::unexpected(EngineError::ContentUnavailable);
  }
  return parse_config(f);
}

}  // namespace autotag::app
