#include <autotag/match/json_flatten.hpp>
#include <string>

namespace autotag::match {

namespace {

void flatten_into(const nlohmann::ordered_json& node,
                  const std::string& path,
                  std::vector<autotag::core::KeyValue>& out) {
  if (node.is_object()) {
    for (const auto& [key, child] : node.items()) {
      flatten_into(child, path.empty() ? key : path + "." + key, out);
    }
    return;
  }
  if (node.is_array()) {
    for (std::size_t i = 0; i < node.size(); ++i) {
      flatten_into(node[i], path + "[" + std::to_string(i) + "]", out);
    }
    return;
  }
  out.push_back({path, node.is_string() ? node.get<std::string>() : node.dump()});
}

}  // namespace

std::vector<autotag::core::KeyValue> flatten_json(const nlohmann::ordered_json& doc) {
  std::vector<autotag::core::KeyValue> out;
  flatten_into(doc, std::string{}, out);
  return out;
}

std::expected<nlohmann::ordered_json, autotag::core::EngineError> parse_json_document(
    std::string_view text) {
  auto doc = nlohmann::ordered_json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return std::unexpected(autotag::core::EngineError::MalformedDocument);
  }
  return doc;
}

}  // namespace autotag::match
