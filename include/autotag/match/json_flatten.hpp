#pragma once

#include <autotag/core/candidate.hpp>
#include <autotag/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <string_view>
#include <vector>

namespace autotag::match {

/// Flattens a JSON document to (path, value) pairs in document order.
/// Object keys join with '.', array items append "[index]". Strings keep their text, other
/// scalars use their JSON serialisation. A scalar root yields one pair with an empty path;
/// empty objects and arrays contribute nothing.
[[nodiscard]] std::vector<autotag::core::KeyValue> flatten_json(const nlohmann::ordered_json& doc);

/// Parses JSON text, keeping object key order. Errors: MalformedDocument.
[[nodiscard]] std::expected<nlohmann::ordered_json, autotag::core::EngineError> parse_json_document(
    std::string_view text);

}  // namespace autotag::match
