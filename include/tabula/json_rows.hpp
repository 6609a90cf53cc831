// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - JSON Adapter                                                       ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/result_set.hpp"
#include "tabula/types.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace tabula::json {

/// Name of the single column of a SELECT JSON result
inline constexpr const char* JSON_COLUMN = "[json]";

/// Build a result set from a document of the form
///
///   {"columns": [{"name": "id", "type": "text"}, ...],
///    "rows": [["123", "jon", 32], {"id": "456", "name": "mary", "age": 25}]}
///
/// Array rows are positional; object rows are keyed by column name and a
/// missing key becomes null.
[[nodiscard]] Result<ResultSet> result_set_from_json(const nlohmann::json& document);

/// Parse text first, then convert
[[nodiscard]] Result<ResultSet> parse_result_set(std::string_view text);

/// Read a result document from a file
[[nodiscard]] Result<ResultSet> load_result_set(const std::filesystem::path& path);

[[nodiscard]] nlohmann::ordered_json value_to_json(const Value& value);

/// JSON object keyed by column name, in column order
[[nodiscard]] nlohmann::ordered_json row_to_json(const Row& row);

/// One varchar column "[json]" holding every row as a serialized JSON object
[[nodiscard]] ResultSet json_view(const ResultSet& result);

} // namespace tabula::json
