// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - JSON Adapter Implementation                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/json_rows.hpp"
#include "tabula/log.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tabula::json {

namespace {

bool is_int32_type(TypeCode type) {
    return type == TypeCode::Int || type == TypeCode::SmallInt || type == TypeCode::TinyInt;
}

bool is_int64_type(TypeCode type) {
    return type == TypeCode::BigInt || type == TypeCode::Counter || type == TypeCode::Varint;
}

Result<Value> number_to_value(const nlohmann::json& cell, const ColumnDescriptor& column) {
    const bool integral = cell.is_number_integer();

    if (is_int32_type(column.type) || is_int64_type(column.type)) {
        if (!integral) {
            return Err<Value>(ErrorCode::TypeMismatch,
                fmt::format("column '{}' expects an integer, got {}", column.name, cell.dump()));
        }
        if (cell.is_number_unsigned() &&
            cell.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Err<Value>(ErrorCode::TypeMismatch,
                fmt::format("column '{}' value {} is out of range", column.name, cell.dump()));
        }
        auto number = cell.get<std::int64_t>();
        if (is_int32_type(column.type) &&
            number >= std::numeric_limits<std::int32_t>::min() &&
            number <= std::numeric_limits<std::int32_t>::max()) {
            return Value{static_cast<std::int32_t>(number)};
        }
        return Value{number};
    }

    switch (column.type) {
        case TypeCode::Float: {
            auto number = cell.get<double>();
            if (std::fabs(number) > static_cast<double>(std::numeric_limits<float>::max())) {
                return Err<Value>(ErrorCode::TypeMismatch,
                    fmt::format("column '{}' value {} does not fit a float", column.name, cell.dump()));
            }
            return Value{static_cast<float>(number)};
        }
        case TypeCode::Double:
            return Value{cell.get<double>()};
        case TypeCode::Decimal:
            // JSON numbers arrive normalized (12.50 -> 12.5); strings keep their digits
            return Value{cell.dump()};
        case TypeCode::Custom:
            if (cell.is_number_unsigned() &&
                cell.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Value{cell.dump()};
            }
            if (integral) {
                return Value{cell.get<std::int64_t>()};
            }
            return Value{cell.get<double>()};
        default:
            break;
    }

    return Value{cell.dump()};
}

Result<Value> cell_to_value(const nlohmann::json& cell, const ColumnDescriptor& column) {
    switch (cell.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Value{};
        case nlohmann::json::value_t::boolean:
            return Value{cell.get<bool>()};
        case nlohmann::json::value_t::string:
            return Value{cell.get<std::string>()};
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return number_to_value(cell, column);
        default:
            // Collections and UDTs render as their JSON text
            return Value{cell.dump()};
    }
}

Result<ColumnDescriptor> parse_column(const nlohmann::json& entry, std::size_t index) {
    if (entry.is_string()) {
        return ColumnDescriptor(entry.get<std::string>(), TypeCode::Varchar);
    }
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        return Err<ColumnDescriptor>(ErrorCode::ParseError,
            fmt::format("column {} must be a string or an object with a \"name\"", index));
    }

    auto name = entry["name"].get<std::string>();
    auto type_text = entry.value("type", std::string("varchar"));

    auto type = parse_type_name(type_text);
    if (!type) {
        return Err<ColumnDescriptor>(type.error());
    }
    return ColumnDescriptor(std::move(name), *type);
}

} // anonymous namespace

Result<ResultSet> result_set_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<ResultSet>(ErrorCode::ParseError, "result document must be an object");
    }
    if (!document.contains("columns") || !document["columns"].is_array()) {
        return Err<ResultSet>(ErrorCode::ParseError, "result document needs a \"columns\" array");
    }

    std::vector<ColumnDescriptor> columns;
    const auto& column_specs = document["columns"];
    for (std::size_t i = 0; i < column_specs.size(); ++i) {
        auto column = parse_column(column_specs[i], i);
        if (!column) {
            return Err<ResultSet>(column.error());
        }
        columns.push_back(std::move(*column));
    }

    std::vector<std::vector<Value>> raw_rows;
    auto rows = document.value("rows", nlohmann::json::array());
    if (!rows.is_array()) {
        return Err<ResultSet>(ErrorCode::ParseError, "\"rows\" must be an array");
    }

    for (std::size_t r = 0; r < rows.size(); ++r) {
        const auto& row = rows[r];
        std::vector<Value> values;
        values.reserve(columns.size());

        if (row.is_array()) {
            if (row.size() != columns.size()) {
                return Err<ResultSet>(ErrorCode::ColumnCountMismatch,
                    fmt::format("row {} has {} values, expected {}", r, row.size(), columns.size()));
            }
            for (std::size_t c = 0; c < columns.size(); ++c) {
                auto value = cell_to_value(row[c], columns[c]);
                if (!value) {
                    return Err<ResultSet>(value.error());
                }
                values.push_back(std::move(*value));
            }
        } else if (row.is_object()) {
            for (const auto& column : columns) {
                auto it = row.find(column.name);
                if (it == row.end()) {
                    values.emplace_back();
                    continue;
                }
                auto value = cell_to_value(*it, column);
                if (!value) {
                    return Err<ResultSet>(value.error());
                }
                values.push_back(std::move(*value));
            }
        } else {
            return Err<ResultSet>(ErrorCode::ParseError,
                fmt::format("row {} must be an array or an object", r));
        }

        raw_rows.push_back(std::move(values));
    }

    log::debug("Loaded {} rows across {} columns from JSON", raw_rows.size(), columns.size());

    return ResultSet::from_values(std::move(columns), std::move(raw_rows));
}

Result<ResultSet> parse_result_set(std::string_view text) {
    auto document = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        return Err<ResultSet>(ErrorCode::ParseError, "invalid JSON");
    }
    return result_set_from_json(document);
}

Result<ResultSet> load_result_set(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<ResultSet>(ErrorCode::IoError,
            fmt::format("cannot open '{}'", path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Err<ResultSet>(ErrorCode::IoError,
            fmt::format("failed to read '{}'", path.string()));
    }

    auto result = parse_result_set(buffer.str());
    if (!result) {
        return Err<ResultSet>(result.error().code(),
            fmt::format("{}: {}", path.string(), result.error().message()));
    }
    return result;
}

nlohmann::ordered_json value_to_json(const Value& value) {
    return std::visit([](const auto& v) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return v;
        }
    }, value);
}

nlohmann::ordered_json row_to_json(const Row& row) {
    auto object = nlohmann::ordered_json::object();
    for (std::size_t i = 0; i < row.size(); ++i) {
        object[row.columns()[i].name] = value_to_json(row.values()[i]);
    }
    return object;
}

ResultSet json_view(const ResultSet& result) {
    ColumnDescriptor column(JSON_COLUMN, TypeCode::Varchar);

    std::vector<Row> rows;
    rows.reserve(result.row_count());
    for (const auto& row : result) {
        rows.emplace_back(std::vector<ColumnDescriptor>{column},
                          std::vector<Value>{row_to_json(row).dump()});
    }

    return ResultSet({column}, std::move(rows));
}

} // namespace tabula::json
