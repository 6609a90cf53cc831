// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Result Set Implementation                                          ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/result_set.hpp"

#include <fmt/core.h>

#include <stdexcept>
#include <utility>

namespace tabula {

// ==============================================================================
// Row
// ==============================================================================

Row::Row(std::vector<ColumnDescriptor> columns, std::vector<Value> values)
    : columns_(std::move(columns)), values_(std::move(values))
{
    if (columns_.size() != values_.size()) {
        throw std::invalid_argument(fmt::format(
            "Row has {} columns but {} values", columns_.size(), values_.size()));
    }
}

Row& Row::with(ColumnDescriptor column, Value value) {
    columns_.push_back(std::move(column));
    values_.push_back(std::move(value));
    return *this;
}

const Value& Row::at(std::size_t index) const {
    if (index >= values_.size()) {
        throw std::out_of_range("Row index out of range");
    }
    return values_[index];
}

Result<const Value*> Row::find(std::string_view name) const {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) {
            return &values_[i];
        }
    }
    return Err<const Value*>(ErrorCode::ColumnNotFound,
        fmt::format("no column '{}' in row", name));
}

template<typename T>
Result<T> Row::get_as(std::string_view name, const char* expected) const {
    auto found = find(name);
    if (!found) {
        return Err<T>(found.error());
    }

    const Value& value = **found;
    if (is_null(value)) {
        return Err<T>(ErrorCode::NullValue,
            fmt::format("column '{}' is null", name));
    }
    if (const auto* typed = std::get_if<T>(&value)) {
        return *typed;
    }
    return Err<T>(ErrorCode::TypeMismatch,
        fmt::format("column '{}' is not {}", name, expected));
}

Result<std::string> Row::get_string(std::string_view name) const {
    return get_as<std::string>(name, "a string");
}

Result<std::int32_t> Row::get_int(std::string_view name) const {
    return get_as<std::int32_t>(name, "an int");
}

Result<std::int64_t> Row::get_bigint(std::string_view name) const {
    auto found = find(name);
    if (found && std::holds_alternative<std::int32_t>(**found)) {
        return static_cast<std::int64_t>(std::get<std::int32_t>(**found));
    }
    return get_as<std::int64_t>(name, "a bigint");
}

Result<double> Row::get_double(std::string_view name) const {
    auto found = find(name);
    if (found && std::holds_alternative<float>(**found)) {
        return static_cast<double>(std::get<float>(**found));
    }
    return get_as<double>(name, "a double");
}

Result<bool> Row::get_bool(std::string_view name) const {
    return get_as<bool>(name, "a boolean");
}

// ==============================================================================
// ResultSet
// ==============================================================================

ResultSet::ResultSet(std::vector<ColumnDescriptor> columns, std::vector<Row> rows)
    : columns_(std::move(columns)), rows_(std::move(rows)) {}

ResultSet ResultSet::filter(const std::function<bool(const Row&)>& predicate) const {
    std::vector<Row> kept;
    for (const auto& row : rows_) {
        if (predicate(row)) {
            kept.push_back(row);
        }
    }
    return ResultSet(columns_, std::move(kept));
}

Result<ResultSet> ResultSet::from_values(
    std::vector<ColumnDescriptor> columns,
    std::vector<std::vector<Value>> raw_rows)
{
    std::vector<Row> rows;
    rows.reserve(raw_rows.size());

    for (std::size_t i = 0; i < raw_rows.size(); ++i) {
        if (raw_rows[i].size() != columns.size()) {
            return Err<ResultSet>(ErrorCode::ColumnCountMismatch,
                fmt::format("row {} has {} values, expected {}",
                    i, raw_rows[i].size(), columns.size()));
        }
        rows.emplace_back(columns, std::move(raw_rows[i]));
    }

    return ResultSet(std::move(columns), std::move(rows));
}

} // namespace tabula
