// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Result Sets                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/types.hpp"
#include "tabula/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tabula {

/// Identity and alignment policy of one table column
struct ColumnDescriptor {
    std::string name;
    ValueKind kind = ValueKind::Other;
    TypeCode type = TypeCode::Custom;

    ColumnDescriptor() = default;
    ColumnDescriptor(std::string column_name, ValueKind column_kind)
        : name(std::move(column_name)), kind(column_kind) {}
    ColumnDescriptor(std::string column_name, TypeCode type_code)
        : name(std::move(column_name)), kind(value_kind(type_code)), type(type_code) {}

    [[nodiscard]] bool is_numeric() const noexcept { return kind == ValueKind::Numeric; }

    friend bool operator==(const ColumnDescriptor& lhs, const ColumnDescriptor& rhs) {
        return lhs.name == rhs.name && lhs.kind == rhs.kind && lhs.type == rhs.type;
    }
    friend bool operator!=(const ColumnDescriptor& lhs, const ColumnDescriptor& rhs) {
        return !(lhs == rhs);
    }
};

/// One record of a result set, values addressed by column name
class Row {
public:
    Row() = default;
    Row(std::vector<ColumnDescriptor> columns, std::vector<Value> values);

    // Fluent Interface
    Row& with(ColumnDescriptor column, Value value);

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] const std::vector<ColumnDescriptor>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<Value>& values() const noexcept { return values_; }

    /// Throws std::out_of_range past the last column
    [[nodiscard]] const Value& at(std::size_t index) const;

    [[nodiscard]] Result<const Value*> find(std::string_view name) const;

    // Typed getters
    [[nodiscard]] Result<std::string> get_string(std::string_view name) const;
    [[nodiscard]] Result<std::int32_t> get_int(std::string_view name) const;
    [[nodiscard]] Result<std::int64_t> get_bigint(std::string_view name) const;
    [[nodiscard]] Result<double> get_double(std::string_view name) const;
    [[nodiscard]] Result<bool> get_bool(std::string_view name) const;

private:
    template<typename T>
    Result<T> get_as(std::string_view name, const char* expected) const;

    std::vector<ColumnDescriptor> columns_;
    std::vector<Value> values_;
};

/// Fully materialized query result
class ResultSet {
public:
    ResultSet() = default;
    ResultSet(std::vector<ColumnDescriptor> columns, std::vector<Row> rows);

    [[nodiscard]] const std::vector<ColumnDescriptor>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] const std::vector<Row>& all() const noexcept { return rows_; }

    [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    std::vector<Row>::const_iterator begin() const { return rows_.cbegin(); }
    std::vector<Row>::const_iterator end() const { return rows_.cend(); }

    /// Rows matching the predicate, same columns
    [[nodiscard]] ResultSet filter(const std::function<bool(const Row&)>& predicate) const;

    /// Build rows sharing the given columns; each raw row must match the column count
    [[nodiscard]] static Result<ResultSet> from_values(
        std::vector<ColumnDescriptor> columns,
        std::vector<std::vector<Value>> raw_rows);

private:
    std::vector<ColumnDescriptor> columns_;
    std::vector<Row> rows_;
};

} // namespace tabula
