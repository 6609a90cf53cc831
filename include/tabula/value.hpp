// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Value Model                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace tabula {

// ==============================================================================
// Protocol Data Types
// ==============================================================================

/// Native protocol data type codes of the column store
enum class TypeCode : std::uint16_t {
    Custom    = 0x0000,
    Ascii     = 0x0001,
    BigInt    = 0x0002,
    Blob      = 0x0003,
    Boolean   = 0x0004,
    Counter   = 0x0005,
    Decimal   = 0x0006,
    Double    = 0x0007,
    Float     = 0x0008,
    Int       = 0x0009,
    Timestamp = 0x000B,
    Uuid      = 0x000C,
    Varchar   = 0x000D,
    Varint    = 0x000E,
    TimeUuid  = 0x000F,
    Inet      = 0x0010,
    Date      = 0x0011,
    Time      = 0x0012,
    SmallInt  = 0x0013,
    TinyInt   = 0x0014,
    Duration  = 0x0015,
    List      = 0x0020,
    Map       = 0x0021,
    Set       = 0x0022,
    Udt       = 0x0030,
    Tuple     = 0x0031,
};

/// Alignment category of a column
enum class ValueKind : std::uint8_t {
    Numeric,
    Other,
};

/// Integers, floating point and decimals are numeric; everything else is not
[[nodiscard]] constexpr ValueKind value_kind(TypeCode type) noexcept {
    switch (type) {
        case TypeCode::Int:
        case TypeCode::BigInt:
        case TypeCode::SmallInt:
        case TypeCode::TinyInt:
        case TypeCode::Varint:
        case TypeCode::Counter:
        case TypeCode::Float:
        case TypeCode::Double:
        case TypeCode::Decimal:
            return ValueKind::Numeric;
        default:
            return ValueKind::Other;
    }
}

/// CQL name of a type code ("int", "text", ...)
[[nodiscard]] const char* type_name(TypeCode type) noexcept;

/// Parse a CQL type name, case-insensitive. "text" is an alias of varchar.
[[nodiscard]] Result<TypeCode> parse_type_name(std::string_view name);

[[nodiscard]] constexpr const char* value_kind_to_string(ValueKind kind) noexcept {
    return kind == ValueKind::Numeric ? "numeric" : "other";
}

// ==============================================================================
// Values
// ==============================================================================

/// Cell value. Decimals, varints, uuids, timestamps and collections travel
/// as their string form.
using Value = std::variant<
    std::monostate,  // NULL
    bool,
    std::int32_t,
    std::int64_t,
    float,
    double,
    std::string
>;

[[nodiscard]] inline bool is_null(const Value& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

/// Natural text form of a value: "null", "true"/"false", decimal integers,
/// shortest round-trip floating point, strings verbatim.
[[nodiscard]] std::string to_text(const Value& value);

/// Number of Unicode code points in UTF-8 text
[[nodiscard]] std::size_t text_width(std::string_view text) noexcept;

} // namespace tabula
