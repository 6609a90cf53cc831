// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Value Model Implementation                                         ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/value.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <type_traits>
#include <utility>

namespace tabula {

namespace {

struct TypeNameEntry {
    TypeCode type;
    const char* name;
};

constexpr std::array<TypeNameEntry, 26> kTypeNames{{
    {TypeCode::Custom, "custom"},
    {TypeCode::Ascii, "ascii"},
    {TypeCode::BigInt, "bigint"},
    {TypeCode::Blob, "blob"},
    {TypeCode::Boolean, "boolean"},
    {TypeCode::Counter, "counter"},
    {TypeCode::Decimal, "decimal"},
    {TypeCode::Double, "double"},
    {TypeCode::Float, "float"},
    {TypeCode::Int, "int"},
    {TypeCode::Timestamp, "timestamp"},
    {TypeCode::Uuid, "uuid"},
    {TypeCode::Varchar, "varchar"},
    {TypeCode::Varint, "varint"},
    {TypeCode::TimeUuid, "timeuuid"},
    {TypeCode::Inet, "inet"},
    {TypeCode::Date, "date"},
    {TypeCode::Time, "time"},
    {TypeCode::SmallInt, "smallint"},
    {TypeCode::TinyInt, "tinyint"},
    {TypeCode::Duration, "duration"},
    {TypeCode::List, "list"},
    {TypeCode::Map, "map"},
    {TypeCode::Set, "set"},
    {TypeCode::Udt, "udt"},
    {TypeCode::Tuple, "tuple"},
}};

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // anonymous namespace

const char* type_name(TypeCode type) noexcept {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unknown";
}

Result<TypeCode> parse_type_name(std::string_view name) {
    auto lowered = to_lower(name);

    // Parameterized collections: list<int>, map<text, int>, frozen<...>
    constexpr std::string_view frozen = "frozen<";
    if (lowered.compare(0, frozen.size(), frozen) == 0 && lowered.back() == '>') {
        lowered = lowered.substr(frozen.size(), lowered.size() - frozen.size() - 1);
    }
    if (auto open = lowered.find('<'); open != std::string::npos) {
        lowered.erase(open);
    }

    if (lowered == "text") {
        return TypeCode::Varchar;
    }

    for (const auto& entry : kTypeNames) {
        if (lowered == entry.name) {
            return entry.type;
        }
    }

    return Err<TypeCode>(ErrorCode::UnknownType,
        fmt::format("unknown column type '{}'", name));
}

std::string to_text(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            return fmt::format("{}", v);
        }
    }, value);
}

std::size_t text_width(std::string_view text) noexcept {
    std::size_t width = 0;
    for (unsigned char c : text) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

} // namespace tabula
