// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Embedded Usage Example                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/version.hpp"
#include "tabula/config.hpp"
#include "tabula/table_renderer.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <iostream>
#include <string>
#include <vector>

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== Tabula Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", tabula::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", tabula::BUILD_TYPE, tabula::COMPILER_ID);

    std::vector<tabula::ColumnDescriptor> columns{
        {"id", tabula::TypeCode::Varchar},
        {"name", tabula::TypeCode::Varchar},
        {"age", tabula::TypeCode::Int},
    };

    // Build a result set the way a driver would hand it over
    auto result = tabula::ResultSet::from_values(columns, {
        {std::string("123"), std::string("jon"), 32},
        {std::string("456"), std::string("mary"), 25},
        {std::string("9"), std::string("Anastasios"), tabula::Value{}},
    });
    if (!result) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", result.error().to_string());
        return 1;
    }

    tabula::TableRenderer renderer;

    fmt::print("All users:\n");
    if (auto status = renderer.print(std::cout, *result); !status) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", status.error().to_string());
        return 1;
    }

    fmt::print("\nAge first, id second:\n");
    std::vector<tabula::ColumnDescriptor> projection{
        {"age", tabula::ValueKind::Numeric},
        {"id", tabula::ValueKind::Other},
    };
    auto projected = renderer.render(projection, result->all());
    if (!projected) {
        fmt::print(fg(fmt::color::red), "ERROR: {}\n", projected.error().to_string());
        return 1;
    }
    fmt::print("{}\n", *projected);

    fmt::print("\nNobody older than 100:\n");
    auto old = result->filter([](const tabula::Row& row) {
        auto age = row.get_int("age");
        return age && *age > 100;
    });
    tabula::display(old);

    fmt::print(fg(fmt::color::green), "\nDone!\n\n");

    return 0;
}
