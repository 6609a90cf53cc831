// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Table Renderer                                                     ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/result_set.hpp"
#include "tabula/types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace tabula {

struct RenderOptions {
    /// Printed instead of a table when there are no rows
    std::string empty_placeholder = "Nothing";
};

/// Renders rows as a bordered ASCII table:
///
///   +---+----+---+
///   |id |name|age|
///   +---+----+---+
///   |123|jon | 32|
///   +---+----+---+
///
/// Each column is as wide as its widest header or value text. Numeric
/// columns are right-aligned, all others left-aligned. The result carries no
/// trailing newline.
class TableRenderer {
public:
    TableRenderer();
    explicit TableRenderer(RenderOptions options);

    [[nodiscard]] const RenderOptions& options() const noexcept { return options_; }

    // ==========================================================================
    // Pure formatting
    // ==========================================================================

    /// Columns are taken from the first row
    [[nodiscard]] Result<std::string> render(const std::vector<Row>& rows) const;

    /// Columns are given explicitly and may project or reorder the rows' columns.
    /// Fails with SchemaMismatch when a row has no value for a column.
    [[nodiscard]] Result<std::string> render(const std::vector<ColumnDescriptor>& columns,
                                             const std::vector<Row>& rows) const;

    [[nodiscard]] Result<std::string> render(const ResultSet& result) const;

    // ==========================================================================
    // Output
    // ==========================================================================

    /// Render and write followed by a newline. Nothing is written on failure.
    [[nodiscard]] Status print(std::ostream& out, const std::vector<Row>& rows) const;
    [[nodiscard]] Status print(std::ostream& out, const ResultSet& result) const;

private:
    RenderOptions options_;
};

/// Print rows to stdout; failures are logged
void display_rows(const std::vector<Row>& rows);

/// Print a result set to stdout; failures are logged
void display(const ResultSet& result);

} // namespace tabula
