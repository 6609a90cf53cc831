// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Table Renderer Implementation                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/table_renderer.hpp"
#include "tabula/log.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <utility>

namespace tabula {

namespace {

/// Cell texts of one render, row-major, plus the final column widths
struct Layout {
    std::vector<std::size_t> widths;
    std::vector<std::vector<std::string>> cells;
};

void append_padded(std::string& out, const std::string& text, std::size_t width, bool align_right) {
    std::size_t length = text_width(text);
    std::size_t padding = width > length ? width - length : 0;

    if (align_right) {
        out.append(padding, ' ');
        out += text;
    } else {
        out += text;
        out.append(padding, ' ');
    }
}

std::string separator_line(const std::vector<std::size_t>& widths) {
    std::string line = "+";
    for (auto width : widths) {
        line.append(width, '-');
        line += '+';
    }
    return line;
}

Result<Layout> measure(const std::vector<ColumnDescriptor>& columns, const std::vector<Row>& rows) {
    Layout layout;
    layout.widths.reserve(columns.size());
    for (const auto& column : columns) {
        layout.widths.push_back(text_width(column.name));
    }

    layout.cells.reserve(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r) {
        std::vector<std::string> texts;
        texts.reserve(columns.size());

        for (std::size_t c = 0; c < columns.size(); ++c) {
            auto value = rows[r].find(columns[c].name);
            if (!value) {
                return Err<Layout>(ErrorCode::SchemaMismatch,
                    fmt::format("row {} has no value for column '{}'", r, columns[c].name));
            }

            auto text = to_text(**value);
            layout.widths[c] = std::max(layout.widths[c], text_width(text));
            texts.push_back(std::move(text));
        }

        layout.cells.push_back(std::move(texts));
    }

    return layout;
}

} // anonymous namespace

TableRenderer::TableRenderer()
    : TableRenderer(RenderOptions{})
{
}

TableRenderer::TableRenderer(RenderOptions options)
    : options_(std::move(options))
{
}

// ==============================================================================
// Pure formatting
// ==============================================================================

Result<std::string> TableRenderer::render(const std::vector<Row>& rows) const {
    if (rows.empty()) {
        return options_.empty_placeholder;
    }
    return render(rows.front().columns(), rows);
}

Result<std::string> TableRenderer::render(const std::vector<ColumnDescriptor>& columns,
                                          const std::vector<Row>& rows) const {
    if (rows.empty()) {
        return options_.empty_placeholder;
    }

    // Every width must be final before the first line is built
    auto layout = measure(columns, rows);
    if (!layout) {
        return Err<std::string>(layout.error());
    }

    const auto& widths = layout->widths;
    const std::string separator = separator_line(widths);

    std::string out;
    out += separator;
    out += '\n';

    out += '|';
    for (std::size_t c = 0; c < columns.size(); ++c) {
        append_padded(out, columns[c].name, widths[c], false);
        out += '|';
    }
    out += '\n';

    out += separator;
    out += '\n';

    for (const auto& texts : layout->cells) {
        out += '|';
        for (std::size_t c = 0; c < columns.size(); ++c) {
            append_padded(out, texts[c], widths[c], columns[c].is_numeric());
            out += '|';
        }
        out += '\n';
    }

    out += separator;

    log::debug("Rendered {} rows across {} columns", rows.size(), columns.size());

    return out;
}

Result<std::string> TableRenderer::render(const ResultSet& result) const {
    return render(result.columns(), result.rows());
}

// ==============================================================================
// Output
// ==============================================================================

Status TableRenderer::print(std::ostream& out, const std::vector<Row>& rows) const {
    auto text = render(rows);
    if (!text) {
        return Err(text.error());
    }
    out << *text << '\n';
    if (!out) {
        return Err(ErrorCode::IoError, "failed to write table");
    }
    return Ok();
}

Status TableRenderer::print(std::ostream& out, const ResultSet& result) const {
    auto text = render(result);
    if (!text) {
        return Err(text.error());
    }
    out << *text << '\n';
    if (!out) {
        return Err(ErrorCode::IoError, "failed to write table");
    }
    return Ok();
}

void display_rows(const std::vector<Row>& rows) {
    if (auto status = TableRenderer().print(std::cout, rows); !status) {
        log::error("Failed to display rows: {}", status.error().to_string());
    }
}

void display(const ResultSet& result) {
    if (auto status = TableRenderer().print(std::cout, result); !status) {
        log::error("Failed to display result: {}", status.error().to_string());
    }
}

} // namespace tabula
