#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Third-party includes
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// Project includes
#include "tabula/config.hpp"
#include "tabula/json_rows.hpp"
#include "tabula/lab.hpp"
#include "tabula/log.hpp"
#include "tabula/table_renderer.hpp"
#include "tabula/version.hpp"

// ============================================================================
// Configuration Structure
// ============================================================================
struct AppConfig {
    // Input settings
    std::string config_file = "";
    std::string input_file = "";
    std::vector<std::string> columns;
    std::string where = "";
    bool json_view = false;
    bool run_lab = false;

    // Output settings
    std::string placeholder = "Nothing";
    bool color = true;

    // Logging settings
    std::string log_level = "info";

    // Load from file; keys already set on the command line are kept
    bool load_from_file(const std::string& path, const CLI::App& app) {
        if (!std::filesystem::exists(path)) {
            return false;
        }

        std::ifstream file(path);
        if (!file) {
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            auto pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);

            // Trim whitespace
            auto trim = [](std::string& s) {
                s.erase(0, s.find_first_not_of(" \t"));
                s.erase(s.find_last_not_of(" \t") + 1);
            };

            trim(key);
            trim(value);

            auto from_cli = [&app](const std::string& option) {
                return app.count(option) > 0;
            };

            if (key == "input" && !from_cli("--input")) input_file = value;
            else if (key == "placeholder" && !from_cli("--placeholder")) placeholder = value;
            else if (key == "log_level" && !from_cli("--log-level")) log_level = value;
            else if (key == "color" && !from_cli("--no-color")) color = (value == "true" || value == "1");
            else spdlog::warn("Ignoring config key '{}'", key);
        }

        return true;
    }
};

// ============================================================================
// Utility Functions
// ============================================================================
bool setup_logging(const AppConfig& config) {
    auto level = tabula::log::parse_level(config.log_level);
    if (!level) {
        std::cerr << level.error().to_string() << std::endl;
        return false;
    }
    tabula::log::set_level(*level);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        auto logger = std::make_shared<spdlog::logger>("tabula", console_sink);

        spdlog::level::level_enum spd_level = spdlog::level::info;
        switch (*level) {
            case tabula::log::Level::Trace: spd_level = spdlog::level::trace; break;
            case tabula::log::Level::Debug: spd_level = spdlog::level::debug; break;
            case tabula::log::Level::Info: spd_level = spdlog::level::info; break;
            case tabula::log::Level::Warn: spd_level = spdlog::level::warn; break;
            case tabula::log::Level::Error: spd_level = spdlog::level::err; break;
            case tabula::log::Level::Off: spd_level = spdlog::level::off; break;
        }

        logger->set_level(spd_level);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
    return true;
}

tabula::Result<std::vector<tabula::ColumnDescriptor>> select_columns(
    const tabula::ResultSet& result, const std::vector<std::string>& names)
{
    std::vector<tabula::ColumnDescriptor> selected;
    for (const auto& name : names) {
        bool found = false;
        for (const auto& column : result.columns()) {
            if (column.name == name) {
                selected.push_back(column);
                found = true;
                break;
            }
        }
        if (!found) {
            return tabula::Err<std::vector<tabula::ColumnDescriptor>>(
                tabula::ErrorCode::ColumnNotFound,
                "no column '" + name + "' in result");
        }
    }
    return selected;
}

tabula::Result<tabula::ResultSet> apply_where(const tabula::ResultSet& result, const std::string& where) {
    auto pos = where.find('=');
    if (pos == std::string::npos || pos == 0) {
        return tabula::Err<tabula::ResultSet>(tabula::ErrorCode::InvalidArgument,
            "--where expects COLUMN=VALUE, got '" + where + "'");
    }

    std::string column = where.substr(0, pos);
    std::string expected = where.substr(pos + 1);

    bool known = false;
    for (const auto& descriptor : result.columns()) {
        known = known || descriptor.name == column;
    }
    if (!known) {
        return tabula::Err<tabula::ResultSet>(tabula::ErrorCode::ColumnNotFound,
            "no column '" + column + "' in result");
    }

    return result.filter([&](const tabula::Row& row) {
        auto value = row.find(column);
        return value && tabula::to_text(**value) == expected;
    });
}

// ============================================================================
// Main Application Logic
// ============================================================================
int run_application(const AppConfig& config) {
    spdlog::debug("Tabula v{} ({} build, {})", TABULA_VERSION, TABULA_BUILD_TYPE, TABULA_COMPILER);

    tabula::ResultSet result;
    if (config.input_file.empty()) {
        spdlog::debug("No input given, using the education.user sample");
        result = tabula::lab::sample_users();
    } else {
        auto loaded = tabula::json::load_result_set(config.input_file);
        if (!loaded) {
            spdlog::error("Failed to load input: {}", loaded.error().to_string());
            return EXIT_FAILURE;
        }
        result = std::move(*loaded);
        spdlog::info("Loaded {} rows from {}", result.row_count(), config.input_file);
    }

    if (config.run_lab) {
        tabula::lab::Lab::Options options;
        options.color = config.color;
        options.render.empty_placeholder = config.placeholder;

        tabula::lab::Lab lab(std::cout, options);
        tabula::lab::run_guided_lab(lab, result);
        lab.print_summary();
        return lab.summary().all_passed() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (!config.where.empty()) {
        auto filtered = apply_where(result, config.where);
        if (!filtered) {
            spdlog::error("{}", filtered.error().to_string());
            return EXIT_FAILURE;
        }
        result = std::move(*filtered);
    }

    if (config.json_view) {
        result = tabula::json::json_view(result);
    }

    tabula::TableRenderer renderer(tabula::RenderOptions{config.placeholder});

    tabula::Status status;
    if (config.columns.empty()) {
        status = renderer.print(std::cout, result.all());
    } else {
        auto columns = select_columns(result, config.columns);
        if (!columns) {
            spdlog::error("{}", columns.error().to_string());
            return EXIT_FAILURE;
        }

        auto text = renderer.render(*columns, result.all());
        if (!text) {
            spdlog::error("Failed to render: {}", text.error().to_string());
            return EXIT_FAILURE;
        }
        std::cout << *text << '\n';
    }

    if (!status) {
        spdlog::error("Failed to render: {}", status.error().to_string());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    AppConfig config;

    // Parse command line
    CLI::App app{"Tabula - render query results as ASCII tables"};

    // Input options
    app.add_option("-i,--input", config.input_file,
        "JSON result document to render (default: education.user sample)")
        ->check(CLI::ExistingFile);

    app.add_option("-c,--columns", config.columns,
        "Columns to render, in order")
        ->delimiter(',');

    app.add_option("--where", config.where,
        "Keep rows whose COLUMN text equals VALUE (COLUMN=VALUE)");

    app.add_flag("--json", config.json_view,
        "Render rows as JSON documents");

    app.add_flag("--lab", config.run_lab,
        "Run the guided lab walk-through");

    app.add_option("--config", config.config_file,
        "Configuration file path")
        ->envname("TABULA_CONFIG");

    // Output options
    app.add_option("--placeholder", config.placeholder,
        "Text printed when there are no rows");

    app.add_flag_callback("--no-color", [&config]() {
        config.color = false;
    }, "Disable colored lab output");

    // Logging options
    app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error/off)")
        ->envname("TABULA_LOG_LEVEL");

    // Version flag
    app.add_flag_callback("--version", []() {
        std::cout << "Tabula version " << TABULA_VERSION << std::endl;
        std::cout << "Build type: " << TABULA_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << TABULA_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    // Parse
    CLI11_PARSE(app, argc, argv);

    // Load config file
    if (!config.config_file.empty()) {
        if (!config.load_from_file(config.config_file, app)) {
            std::cerr << "Failed to load config: " << config.config_file << std::endl;
            return EXIT_FAILURE;
        }
    }

    // Setup logging
    if (!setup_logging(config)) {
        return EXIT_FAILURE;
    }

    // Run
    try {
        return run_application(config);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }
}
