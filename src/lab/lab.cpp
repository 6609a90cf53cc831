// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Guided Lab Harness Implementation                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/lab.hpp"
#include "tabula/log.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <exception>
#include <ostream>
#include <string>
#include <utility>

namespace tabula::lab {

namespace {

constexpr unsigned int kCyan = 0x00CED1;
constexpr unsigned int kGreen = 0x32CD32;
constexpr unsigned int kYellow = 0xFFD700;
constexpr unsigned int kRed = 0xFF4500;
constexpr unsigned int kGray = 0x808080;

} // anonymous namespace

void todo(std::string_view hint) {
    throw TodoError(std::string(hint));
}

Lab::Lab(std::ostream& out)
    : Lab(out, Options{})
{
}

Lab::Lab(std::ostream& out, Options options)
    : out_(out)
    , options_(std::move(options))
    , renderer_(options_.render)
{
}

std::string Lab::paint(std::string_view text, unsigned int rgb) const {
    if (!options_.color) {
        return std::string(text);
    }
    return fmt::format(fg(fmt::rgb(rgb)) | fmt::emphasis::bold, "{}", text);
}

// ==============================================================================
// Structure
// ==============================================================================

void Lab::section(std::string_view title, const std::function<void()>& body) {
    out_ << '\n' << paint(fmt::format("=== {} ===", title), kCyan) << '\n';
    log::debug("Entering section '{}'", title);

    body();
}

void Lab::exercise(std::string_view title, const std::function<void()>& body) {
    out_ << '\n' << paint(fmt::format("+++ Exercise: {}", title), kCyan) << '\n';

    in_exercise_ = true;
    exercise_failed_ = false;

    try {
        body();
        if (exercise_failed_) {
            ++summary_.failed;
            out_ << paint(fmt::format("--- {}: FAILED", title), kRed) << '\n';
        } else {
            ++summary_.passed;
            out_ << paint(fmt::format("--- {}: passed", title), kGreen) << '\n';
        }
    } catch (const TodoError& e) {
        ++summary_.pending;
        out_ << paint(fmt::format("--- {}: TODO ({})", title, e.what()), kYellow) << '\n';
    } catch (const std::exception& e) {
        ++summary_.failed;
        out_ << paint(fmt::format("--- {}: ERROR {}", title, e.what()), kRed) << '\n';
        log::warn("Exercise '{}' threw: {}", title, e.what());
    }

    in_exercise_ = false;
}

void Lab::exercise_ignore(std::string_view title, const std::function<void()>& /*body*/) {
    ++summary_.ignored;
    out_ << '\n' << paint(fmt::format("+++ Exercise: {} (ignored)", title), kGray) << '\n';
}

// ==============================================================================
// Reporting
// ==============================================================================

void Lab::comment(std::string_view text) {
    out_ << paint(fmt::format(">>> {}", text), kGray) << '\n';
}

bool Lab::check(bool condition, std::string_view expression, const char* file, int line) {
    if (condition) {
        ++summary_.checks_passed;
        out_ << paint("    OK", kGreen) << ' ' << expression << '\n';
        return true;
    }

    ++summary_.checks_failed;
    if (in_exercise_) {
        exercise_failed_ = true;
    }
    out_ << paint("    FAILED", kRed) << ' ' << expression
         << fmt::format(" ({}:{})", file, line) << '\n';
    return false;
}

void Lab::display(const ResultSet& result) {
    if (auto status = renderer_.print(out_, result); !status) {
        out_ << paint(fmt::format("    cannot display result: {}", status.error().to_string()), kRed) << '\n';
        if (in_exercise_) {
            exercise_failed_ = true;
        }
    }
}

void Lab::display_rows(const std::vector<Row>& rows) {
    if (auto status = renderer_.print(out_, rows); !status) {
        out_ << paint(fmt::format("    cannot display rows: {}", status.error().to_string()), kRed) << '\n';
        if (in_exercise_) {
            exercise_failed_ = true;
        }
    }
}

void Lab::print_summary() {
    out_ << '\n'
         << fmt::format("Exercises: {} passed, {} failed, {} todo, {} ignored",
                summary_.passed, summary_.failed, summary_.pending, summary_.ignored)
         << '\n'
         << fmt::format("Checks:    {} passed, {} failed",
                summary_.checks_passed, summary_.checks_failed)
         << '\n';
}

} // namespace tabula::lab
