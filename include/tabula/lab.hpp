// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Guided Lab Harness                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/result_set.hpp"
#include "tabula/table_renderer.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tabula::lab {

/// Thrown by todo() where the learner still has a blank to fill in
class TodoError : public std::logic_error {
public:
    explicit TodoError(const std::string& what) : std::logic_error(what) {}
};

/// Mark an unfinished part of an exercise
[[noreturn]] void todo(std::string_view hint = "not implemented yet");

/// Walks a learner through sections and exercises, printing progress
class Lab {
public:
    struct Options {
        bool color = true;
        RenderOptions render;
    };

    struct Summary {
        std::size_t passed = 0;
        std::size_t failed = 0;
        std::size_t pending = 0;
        std::size_t ignored = 0;
        std::size_t checks_passed = 0;
        std::size_t checks_failed = 0;

        [[nodiscard]] bool all_passed() const noexcept { return failed == 0 && pending == 0; }
    };

    explicit Lab(std::ostream& out);
    Lab(std::ostream& out, Options options);

    Lab(const Lab&) = delete;
    Lab& operator=(const Lab&) = delete;

    // ==========================================================================
    // Structure
    // ==========================================================================

    void section(std::string_view title, const std::function<void()>& body);

    /// Runs the body; TodoError counts as pending, other exceptions as failed
    void exercise(std::string_view title, const std::function<void()>& body);

    /// Announces the exercise without running it
    void exercise_ignore(std::string_view title, const std::function<void()>& body);

    // ==========================================================================
    // Reporting
    // ==========================================================================

    void comment(std::string_view text);

    bool check(bool condition, std::string_view expression, const char* file, int line);

    /// Render rows as a table on the lab's stream
    void display(const ResultSet& result);
    void display_rows(const std::vector<Row>& rows);

    [[nodiscard]] const Summary& summary() const noexcept { return summary_; }
    void print_summary();

    [[nodiscard]] std::ostream& out() noexcept { return out_; }

private:
    [[nodiscard]] std::string paint(std::string_view text, unsigned int rgb) const;

    std::ostream& out_;
    Options options_;
    TableRenderer renderer_;
    Summary summary_;

    bool in_exercise_ = false;
    bool exercise_failed_ = false;
};

/// The education.user table: id text, name text, age int
[[nodiscard]] ResultSet sample_users();

/// Display, constrained query, lookups by id, JSON view
void run_guided_lab(Lab& lab, const ResultSet& users);

} // namespace tabula::lab

#define TABULA_CHECK(lab, expr) (lab).check(static_cast<bool>(expr), #expr, __FILE__, __LINE__)
