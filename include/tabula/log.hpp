// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Logger Header                                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "tabula/types.hpp"

#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace tabula::log {

enum class Level { Trace, Debug, Info, Warn, Error, Off };

/// Messages below the threshold are dropped (default: Info)
void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

/// "trace", "debug", "info", "warn", "error" or "off"
[[nodiscard]] Result<Level> parse_level(std::string_view name);

void trace(std::string_view message);
void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

template<typename... Args>
void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    if (level() <= Level::Trace) {
        trace(fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (level() <= Level::Debug) {
        debug(fmt::format(fmt, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void info(fmt::format_string<Args...> fmt, Args&&... args) {
    info(fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    warn(fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void error(fmt::format_string<Args...> fmt, Args&&... args) {
    error(fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace tabula::log
