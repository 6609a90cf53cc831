// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Tabula - Logger Implementation                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "tabula/log.hpp"
#include "tabula/config.hpp"

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/color.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>
#include <string_view>

namespace tabula::log {

namespace {

std::mutex g_log_mutex;
std::atomic<Level> g_level{Level::Info};

void log_impl(Level level, std::string_view message) {
#if TABULA_ENABLE_LOGGING
    if (level < g_level.load(std::memory_order_relaxed)) {
        return;
    }

    std::lock_guard lock(g_log_mutex);

    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    const char* level_str = nullptr;
    fmt::color color = fmt::color::white;

    switch (level) {
        case Level::Trace:
            level_str = "TRACE";
            color = fmt::color::dim_gray;
            break;
        case Level::Debug:
            level_str = "DEBUG";
            color = fmt::color::gray;
            break;
        case Level::Info:
            level_str = "INFO ";
            color = fmt::color::green;
            break;
        case Level::Warn:
            level_str = "WARN ";
            color = fmt::color::yellow;
            break;
        case Level::Error:
            level_str = "ERROR";
            color = fmt::color::red;
            break;
        case Level::Off:
            return;
    }

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_val);
#else
    localtime_r(&time_t_val, &tm_buf);
#endif

    fmt::print(stderr, "{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d} ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(ms.count()));

    fmt::print(stderr, fg(color), "[{}] ", level_str);
    fmt::print(stderr, "{}\n", message);
#else
    (void)level;
    (void)message;
#endif
}

} // anonymous namespace

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

Result<Level> parse_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "off") return Level::Off;

    return Err<Level>(ErrorCode::InvalidArgument,
        fmt::format("unknown log level '{}'", name));
}

void trace(std::string_view message) {
    log_impl(Level::Trace, message);
}

void debug(std::string_view message) {
    log_impl(Level::Debug, message);
}

void info(std::string_view message) {
    log_impl(Level::Info, message);
}

void warn(std::string_view message) {
    log_impl(Level::Warn, message);
}

void error(std::string_view message) {
    log_impl(Level::Error, message);
}

} // namespace tabula::log
