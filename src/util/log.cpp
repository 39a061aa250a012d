#include <ulidgen/log.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ulidgen::log {

// Generation may log from any thread, so level and color are atomics and
// each line is written under one lock.
static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};  // -1: not yet detected
static std::mutex s_write_mutex;

static bool color_on() {
    int c = s_color.load(std::memory_order_relaxed);
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        int expected = -1;
        s_color.compare_exchange_strong(expected, c);
        c = s_color.load(std::memory_order_relaxed);
    }
    return c == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl, std::memory_order_relaxed);
}

Level get_level() {
    return s_level.load(std::memory_order_relaxed);
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](char c) -> char {
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });
    if (lower == "trace") return Trace;
    if (lower == "debug") return Debug;
    if (lower == "info") return Info;
    if (lower == "warn" || lower == "warning") return Warn;
    if (lower == "error") return Error;
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < get_level()) return;

    va_list sizing;
    va_copy(sizing, args);
    int len = std::vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if (len < 0) return;

    std::vector<char> buf(static_cast<size_t>(len) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    const char* body = buf.data();

    bool color = color_on();
    std::lock_guard<std::mutex> lock(s_write_mutex);
    if (color) {
        std::fprintf(stderr, "%s%s\033[0m: %s\n", level_color(lvl), level_name(lvl), body);
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body);
    }
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace ulidgen::log
