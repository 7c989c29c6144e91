// =============================================================================
// log.cpp - Leveled Logger
// =============================================================================

#include "tenex/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace tenex {
namespace log {

namespace {

std::atomic<Level> g_level{Level::INFO};
std::mutex g_mutex;
std::ostream* g_stream = &std::cerr;

} // namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl != Level::OFF && lvl >= level();
}

void set_stream(std::ostream& out) {
    std::lock_guard lock(g_mutex);
    g_stream = &out;
}

void reset_stream() {
    std::lock_guard lock(g_mutex);
    g_stream = &std::cerr;
}

std::optional<Level> parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    return std::nullopt;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::OFF: return "off";
    }
    return "unknown";
}

void write(Level lvl, std::string_view component, std::string_view message) {
    if (!enabled(lvl)) return;

    std::lock_guard lock(g_mutex);
    *g_stream << "[" << level_name(lvl) << "] " << component << ": " << message << "\n";
}

} // namespace log
} // namespace tenex
