// =============================================================================
// log.cpp - Leveled diagnostics on std::clog
// =============================================================================

#include "zap/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace zap {
namespace log {

namespace {

std::atomic<Level> g_level{Level::INFO};

// Global mutex for synchronized console output
std::mutex io_mu;

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

Level parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw std::invalid_argument("unknown log level: " + std::string(name));
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
    return "?";
}

void write(Level lvl, std::string_view msg) {
    if (!enabled(lvl)) return;

    std::lock_guard<std::mutex> lk(io_mu);
    std::clog << "[zap] " << level_name(lvl) << " " << msg << '\n';
}

} // namespace log
} // namespace zap
