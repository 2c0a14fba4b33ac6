// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/logging.h"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace core {

namespace {

struct LevelName {
    LogLevel         level;
    std::string_view name;
};

// First entry per level is the canonical spelling.
constexpr std::array<LevelName, 9> LEVEL_NAMES{{
    {LogLevel::TRACE, "trace"},
    {LogLevel::DEBUG, "debug"},
    {LogLevel::INFO,  "info"},
    {LogLevel::WARN,  "warn"},
    {LogLevel::WARN,  "warning"},
    {LogLevel::ERR,   "error"},
    {LogLevel::FATAL, "fatal"},
    {LogLevel::OFF,   "off"},
    {LogLevel::OFF,   "none"},
}};

struct CategoryName {
    LogCategory      cat;
    std::string_view name;
};

constexpr std::array<CategoryName, 6> CATEGORY_NAMES{{
    {LogCategory::FEES,    "FEES"},
    {LogCategory::STORAGE, "STORAGE"},
    {LogCategory::CHAIN,   "CHAIN"},
    {LogCategory::CRYPTO,  "CRYPTO"},
    {LogCategory::CONFIG,  "CONFIG"},
    {LogCategory::BENCH,   "BENCH"},
}};

bool equals_lower(std::string_view input, std::string_view lower) {
    if (input.size() != lower.size()) return false;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(input[i])) != lower[i]) {
            return false;
        }
    }
    return true;
}

/// "YYYY-MM-DD HH:MM:SS.mmm", UTC.
std::string utc_timestamp() {
    using Clock = std::chrono::system_clock;
    auto now = Clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::time_t t = Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    int n = std::snprintf(buf, sizeof(buf),
                          "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                          tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                          tm.tm_hour, tm.tm_min, tm.tm_sec,
                          static_cast<int>(millis));
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

std::string_view log_level_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

bool parse_log_level(std::string_view name, LogLevel& out) {
    for (const auto& entry : LEVEL_NAMES) {
        if (equals_lower(name, entry.name)) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

std::string_view log_category_string(LogCategory cat) noexcept {
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits == 0) return "NONE";
    if (bits == static_cast<uint32_t>(LogCategory::ALL)) return "ALL";

    uint32_t lowest = bits & (~bits + 1u);
    for (const auto& entry : CATEGORY_NAMES) {
        if (static_cast<uint32_t>(entry.cat) == lowest) return entry.name;
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger the_logger;
    return the_logger;
}

Logger::Logger() {
    buffer_.reserve(BUFFER_FLUSH_THRESHOLD * 2);
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_release);
}

void Logger::enable_category(LogCategory cat) {
    enabled_categories_.fetch_or(static_cast<uint32_t>(cat),
                                 std::memory_order_release);
}

void Logger::disable_category(LogCategory cat) {
    enabled_categories_.fetch_and(~static_cast<uint32_t>(cat),
                                  std::memory_order_release);
}

LogLevel Logger::level() const noexcept {
    return static_cast<LogLevel>(level_.load(std::memory_order_acquire));
}

LogCategory Logger::enabled_categories() const noexcept {
    return static_cast<LogCategory>(
        enabled_categories_.load(std::memory_order_acquire));
}

bool Logger::will_log(LogLevel lvl, LogCategory cat) const noexcept {
    if (static_cast<int>(lvl) < level_.load(std::memory_order_acquire)) {
        return false;
    }
    // Uncategorised messages pass every category filter.
    uint32_t bits = static_cast<uint32_t>(cat);
    if (bits != 0 &&
        (enabled_categories_.load(std::memory_order_acquire) & bits) == 0) {
        return false;
    }
    return print_to_console_.load(std::memory_order_acquire) ||
           print_to_file_.load(std::memory_order_acquire);
}

void Logger::set_print_to_console(bool enable) {
    print_to_console_.store(enable, std::memory_order_release);
}

void Logger::set_print_to_file(bool enable) {
    print_to_file_.store(enable, std::memory_order_release);
}

void Logger::set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (file_stream_.is_open()) {
        drain_locked(true);
        file_stream_.close();
    }
    buffer_.clear();
    if (path.empty()) return;

    file_stream_.open(path, std::ios::out | std::ios::app);
    if (!file_stream_.is_open()) {
        // Nowhere to write: stop accepting file output instead of
        // buffering it forever.
        print_to_file_.store(false, std::memory_order_release);
        std::cerr << "Logger: cannot open log file " << path << "\n";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    drain_locked(true);
    std::cerr.flush();
}

void Logger::drain_locked(bool sync) {
    if (!file_stream_.is_open()) {
        buffer_.clear();
        return;
    }
    if (!buffer_.empty()) {
        file_stream_.write(buffer_.data(),
                           static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
    }
    if (sync) file_stream_.flush();
}

std::string Logger::format_line(LogLevel lvl, LogCategory cat,
                                std::string_view message) {
    std::string line;
    line.reserve(48 + message.size());
    line.append("[").append(utc_timestamp()).append("] [");
    line.append(log_level_string(lvl)).append("] [");
    line.append(log_category_string(cat)).append("] ");
    line.append(message);
    line.push_back('\n');
    return line;
}

void Logger::write(LogLevel lvl, LogCategory cat, std::string_view message) {
    std::string line = format_line(lvl, cat, message);
    bool urgent = static_cast<int>(lvl) >= static_cast<int>(LogLevel::WARN);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (print_to_console_.load(std::memory_order_relaxed)) {
        std::cerr.write(line.data(), static_cast<std::streamsize>(line.size()));
        if (urgent) std::cerr.flush();
    }

    if (print_to_file_.load(std::memory_order_relaxed) &&
        file_stream_.is_open()) {
        buffer_ += line;
        // Warnings and errors reach the disk before write() returns.
        if (urgent || buffer_.size() >= BUFFER_FLUSH_THRESHOLD) {
            drain_locked(urgent);
        }
    }
}

} // namespace core
