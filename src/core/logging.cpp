// ============================================================================
// convq/core/logging.cpp - Leveled Diagnostic Logging
// ============================================================================

#include "convq/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <mutex>
#include <thread>

namespace convq {

namespace {

constexpr int kLevelUnset = -1;

std::atomic<int> g_level{kLevelUnset};
std::mutex g_output_mutex;
thread_local std::string t_thread_name;

LogLevel LevelFromEnv() {
    const char* env = std::getenv("CONVQ_LOG_LEVEL");
    if (env == nullptr) return LogLevel::Info;
    return Logger::ParseLevel(env).value_or(LogLevel::Info);
}

std::string ThreadTag() {
    if (!t_thread_name.empty()) return t_thread_name;
    // Short stable tag derived from the thread id
    auto hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    char buf[16];
    std::snprintf(buf, sizeof(buf), "T%04zx", hash & 0xFFFF);
    return buf;
}

}  // namespace

void Logger::SetLevel(LogLevel level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::Level() {
    int level = g_level.load(std::memory_order_relaxed);
    if (level == kLevelUnset) {
        level = static_cast<int>(LevelFromEnv());
        int expected = kLevelUnset;
        g_level.compare_exchange_strong(expected, level, std::memory_order_relaxed);
        level = g_level.load(std::memory_order_relaxed);
    }
    return static_cast<LogLevel>(level);
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!Enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::string tag = ThreadTag();

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::fprintf(stderr, "[%s.%03lld] [%-5.*s] [%s] %.*s: %.*s\n", stamp, static_cast<long long>(ms),
                 static_cast<int>(LevelName(level).size()), LevelName(level).data(), tag.c_str(),
                 static_cast<int>(component.size()), component.data(), static_cast<int>(message.size()),
                 message.data());
}

std::optional<LogLevel> Logger::ParseLevel(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "error") return LogLevel::Error;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "trace") return LogLevel::Trace;
    return std::nullopt;
}

std::string_view Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    return "UNKN";
}

void Logger::SetThreadName(std::string name) {
    t_thread_name = std::move(name);
}

}  // namespace convq
