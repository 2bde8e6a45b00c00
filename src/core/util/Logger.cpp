#include "wxdown/core/util/Logger.h"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <string>
#include <utility>

namespace wxdown::core::util {
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    if (mirror) std::fclose(mirror);
}

bool Logger::mirror_to_file(const std::filesystem::path& path) {
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) return false;
    std::lock_guard lock(guard);
    if (mirror) std::fclose(mirror);
    mirror = f;
    return true;
}

Logger::Level Logger::parse_level(std::string_view name) {
    static constexpr std::pair<std::string_view, Level> names[] = {
        { "trace", Level::trace }, { "debug", Level::debug }, { "info", Level::info },
        { "warn", Level::warn }, { "warning", Level::warn }, { "error", Level::error },
        { "critical", Level::critical },
    };
    for (auto& [n, l] : names) {
        if (n == name) return l;
    }
    return Level::info;
}

const char* Logger::label(Level level) {
    switch (level) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::error: return "ERROR";
        case Level::critical: return "CRIT";
    }
    return "?";
}

void Logger::log(Level level, std::string_view message) {
    if (!enabled(level)) return;
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::string line = fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03d} [{}] {}\n",
                                   fmt::localtime(std::chrono::system_clock::to_time_t(now)), ms, label(level), message);
    std::lock_guard lock(guard);
    std::fputs(line.c_str(), stdout);
    std::fflush(stdout);
    if (mirror) {
        std::fputs(line.c_str(), mirror);
        std::fflush(mirror);
    }
}

void log_debug(std::string_view message) { Logger::instance().log(Logger::Level::debug, message); }
void log_info(std::string_view message) { Logger::instance().log(Logger::Level::info, message); }
void log_warn(std::string_view message) { Logger::instance().log(Logger::Level::warn, message); }
void log_error(std::string_view message) { Logger::instance().log(Logger::Level::error, message); }
}
