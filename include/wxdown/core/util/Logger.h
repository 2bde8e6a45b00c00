#pragma once
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <string_view>

namespace wxdown::core::util {
// Process-wide leveled logger. Lines go to stdout and, once mirror_to_file()
// succeeded, are appended to that file as well.
class Logger {
public:
    enum class Level { trace, debug, info, warn, error, critical };
    static Logger& instance();

    void set_level(Level new_level) { current_level.store(new_level); }
    Level level() const { return current_level.load(); }
    bool enabled(Level level) const { return static_cast<int>(level) >= static_cast<int>(current_level.load()); }
    bool mirror_to_file(const std::filesystem::path& path);
    void log(Level level, std::string_view message);

    // Unknown names map to info.
    static Level parse_level(std::string_view name);
    static const char* label(Level level);
private:
    Logger() = default;
    ~Logger();
    std::mutex guard;
    std::atomic<Level> current_level { Level::info };
    std::FILE* mirror { nullptr };
};

void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warn(std::string_view message);
void log_error(std::string_view message);
}
