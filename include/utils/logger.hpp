#pragma once
#include <string>
#include <mutex>
#include <fstream>
#include <cstddef>

// Process-wide logger: console plus an optional size-rotated file
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    static void set_level(Level level);
    static Level get_level();

    // Empty path logs to the console only. Rotated files are kept as <path>.1 .. <path>.N
    static void set_log_file(const std::string& filepath, size_t max_size = 10 * 1024 * 1024, bool rotate = true);
    static void close_log_file();

    // Current log file path, empty when logging to the console only
    static std::string get_log_file();

    // Accepts "debug", "info", "warn"/"warning", "error" in any case; anything else is INFO
    static Level level_from_string(const std::string& level);
    static std::string level_to_string(Level level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Context-tagged variants: "[context] message"
    static void debug(const std::string& context, const std::string& message);
    static void info(const std::string& context, const std::string& message);
    static void warn(const std::string& context, const std::string& message);
    static void error(const std::string& context, const std::string& message);

private:
    static constexpr int MAX_BACKUP_FILES = 5;

    static Level current_level_;
    static std::string log_file_path_;
    static std::ofstream log_stream_;
    static size_t bytes_written_;
    static std::mutex log_mutex_;
    static size_t max_file_size_;
    static bool rotate_logs_;

    static void write(Level level, const std::string& line);
    static std::string format_entry(Level level, const std::string& message);
    static std::string get_timestamp();
    static bool open_log_stream();
    static void rotate_log_file();
};
