#include "utils/logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <thread>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Logger::Level Logger::current_level_ = Logger::Level::INFO;
std::string Logger::log_file_path_;
std::ofstream Logger::log_stream_;
size_t Logger::bytes_written_ = 0;
std::mutex Logger::log_mutex_;
size_t Logger::max_file_size_ = 10 * 1024 * 1024;
bool Logger::rotate_logs_ = true;

void Logger::set_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    current_level_ = level;
}

Logger::Level Logger::get_level() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return current_level_;
}

void Logger::set_log_file(const std::string& filepath, size_t max_size, bool rotate) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (log_stream_.is_open()) {
        log_stream_.close();
    }

    log_file_path_ = filepath;
    max_file_size_ = max_size;
    rotate_logs_ = rotate;
    bytes_written_ = 0;

    if (log_file_path_.empty()) {
        return;
    }

    std::error_code ec;
    fs::path parent = fs::path(log_file_path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent << ": " << ec.message() << std::endl;
        }
    }

    if (!open_log_stream()) {
        std::cerr << "Cannot open log file " << log_file_path_ << ", logging to console only" << std::endl;
        log_file_path_.clear();
    }
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_stream_.is_open()) {
        log_stream_.close();
    }
    log_file_path_.clear();
    bytes_written_ = 0;
}

std::string Logger::get_log_file() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_stream_.is_open()) {
        log_stream_.flush();
    }
    return log_file_path_;
}

Logger::Level Logger::level_from_string(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return Level::INFO;
}

std::string Logger::level_to_string(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO";
        case Level::WARN: return "WARN";
        case Level::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return out.str();
}

std::string Logger::format_entry(Level level, const std::string& message) {
    std::ostringstream out;
    out << '[' << get_timestamp() << "] [" << level_to_string(level) << "] [" << std::this_thread::get_id()
        << "] " << message;
    return out.str();
}

bool Logger::open_log_stream() {
    log_stream_.open(log_file_path_, std::ios::out | std::ios::app);
    if (!log_stream_.is_open()) {
        return false;
    }

    std::error_code ec;
    auto existing = fs::file_size(log_file_path_, ec);
    bytes_written_ = ec ? 0 : static_cast<size_t>(existing);
    return true;
}

// <path>.N-1 -> <path>.N, ..., <path> -> <path>.1; the oldest backup is dropped
void Logger::rotate_log_file() {
    log_stream_.close();

    std::error_code ec;
    fs::remove(log_file_path_ + "." + std::to_string(MAX_BACKUP_FILES), ec);
    for (int i = MAX_BACKUP_FILES - 1; i >= 1; --i) {
        std::string from = log_file_path_ + "." + std::to_string(i);
        if (fs::exists(from, ec)) {
            fs::rename(from, log_file_path_ + "." + std::to_string(i + 1), ec);
        }
    }

    fs::rename(log_file_path_, log_file_path_ + ".1", ec);
    if (ec) {
        std::cerr << "Error rotating log file " << log_file_path_ << ": " << ec.message() << std::endl;
    }

    if (!open_log_stream()) {
        std::cerr << "Cannot reopen log file " << log_file_path_ << " after rotation" << std::endl;
    }
}

void Logger::write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (level < current_level_) {
        return;
    }

    const std::string entry = format_entry(level, message);

    if (level >= Level::WARN) {
        std::cerr << entry << std::endl;
    } else {
        std::cout << entry << std::endl;
    }

    if (!log_stream_.is_open()) {
        return;
    }

    if (rotate_logs_ && bytes_written_ + entry.size() + 1 > max_file_size_) {
        rotate_log_file();
        if (!log_stream_.is_open()) {
            return;
        }
    }

    log_stream_ << entry << '\n';
    log_stream_.flush();
    bytes_written_ += entry.size() + 1;
}

void Logger::debug(const std::string& message) { write(Level::DEBUG, message); }
void Logger::info(const std::string& message) { write(Level::INFO, message); }
void Logger::warn(const std::string& message) { write(Level::WARN, message); }
void Logger::error(const std::string& message) { write(Level::ERROR, message); }

void Logger::debug(const std::string& context, const std::string& message) {
    write(Level::DEBUG, "[" + context + "] " + message);
}

void Logger::info(const std::string& context, const std::string& message) {
    write(Level::INFO, "[" + context + "] " + message);
}

void Logger::warn(const std::string& context, const std::string& message) {
    write(Level::WARN, "[" + context + "] " + message);
}

void Logger::error(const std::string& context, const std::string& message) {
    write(Level::ERROR, "[" + context + "] " + message);
}
