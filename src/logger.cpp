#include "logger.hpp"

#include <filesystem>

// Initialize static members
std::atomic<bool> LoggerConfig::enabled(true);
std::string LoggerConfig::directory = ".";

void LoggerConfig::set_enabled(bool enable) {
    enabled = enable;
}

bool LoggerConfig::is_enabled() {
    return enabled;
}

void LoggerConfig::set_directory(const std::string &dir) {
    directory = dir.empty() ? "." : dir;
}

const std::string &LoggerConfig::get_directory() {
    return directory;
}

std::string Logger::file_name(const std::string &name, int session_id) {
    std::filesystem::path path(LoggerConfig::get_directory());
    path /= std::format("engine_debug_{}_session{}.log", name, session_id);
    return path.string();
}

Logger::Logger(const std::string &name, int session_id) : engine_name(name) {
    // Only create log file if logging is enabled
    if (!LoggerConfig::is_enabled()) {
        return;
    }

    log_file.open(file_name(name, session_id), std::ios::app);
    if (log_file.is_open()) {
        log_file << std::format("[{}] Engine debug log started\n", engine_name) << std::flush;
    }
}

Logger::~Logger() {
    if (log_file.is_open()) {
        log_file.close();
    }
}

void Logger::write(const std::string &entry) {
    // Only log if logging is enabled and file is open
    if (!LoggerConfig::is_enabled()) {
        return;
    }
    std::lock_guard<std::mutex> lock(file_mutex);
    if (log_file.is_open()) {
        log_file << entry << std::flush;
    }
}

void Logger::log_to_engine(const std::string &message) {
    write(std::format("[TO {}]: {}\n", engine_name, message));
}

void Logger::log_from_engine(const std::string &message) {
    write(std::format("[FROM {}]: {}\n", engine_name, message));
}

void Logger::log_event(const std::string &message) {
    write(std::format("[{}] {}\n", engine_name, message));
}

bool Logger::is_open() const {
    return log_file.is_open();
}
