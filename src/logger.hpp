#pragma once

#include <atomic>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

// --- Global Configuration ---
// This class provides global control over logging functionality.
// Usage:
//   LoggerConfig::set_enabled(true);   // Enable all logging
//   LoggerConfig::set_enabled(false);  // Disable all logging
//   LoggerConfig::set_directory("logs");
class LoggerConfig {
   private:
    static std::atomic<bool> enabled;  // read by reader and watcher threads
    static std::string directory;

   public:
    // Enable or disable global logging
    // When disabled, no log files will be created and no logging will occur
    static void set_enabled(bool enable);

    // Check if logging is currently enabled
    static bool is_enabled();

    // Directory new log files are created in; "." by default
    static void set_directory(const std::string &dir);
    static const std::string &get_directory();
};

// --- File Logging ---
// Logger for one engine session: traffic in both directions plus lifecycle
// events. The caller, output reader and exit watcher threads share one
// instance, so every write is serialized.
// Respects the global LoggerConfig setting - if logging is disabled,
// no files will be created and no logging will occur.

class Logger {
   private:
    std::ofstream log_file;
    std::string engine_name;
    std::mutex file_mutex;

    void write(const std::string &entry);

   public:
    // Create a logger for the specified engine name
    // If global logging is disabled, no log file will be created
    Logger(const std::string &name, int session_id = 0);
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    // Log a message sent to the engine
    void log_to_engine(const std::string &message);

    // Log a message received from the engine
    void log_from_engine(const std::string &message);

    // Log a session event (spawn, exit status, reader shutdown)
    void log_event(const std::string &message);

    bool is_open() const;

    // Builds the log file path for a session
    static std::string file_name(const std::string &name, int session_id);
};
