#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "logger.hpp"

// --- Engine Process Management ---

struct FileCloser {
    void operator()(FILE *file) const { std::fclose(file); }
};

// Owned stdio stream; closed when the handle goes away.
using FileHandle = std::unique_ptr<FILE, FileCloser>;

// Child engine process with piped stdin/stdout. stderr is inherited.
// A watcher thread reaps the child and logs its exit status.
class EngineProcess {
   private:
    Logger &logger_;

    FileHandle engine_pipe_write_;
    FileHandle engine_pipe_read_;
    pid_t pid_ = -1;
    std::mutex write_mutex_;

    std::thread watcher_;
    mutable std::mutex state_mutex_;
    std::condition_variable exit_cv_;
    bool exited_ = false;
    int exit_status_ = 0;

    void watch_exit();

   public:
    explicit EngineProcess(Logger &logger);
    ~EngineProcess();

    EngineProcess(const EngineProcess &) = delete;
    EngineProcess &operator=(const EngineProcess &) = delete;

    // Spawns path with no arguments; bare names are resolved on PATH.
    // Throws EngineError (SPAWN_FAILURE, STDIO_UNAVAILABLE) and leaves no
    // child behind on failure.
    void start(const std::string &path);

    // Hands the stdout read stream to its single reader. Empty after the first call.
    FileHandle take_output();

    // Writes line plus newline and flushes. Throws EngineError(WRITE_FAILURE).
    void write_line(const std::string &line);

    // Closes the child's stdin; later writes fail.
    void close_input();

    // Waits up to timeout for the child to exit. True once it has.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    // Kills a still-running child, joins the watcher and releases handles.
    void stop();

    bool is_running() const;

    // Human readable exit status, empty while running
    std::string exit_description() const;
};
