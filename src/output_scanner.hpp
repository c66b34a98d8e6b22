#pragma once

#include <cstddef>
#include <string>
#include <thread>

#include "blocking_queue.hpp"
#include "engine_process.hpp"
#include "logger.hpp"

// --- Engine Output Reader ---

// Reads engine stdout on its own thread. Lines starting with "bestmove" are
// pushed into the result queue, everything else is logged and dropped.
// The queue is closed when the stream ends, which is how waiting callers
// learn that no more results will come.
class OutputScanner {
   private:
    FileHandle output_;
    BlockingQueue<std::string> &results_;
    Logger &logger_;
    std::thread reader_;

    // getline(3) buffer, reused for every line
    char *line_buffer_ = nullptr;
    std::size_t line_capacity_ = 0;
    int read_errno_ = 0;

    bool read_line(std::string &line);
    void run();

   public:
    OutputScanner(FileHandle output, BlockingQueue<std::string> &results, Logger &logger);
    ~OutputScanner();

    OutputScanner(const OutputScanner &) = delete;
    OutputScanner &operator=(const OutputScanner &) = delete;

    void start();

    // Returns once the stream has ended and the queue is closed
    void join();
};
