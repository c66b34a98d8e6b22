#include "output_scanner.hpp"

#include <stdio.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

#include "protocol.hpp"

OutputScanner::OutputScanner(FileHandle output, BlockingQueue<std::string> &results,
                             Logger &logger)
    : output_(std::move(output)), results_(results), logger_(logger) {}

OutputScanner::~OutputScanner() {
    join();
    std::free(line_buffer_);
}

void OutputScanner::start() {
    reader_ = std::thread(&OutputScanner::run, this);
}

void OutputScanner::join() {
    if (reader_.joinable()) {
        reader_.join();
    }
}

// Lines of any length and content, NUL bytes included; a final line
// without newline still counts.
bool OutputScanner::read_line(std::string &line) {
    ssize_t len = getline(&line_buffer_, &line_capacity_, output_.get());
    if (len == -1) {
        read_errno_ = ferror(output_.get()) ? errno : 0;
        return false;
    }
    line.assign(line_buffer_, static_cast<std::size_t>(len));

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return true;
}

void OutputScanner::run() {
    if (!output_) {
        logger_.log_event("reader has no output stream");
        results_.close();
        return;
    }

    std::string line;
    while (read_line(line)) {
        logger_.log_from_engine(line);
        if (is_bestmove_line(line)) {
            results_.push(line);
        }
    }

    if (read_errno_ != 0) {
        logger_.log_event(std::format("reader err: {}", std::strerror(read_errno_)));
    } else {
        logger_.log_event("reader ok: end of engine output");
    }
    output_.reset();
    results_.close();
}
