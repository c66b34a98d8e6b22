#include "engine.hpp"

#include <chrono>
#include <format>
#include <stdexcept>

#include "protocol.hpp"

namespace {

// Grace period between "quit" and SIGKILL
constexpr std::chrono::milliseconds QUIT_GRACE_PERIOD{100};

}  // namespace

Engine::Engine(std::string name, int session_id)
    : name(std::move(name)), logger(this->name, session_id), process(logger) {}

Engine::~Engine() {
    stop();
}

void Engine::start(const std::string &path) {
    if (scanner || closed) {
        throw std::logic_error(std::format("engine {} cannot be started twice", name));
    }

    try {
        process.start(path);
    } catch (const EngineError &e) {
        logger.log_event(std::format("failed to spawn {}: {}", path, e.what()));
        closed = true;
        results.close();
        throw;
    }
    this->path = path;

    scanner = std::make_unique<OutputScanner>(process.take_output(), results, logger);
    scanner->start();

    logger.log_event(std::format("spawned uci engine: {}", path));
}

void Engine::stop() {
    if (closed.exchange(true)) {
        return;
    }

    // Wakes a submit_search() blocked on the queue.
    results.close();

    if (process.is_running()) {
        logger.log_to_engine("quit");
        try {
            process.write_line("quit");
        } catch (const EngineError &e) {
            logger.log_event(std::format("quit not delivered: {}", e.what()));
        }
        process.close_input();
        if (!process.wait_for_exit(QUIT_GRACE_PERIOD)) {
            logger.log_event("engine ignored quit, killing it");
        }
    }
    process.stop();

    if (scanner) {
        scanner->join();
    }
    logger.log_event("session closed");
}

const std::string &Engine::get_name() const {
    return name;
}

const std::string &Engine::get_path() const {
    return path;
}

bool Engine::is_running() const {
    return !closed && process.is_running();
}

void Engine::issue_command(const std::string &command) {
    if (closed) {
        throw EngineError(EngineErrorKind::SESSION_CLOSED,
                          std::format("engine {} is closed", name));
    }
    logger.log_to_engine(command);
    try {
        process.write_line(command);
    } catch (const EngineError &) {
        // stop() closes the pipe under a running search
        if (closed) {
            throw EngineError(EngineErrorKind::SESSION_CLOSED,
                              std::format("engine {} was closed during the search", name));
        }
        throw;
    }
}

SearchResult Engine::submit_search(const SearchJob &job) {
    std::lock_guard<std::mutex> lock(search_mutex);

    if (!scanner) {
        throw EngineError(EngineErrorKind::SESSION_CLOSED,
                          std::format("engine {} was never started", name));
    }

    // Nothing is pending while search_mutex is held; anything queued now
    // was sent by the engine unasked.
    std::string line;
    while (results.try_pop(line)) {
        logger.log_event(std::format("dropping unsolicited result: {}", line));
    }

    for (const auto &command : search_commands(job)) {
        issue_command(command);
    }

    if (!results.pop(line)) {
        if (closed) {
            throw EngineError(EngineErrorKind::SESSION_CLOSED,
                              std::format("engine {} was closed during the search", name));
        }
        throw EngineError(EngineErrorKind::CHANNEL_CLOSED,
                          std::format("engine {} stopped before reporting a best move", name));
    }

    return parse_bestmove(line);
}
