#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "blocking_queue.hpp"
#include "engine_error.hpp"
#include "engine_process.hpp"
#include "logger.hpp"
#include "output_scanner.hpp"
#include "search_job.hpp"
#include "types.hpp"

// --- Engine Session ---

// One UCI engine process and the searches submitted to it.
// submit_search() blocks its caller until the engine answers with
// "bestmove"; calls are serialized so each result belongs to its request.
// A session runs from start() until stop() or engine exit and cannot be restarted.
class Engine {
   private:
    std::string name;
    std::string path;
    Logger logger;
    EngineProcess process;
    BlockingQueue<std::string> results;
    std::unique_ptr<OutputScanner> scanner;
    std::mutex search_mutex;
    std::atomic<bool> closed{false};

    void issue_command(const std::string &command);

   public:
    Engine(std::string name, int session_id = 0);
    ~Engine();

    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;

    // Spawns the engine. Throws EngineError on spawn failure.
    void start(const std::string &path);

    // Ends the session: in-flight and later searches fail with SESSION_CLOSED,
    // the engine gets "quit" and is killed if it does not exit promptly.
    void stop();

    const std::string &get_name() const;
    const std::string &get_path() const;
    bool is_running() const;

    // Sends the job's setoption, position and go commands and waits for the
    // engine's bestmove. Throws EngineError (WRITE_FAILURE, CHANNEL_CLOSED,
    // SESSION_CLOSED).
    SearchResult submit_search(const SearchJob &job);
};
