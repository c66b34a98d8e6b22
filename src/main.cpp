#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "engine.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "search_job.hpp"
#include "time_manager.hpp"
#include "types.hpp"

// --- Global State for Session Configuration ---
std::string g_engine_path;
std::string g_engine_options;  // "name X value Y ..." sent before every search
TimeControl g_tc;               // Default 60s, no increment
std::atomic<bool> g_use_clock(false);
int g_timeout_buffer_ms = DEFAULT_TIMEOUT_BUFFER_MS;

// --- Shared Session Resources ---
std::shared_ptr<Engine> g_engine;
int g_session_count = 0;
Position g_position = Startpos{};
std::optional<TimeManager> g_clock;
std::mutex g_clock_mutex;
std::thread g_search_thread;
std::atomic<bool> g_searching(false);

// --- Search Handling ---

void run_search(std::shared_ptr<Engine> engine, SearchJob job, Color side) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        SearchResult result = engine->submit_search(job);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - start_time)
                           .count();

        if (g_use_clock) {
            std::lock_guard<std::mutex> lock(g_clock_mutex);
            if (g_clock) {
                g_clock->update(side, elapsed);
                if (g_clock->is_out_of_time(side)) {
                    send_info_string(std::format("{} is out of time ({} ms left)",
                                                 side == Color::WHITE ? "White" : "Black",
                                                 g_clock->get_time_ms(side)));
                }
            }
        }
        send_search_result(result);
    } catch (const EngineError &e) {
        send_info_string(std::format("Error: search on {} failed ({}): {}", engine->get_name(),
                                     to_string(e.kind()), e.what()));
    }
    g_searching = false;
}

void join_search() {
    if (g_search_thread.joinable()) {
        g_search_thread.join();
    }
}

// Stops the engine first so a blocked search returns, then joins it.
void close_session() {
    if (g_engine) {
        g_engine->stop();
    }
    join_search();
    g_engine.reset();
}

bool ensure_engine() {
    if (g_engine && g_engine->is_running()) {
        return true;
    }
    close_session();

    auto engine = std::make_shared<Engine>("Engine", ++g_session_count);
    try {
        engine->start(g_engine_path);
    } catch (const EngineError &e) {
        send_info_string(std::format("Error: failed to start engine ({}): {}", g_engine_path,
                                     e.what()));
        return false;
    }
    g_engine = std::move(engine);
    {
        std::lock_guard<std::mutex> lock(g_clock_mutex);
        g_clock.reset();
    }
    return true;
}

// --- Command Handling ---

void handle_bridge() {
    send_to_gui("id name EngineBridge");
    send_to_gui("id author EngineBridge developers");

    send_to_gui("option name EnginePath type string");
    send_to_gui("option name EngineOptions type string");
    send_to_gui("option name MainTimeMs type spin default 60000 min 0 max 3600000");
    send_to_gui("option name IncTimeMs type spin default 0 min 0 max 60000");
    send_to_gui("option name UseClock type check default false");
    send_to_gui("option name TimeoutBufferMs type spin default 5000 min 0 max 60000");
    send_to_gui("option name Logging type check default true");
    send_to_gui("option name LogDir type string");

    send_to_gui("bridgeok");
}

void handle_setoption(const std::string &line) {
    std::stringstream ss(line);
    std::string token, name_token, option_name, value_token, option_value;
    ss >> token >> name_token >> option_name >> value_token;
    std::getline(ss, option_value);
    // Trim leading space from value
    if (!option_value.empty() && option_value.front() == ' ') {
        option_value.erase(0, 1);
    }

    if (name_token != "name" || value_token != "value") return;

    try {
        if (option_name == "EnginePath")
            g_engine_path = option_value;
        else if (option_name == "EngineOptions")
            g_engine_options = option_value;
        else if (option_name == "MainTimeMs")
            g_tc.wtime_ms = g_tc.btime_ms = std::stoi(option_value);
        else if (option_name == "IncTimeMs")
            g_tc.winc_ms = g_tc.binc_ms = std::stoi(option_value);
        else if (option_name == "UseClock")
            g_use_clock = (option_value == "true");
        else if (option_name == "TimeoutBufferMs")
            g_timeout_buffer_ms = std::stoi(option_value);
        else if (option_name == "Logging")
            LoggerConfig::set_enabled(option_value == "true");
        else if (option_name == "LogDir")
            LoggerConfig::set_directory(option_value);
        else
            send_info_string(std::format("Warning: unknown option {}", option_name));
    } catch (const std::exception &) {
        send_info_string(std::format("Error: bad value '{}' for {}", option_value, option_name));
        return;
    }

    // Clock settings take effect on the next search
    if (option_name == "MainTimeMs" || option_name == "IncTimeMs" ||
        option_name == "TimeoutBufferMs" || option_name == "UseClock") {
        std::lock_guard<std::mutex> lock(g_clock_mutex);
        g_clock.reset();
    }
}

// position startpos [moves m1 m2 ...] | position fen <fen fields> [moves m1 m2 ...]
void handle_position(const std::string &line) {
    std::stringstream ss(line);
    std::string token, kind;
    ss >> token >> kind;

    std::optional<std::string> fen;
    if (kind == "fen") {
        std::string fen_str;
        while (ss >> token && token != "moves") {
            if (!fen_str.empty()) fen_str += ' ';
            fen_str += token;
        }
        if (fen_str.empty()) {
            send_info_string("Error: position fen needs a FEN string");
            return;
        }
        fen = fen_str;
    } else if (kind == "startpos") {
        ss >> token;
    } else {
        send_info_string(std::format("Error: unknown position type '{}'", kind));
        return;
    }

    std::vector<std::string> moves;
    if (token == "moves") {
        while (ss >> token) {
            moves.push_back(token);
        }
    }
    g_position = make_position(fen, moves);
}

void handle_go(const std::string &line) {
    if (g_searching) {
        send_info_string("Error: a search is already running");
        return;
    }
    if (!ensure_engine()) {
        return;
    }
    join_search();

    SearchJob job;
    job.set_engine_options(g_engine_options).set_position(g_position);

    Color side = side_to_move(g_position);
    if (g_use_clock) {
        std::lock_guard<std::mutex> lock(g_clock_mutex);
        if (!g_clock) {
            g_clock.emplace(g_tc, g_timeout_buffer_ms);
        }
        job.apply_time_control(g_clock->current());
    } else {
        job.apply_time_control(g_tc);
    }

    // Explicit limits on the go line win over the clock
    std::string go_args;
    if (std::size_t pos = line.find("go"); pos != std::string::npos) {
        go_args = line.substr(pos + 2);
    }
    job.set_go_options(go_args);

    g_searching = true;
    g_search_thread = std::thread(run_search, g_engine, std::move(job), side);
}

int main([[maybe_unused]] int argc, [[maybe_unused]] char *argv[]) {
    std::string line;
    while (std::getline(std::cin, line)) {
        std::stringstream ss(line);
        std::string command;
        ss >> command;

        if (line.empty()) continue;

        if (command == "bridge") {
            handle_bridge();
        } else if (command == "setoption") {
            handle_setoption(line);
        } else if (command == "isready") {
            if (g_engine_path.empty()) {
                send_info_string("Error: Engine path is not set.");
            } else if (ensure_engine()) {
                send_to_gui("readyok");
            }
        } else if (command == "position") {
            handle_position(line);
        } else if (command == "go") {
            if (g_engine_path.empty()) {
                send_info_string("Error: Engine path is not set.");
            } else {
                handle_go(line);
            }
        } else if (command == "close") {
            close_session();
            send_info_string("Engine session closed.");
        } else if (command == "quit") {
            break;
        } else {
            send_info_string(std::format("Unknown command: {}", command));
        }
    }
    close_session();
    return 0;
}
