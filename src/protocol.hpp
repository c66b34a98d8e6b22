#pragma once

#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "search_job.hpp"
#include "types.hpp"

// --- UCI Wire Format ---

std::string setoption_command(const std::string &name, const std::string &value);
std::string position_command(const Position &position);
std::string go_command(const OptionMap &go_options);

// Every command of one search in send order: setoption..., position, go
std::vector<std::string> search_commands(const SearchJob &job);

// True when the first 8 bytes of the line are "bestmove"
bool is_bestmove_line(std::string_view line);

// Splits "bestmove <move> [ponder <move>]" on single spaces.
// Token 1 is the best move, token 3 the ponder move, when present.
SearchResult parse_bestmove(std::string_view line);

// --- Console Output ---

// Global mutex for thread-safe writing to stdout
extern std::mutex g_gui_mutex;

// Sends a message to the controlling console in a thread-safe manner.
// It automatically adds a newline and flushes the stream.
inline void send_to_gui(const std::string &message) {
    std::lock_guard<std::mutex> lock(g_gui_mutex);
    std::cout << message << std::endl;
}

// A helper to send formatted info strings
inline void send_info_string(const std::string &message) {
    send_to_gui(std::format("info string {}", message));
}

// A helper to report a search result
inline void send_search_result(const SearchResult &result) {
    std::string line = std::format("bestmove {}", result.best_move.value_or("(none)"));
    if (result.ponder_move) {
        line += std::format(" ponder {}", *result.ponder_move);
    }
    send_to_gui(line);
}
