#include "protocol.hpp"

#include <type_traits>
#include <variant>

std::mutex g_gui_mutex;

namespace {

constexpr std::string_view BESTMOVE_PREFIX = "bestmove";

}  // namespace

std::string setoption_command(const std::string &name, const std::string &value) {
    return std::format("setoption name {} value {}", name, value);
}

std::string position_command(const Position &position) {
    return std::visit(
        [](const auto &p) -> std::string {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, Startpos>) {
                return "position startpos";
            } else if constexpr (std::is_same_v<T, Fen>) {
                return std::format("position fen {}", p.fen);
            } else if constexpr (std::is_same_v<T, StartposAndMoves>) {
                return std::format("position startpos moves {}", p.moves);
            } else {
                return std::format("position fen {} moves {}", p.fen, p.moves);
            }
        },
        position);
}

std::string go_command(const OptionMap &go_options) {
    std::string cmd = "go";
    for (const auto &[key, value] : go_options) {
        // Flags such as "infinite" carry no value
        if (value.empty()) {
            cmd += std::format(" {}", key);
        } else {
            cmd += std::format(" {} {}", key, value);
        }
    }
    return cmd;
}

std::vector<std::string> search_commands(const SearchJob &job) {
    std::vector<std::string> commands;
    commands.reserve(job.get_engine_options().size() + 2);
    for (const auto &[name, value] : job.get_engine_options()) {
        commands.push_back(setoption_command(name, value));
    }
    commands.push_back(position_command(job.get_position()));
    commands.push_back(go_command(job.get_go_options()));
    return commands;
}

// Byte comparison; engine output is never decoded or validated as UTF-8.
bool is_bestmove_line(std::string_view line) {
    return line.size() >= BESTMOVE_PREFIX.size() &&
           line.compare(0, BESTMOVE_PREFIX.size(), BESTMOVE_PREFIX) == 0;
}

SearchResult parse_bestmove(std::string_view line) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t space = line.find(' ', start);
        if (space == std::string_view::npos) {
            parts.push_back(line.substr(start));
            break;
        }
        parts.push_back(line.substr(start, space - start));
        start = space + 1;
    }

    SearchResult result;
    if (parts.size() > 1) {
        result.best_move = std::string(parts[1]);
    }
    if (parts.size() > 3) {
        result.ponder_move = std::string(parts[3]);
    }
    return result;
}
