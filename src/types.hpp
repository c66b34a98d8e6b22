#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

// --- Core Data Types ---

// Enum for the side to move, using enum class for type safety.
enum class Color { WHITE, BLACK };

// Position setups understood by the "position" command.
// "moves" is a space separated list of UCI move tokens.
struct Startpos {};

struct Fen {
    std::string fen;
};

struct FenAndMoves {
    std::string fen;
    std::string moves;
};

struct StartposAndMoves {
    std::string moves;
};

using Position = std::variant<Startpos, Fen, FenAndMoves, StartposAndMoves>;

// Outcome of one search. Moves are opaque engine tokens, never validated.
struct SearchResult {
    std::optional<std::string> best_move;
    std::optional<std::string> ponder_move;
};

// Picks the Position alternative for an optional FEN and a move list.
Position make_position(const std::optional<std::string> &fen,
                       const std::vector<std::string> &moves);

// Side to move after all moves of the position have been applied.
Color side_to_move(const Position &position);
