#include "types.hpp"

#include <sstream>

namespace {

std::string join_moves(const std::vector<std::string> &moves) {
    std::string joined;
    for (const auto &move : moves) {
        if (!joined.empty()) joined += ' ';
        joined += move;
    }
    return joined;
}

int count_moves(const std::string &moves) {
    std::istringstream ss(moves);
    std::string token;
    int count = 0;
    while (ss >> token) count++;
    return count;
}

// Second FEN field is the active color. Anything but "b" means white.
Color fen_side(const std::string &fen) {
    std::istringstream ss(fen);
    std::string board, side;
    ss >> board >> side;
    return side == "b" ? Color::BLACK : Color::WHITE;
}

Color flip(Color color, int plies) {
    if (plies % 2 == 0) return color;
    return color == Color::WHITE ? Color::BLACK : Color::WHITE;
}

}  // namespace

Position make_position(const std::optional<std::string> &fen,
                       const std::vector<std::string> &moves) {
    if (fen) {
        if (moves.empty()) return Fen{*fen};
        return FenAndMoves{*fen, join_moves(moves)};
    }
    if (moves.empty()) return Startpos{};
    return StartposAndMoves{join_moves(moves)};
}

Color side_to_move(const Position &position) {
    if (const auto *p = std::get_if<Fen>(&position)) {
        return fen_side(p->fen);
    }
    if (const auto *p = std::get_if<FenAndMoves>(&position)) {
        return flip(fen_side(p->fen), count_moves(p->moves));
    }
    if (const auto *p = std::get_if<StartposAndMoves>(&position)) {
        return flip(Color::WHITE, count_moves(p->moves));
    }
    return Color::WHITE;
}
