/*
 * Static evaluation: material, piece-square tables and mobility, scored from
 * White's point of view. Works with any game type that offers the Board
 * queries used below (see Board in chess_engine.hpp).
 */

#ifndef CHESSAI_EVALUATION_HPP
#define CHESSAI_EVALUATION_HPP

#include <array>
#include <exception>
#include <type_traits>
#include <utility>
#include <vector>

#include "chess_engine.hpp"

namespace chessai {

constexpr int MATE_SCORE = 100000;
constexpr int MOBILITY_WEIGHT = 2;

// ───────────────────────── Material ─────────────────────────────────
constexpr std::array<int, 6> MATERIAL_VALUE = {
    100, 320, 330, 500, 900, 20000 // P N B R Q K
};

inline int materialValue(PieceType t) {
    return t == NO_PIECE_TYPE ? 0 : MATERIAL_VALUE[t];
}

// ───────────────────────── Piece-square tables (midgame) ────────────
// Indexed [row][col] of the board grid (row 0 = rank 8) as White sees it.
// Black reads the same tables mirrored vertically.
using PieceSquareTable = std::array<std::array<int, 8>, 8>;

constexpr PieceSquareTable PST_PAWN = {{
    {{  0,  0,  0,  0,  0,  0,  0,  0 }},
    {{ 50, 50, 50, 50, 50, 50, 50, 50 }},
    {{ 10, 10, 20, 30, 30, 20, 10, 10 }},
    {{  5,  5, 10, 25, 25, 10,  5,  5 }},
    {{  0,  0,  0, 20, 20,  0,  0,  0 }},
    {{  5, -5,-10,  0,  0,-10, -5,  5 }},
    {{  5, 10, 10,-20,-20, 10, 10,  5 }},
    {{  0,  0,  0,  0,  0,  0,  0,  0 }}
}};

constexpr PieceSquareTable PST_KNIGHT = {{
    {{-50,-40,-30,-30,-30,-30,-40,-50 }},
    {{-40,-20,  0,  5,  5,  0,-20,-40 }},
    {{-30,  5, 10, 15, 15, 10,  5,-30 }},
    {{-30,  0, 15, 20, 20, 15,  0,-30 }},
    {{-30,  5, 15, 20, 20, 15,  5,-30 }},
    {{-30,  0, 10, 15, 15, 10,  0,-30 }},
    {{-40,-20,  0,  0,  0,  0,-20,-40 }},
    {{-50,-40,-30,-30,-30,-30,-40,-50 }}
}};

constexpr PieceSquareTable PST_BISHOP = {{
    {{-20,-10,-10,-10,-10,-10,-10,-20 }},
    {{-10,  0,  0,  0,  0,  0,  0,-10 }},
    {{-10,  0,  5, 10, 10,  5,  0,-10 }},
    {{-10,  5,  5, 10, 10,  5,  5,-10 }},
    {{-10,  0, 10, 10, 10, 10,  0,-10 }},
    {{-10, 10, 10, 10, 10, 10, 10,-10 }},
    {{-10,  5,  0,  0,  0,  0,  5,-10 }},
    {{-20,-10,-10,-10,-10,-10,-10,-20 }}
}};

constexpr PieceSquareTable PST_ROOK = {{
    {{  0,  0,  0,  0,  0,  0,  0,  0 }},
    {{  5, 10, 10, 10, 10, 10, 10,  5 }},
    {{ -5,  0,  0,  0,  0,  0,  0, -5 }},
    {{ -5,  0,  0,  0,  0,  0,  0, -5 }},
    {{ -5,  0,  0,  0,  0,  0,  0, -5 }},
    {{ -5,  0,  0,  0,  0,  0,  0, -5 }},
    {{ -5,  0,  0,  0,  0,  0,  0, -5 }},
    {{  0,  0,  0,  5,  5,  0,  0,  0 }}
}};

constexpr PieceSquareTable PST_QUEEN = {{
    {{-20,-10,-10, -5, -5,-10,-10,-20 }},
    {{-10,  0,  0,  0,  0,  0,  0,-10 }},
    {{-10,  0,  5,  5,  5,  5,  0,-10 }},
    {{ -5,  0,  5,  5,  5,  5,  0, -5 }},
    {{  0,  0,  5,  5,  5,  5,  0, -5 }},
    {{-10,  5,  5,  5,  5,  5,  0,-10 }},
    {{-10,  0,  5,  0,  0,  0,  0,-10 }},
    {{-20,-10,-10, -5, -5,-10,-10,-20 }}
}};

constexpr PieceSquareTable PST_KING = {{
    {{-30,-40,-40,-50,-50,-40,-40,-30 }},
    {{-30,-40,-40,-50,-50,-40,-40,-30 }},
    {{-30,-40,-40,-50,-50,-40,-40,-30 }},
    {{-30,-40,-40,-50,-50,-40,-40,-30 }},
    {{-20,-30,-30,-40,-40,-30,-30,-20 }},
    {{-10,-20,-20,-20,-20,-20,-20,-10 }},
    {{ 20, 20,  0,  0,  0,  0, 20, 20 }},
    {{ 20, 30, 10,  0,  0, 10, 30, 20 }}
}};

constexpr std::array<PieceSquareTable, 6> PIECE_SQUARE_TABLES = {{
    PST_PAWN, PST_KNIGHT, PST_BISHOP, PST_ROOK, PST_QUEEN, PST_KING
}};

// ───────────────────────── Collaborator probes ──────────────────────
namespace detail {

    template <class...> struct make_void { typedef void type; };

    template <class G, class = void>
    struct has_is_threefold : std::false_type {};
    template <class G>
    struct has_is_threefold<G, typename make_void<decltype(std::declval<const G&>().isThreefoldRepetition())>::type>
        : std::true_type {};

    template <class G, class = void>
    struct has_in_threefold : std::false_type {};
    template <class G>
    struct has_in_threefold<G, typename make_void<decltype(std::declval<const G&>().inThreefoldRepetition())>::type>
        : std::true_type {};

    // Preference order: newer name, legacy name, none.
    template <class G>
    bool threefold(const G& game, std::integral_constant<int, 2>) { return game.isThreefoldRepetition(); }
    template <class G>
    bool threefold(const G& game, std::integral_constant<int, 1>) { return game.inThreefoldRepetition(); }
    template <class G>
    bool threefold(const G&, std::integral_constant<int, 0>) { return false; }

} // namespace detail

// Threefold repetition as reported by the game, whichever name it exposes it
// under. A game without either query never counts as repeated.
template <class Game>
bool isThreefold(const Game& game) {
    typedef std::integral_constant<int,
        detail::has_is_threefold<Game>::value ? 2 :
        detail::has_in_threefold<Game>::value ? 1 : 0> probe;
    return detail::threefold(game, probe());
}

// Legal moves, or none at all if the game fails to enumerate them.
template <class Game>
std::vector<MoveRecord> safeMoves(const Game& game) {
    try {
        return game.moves();
    } catch (const std::exception&) {
        return std::vector<MoveRecord>();
    }
}

// ───────────────────────── Evaluation ───────────────────────────────
template <class Game>
int evaluate(const Game& game) {
    const bool white_to_move = game.turn() == Color::WHITE;
    if (game.isCheckmate()) {
        return white_to_move ? -MATE_SCORE : MATE_SCORE;
    }
    if (game.isDraw() || isThreefold(game)) return 0;

    const BoardGrid grid = game.board();
    int score = 0;
    for (int row = 0; row < 8; ++row) {
        for (int col = 0; col < 8; ++col) {
            const Piece piece = grid[row][col];
            if (piece == NO_PIECE) continue;

            const PieceType kind = typeOf(piece);
            if (colorOf(piece) == Color::WHITE) {
                score += MATERIAL_VALUE[kind] + PIECE_SQUARE_TABLES[kind][row][col];
            } else {
                score -= MATERIAL_VALUE[kind] + PIECE_SQUARE_TABLES[kind][7 - row][col];
            }
        }
    }

    const int mobility = static_cast<int>(safeMoves(game).size());
    score += (white_to_move ? 1 : -1) * mobility * MOBILITY_WEIGHT;
    return score;
}

} // namespace chessai

#endif // CHESSAI_EVALUATION_HPP
