#ifndef CHESSAI_MOVE_ORDERING_HPP
#define CHESSAI_MOVE_ORDERING_HPP

#include <algorithm>
#include <vector>

#include "chess_engine.hpp"
#include "evaluation.hpp"

namespace chessai {

// Most valuable victim first, cheapest attacker first; quiet moves sort
// behind captures by the value of the piece that moves.
inline int captureOrderScore(const MoveRecord& m) {
    return 10 * materialValue(m.captured) - materialValue(m.piece);
}

// Equal scores keep the generator's order.
inline std::vector<MoveRecord> orderMoves(std::vector<MoveRecord> moves) {
    std::stable_sort(moves.begin(), moves.end(), [](const MoveRecord& a, const MoveRecord& b) {
        return captureOrderScore(a) > captureOrderScore(b);
    });
    return moves;
}

} // namespace chessai

#endif // CHESSAI_MOVE_ORDERING_HPP
