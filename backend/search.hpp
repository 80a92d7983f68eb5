/*
 * Depth- and budget-bounded minimax with alpha-beta pruning. The search plays
 * moves on the caller's game in place and takes every one of them back before
 * returning.
 */

#ifndef CHESSAI_SEARCH_HPP
#define CHESSAI_SEARCH_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <vector>

#include "chess_engine.hpp"
#include "evaluation.hpp"
#include "move_ordering.hpp"

namespace chessai {

using SearchClock = std::chrono::steady_clock;

constexpr int SCORE_INFINITE = std::numeric_limits<int>::max() - 200000;
constexpr uint64_t NODES_UNLIMITED = std::numeric_limits<uint64_t>::max();

// Counters for one descent. The root creates a fresh one per depth iteration.
struct SearchBudget {
    uint64_t nodes = 0;
    uint64_t nodeLimit = NODES_UNLIMITED;
    bool hasDeadline = false;
    SearchClock::time_point deadline{};

    bool exhausted() const { return nodes >= nodeLimit; }
    bool expired() const { return hasDeadline && SearchClock::now() >= deadline; }
};

// Plays a move for the lifetime of the scope and takes it back on every exit
// path. A move the game refuses is left unapplied.
template <class Game>
class ScopedMove {
public:
    ScopedMove(Game& game, const MoveRecord& m) : game_(game), applied_(!game.move(m).isNull()) {}
    ~ScopedMove() {
        if (applied_) game_.undo();
    }

    ScopedMove(const ScopedMove&) = delete;
    ScopedMove& operator=(const ScopedMove&) = delete;

    bool applied() const { return applied_; }

private:
    Game& game_;
    bool applied_;
};

// Returns the minimax value of the position (White positive). Cut-off nodes
// return a bound rather than an exact value.
template <class Game>
int minimax(Game& game, int depth, int alpha, int beta, bool maximizing, SearchBudget& budget) {
    if (budget.exhausted()) return evaluate(game);
    budget.nodes++;
    if (budget.expired()) return evaluate(game);
    if (depth <= 0 || game.isGameOver()) return evaluate(game);

    const std::vector<MoveRecord> moves = orderMoves(safeMoves(game));
    if (moves.empty()) return evaluate(game);

    if (maximizing) {
        int best = -SCORE_INFINITE;
        for (const MoveRecord& m : moves) {
            ScopedMove<Game> scope(game, m);
            if (!scope.applied()) continue;

            const int val = minimax(game, depth - 1, alpha, beta, false, budget);
            best = std::max(best, val);
            alpha = std::max(alpha, val);
            if (alpha >= beta) break;
        }
        return best;
    }

    int best = SCORE_INFINITE;
    for (const MoveRecord& m : moves) {
        ScopedMove<Game> scope(game, m);
        if (!scope.applied()) continue;

        const int val = minimax(game, depth - 1, alpha, beta, true, budget);
        best = std::min(best, val);
        beta = std::min(beta, val);
        if (alpha >= beta) break;
    }
    return best;
}

} // namespace chessai

#endif // CHESSAI_SEARCH_HPP
