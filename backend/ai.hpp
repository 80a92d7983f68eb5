/*
 * Move selection for the computer player: mate-in-one shortcut, iterative
 * deepening over the root moves under the difficulty's node and time budget,
 * then a possibly randomised pick among the best root moves.
 *
 * The root minimises, i.e. the engine plays Black.
 */

#ifndef CHESSAI_AI_HPP
#define CHESSAI_AI_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "chess_engine.hpp"
#include "difficulty.hpp"
#include "evaluation.hpp"
#include "move_ordering.hpp"
#include "search.hpp"

namespace chessai {

struct SearchInfo {
    int depth = 0;
    int score = 0;          // White positive
    uint64_t nodes = 0;
    uint64_t timeMs = 0;
    MoveRecord best;
    bool completed = false; // every root move was scored at this depth
};

using SearchInfoCallback = std::function<void(const SearchInfo&)>;

struct SearchOptions {
    std::mt19937_64* rng = nullptr; // defaults to a per-thread engine seeded from std::random_device
    SearchInfoCallback onInfo{};
};

inline std::mt19937_64& defaultRandomEngine() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    return rng;
}

// Returns a null record when the game is already decided or has no legal move.
template <class Game>
MoveRecord findBestMove(Game& game, const DifficultyProfile& profile, const SearchOptions& options = SearchOptions()) {
    if (game.isCheckmate() || game.isDraw()) return MoveRecord();

    const std::vector<MoveRecord> moves = orderMoves(safeMoves(game));
    if (moves.empty()) return MoveRecord();

    for (const MoveRecord& m : moves) {
        ScopedMove<Game> scope(game, m);
        if (scope.applied() && game.isCheckmate()) return m;
    }

    const SearchClock::time_point start = SearchClock::now();
    const bool timed = profile.timeMs > 0;
    const SearchClock::time_point deadline = start + std::chrono::milliseconds(profile.timeMs);
    auto out_of_time = [&]() { return timed && SearchClock::now() >= deadline; };

    MoveRecord best = moves.front();
    int best_eval = SCORE_INFINITE;
    std::vector<ScoredMove> ranked; // root moves of the deepest completed iteration, best first

    for (int depth = 1; depth <= profile.depth; ++depth) {
        SearchBudget budget;
        budget.nodeLimit = profile.nodeLimit;
        budget.hasDeadline = timed;
        budget.deadline = deadline;

        // A new depth has to beat the previous result to replace it.
        MoveRecord depth_best = best;
        int depth_best_eval = best_eval;
        std::vector<ScoredMove> scored;
        scored.reserve(moves.size());
        bool completed = true;

        for (std::size_t i = 0; i < moves.size(); ++i) {
            const MoveRecord& m = moves[i];
            int val;
            {
                ScopedMove<Game> scope(game, m);
                if (!scope.applied()) continue;
                val = minimax(game, depth - 1, -SCORE_INFINITE, SCORE_INFINITE, true, budget);
            }
            scored.push_back(ScoredMove{m, val});

            if (val < depth_best_eval) {
                depth_best_eval = val;
                depth_best = m;
            }
            if (out_of_time()) {
                completed = (i + 1 == moves.size());
                break;
            }
        }

        best = depth_best;
        best_eval = depth_best_eval;
        if (completed) {
            std::stable_sort(scored.begin(), scored.end(), [](const ScoredMove& a, const ScoredMove& b) {
                return a.score < b.score;
            });
            ranked.swap(scored);
        }

        if (options.onInfo) {
            SearchInfo info;
            info.depth = depth;
            info.score = best_eval;
            info.nodes = budget.nodes;
            info.timeMs = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(SearchClock::now() - start).count());
            info.best = best;
            info.completed = completed;
            options.onInfo(info);
        }

        if (out_of_time()) break;
    }

    // The final best move heads the candidate list even when it came from a
    // cut-short iteration.
    std::vector<ScoredMove> candidates = ranked;
    auto it = std::find_if(candidates.begin(), candidates.end(), [&](const ScoredMove& s) {
        return s.move == best;
    });
    if (it == candidates.end()) {
        candidates.insert(candidates.begin(), ScoredMove{best, best_eval});
    } else if (it != candidates.begin()) {
        std::rotate(candidates.begin(), it, it + 1);
    }

    std::mt19937_64& rng = options.rng ? *options.rng : defaultRandomEngine();
    return selectMove(candidates, profile.randomness, rng);
}

template <class Game>
MoveRecord findBestMove(Game& game, const std::string& difficulty = DEFAULT_DIFFICULTY) {
    return findBestMove(game, difficultyProfile(difficulty));
}

} // namespace chessai

#endif // CHESSAI_AI_HPP
