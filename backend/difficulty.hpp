#ifndef CHESSAI_DIFFICULTY_HPP
#define CHESSAI_DIFFICULTY_HPP

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "chess_engine.hpp"

namespace chessai {

struct DifficultyProfile {
    std::string name;
    int depth = 3;                  // ply ceiling for iterative deepening
    uint64_t nodeLimit = 20000;     // nodes per depth iteration
    double randomness = 0.0;        // share of ranked root moves to pick from, 0..1
    int timeMs = 0;                 // per-call budget, 0 = unlimited
};

constexpr const char* DEFAULT_DIFFICULTY = "moderate";

inline const std::vector<DifficultyProfile>& difficultyPresets() {
    static const std::vector<DifficultyProfile> presets = {
        {"beginner", 2,  8000, 0.35,  800},
        {"moderate", 3, 20000, 0.05, 1500},
        {"advanced", 4, 60000, 0.0,  3000},
    };
    return presets;
}

inline std::vector<std::string> difficultyNames() {
    std::vector<std::string> names;
    for (const DifficultyProfile& p : difficultyPresets()) names.push_back(p.name);
    return names;
}

// Unknown names fall back to the default tier.
inline const DifficultyProfile& difficultyProfile(std::string name) {
    for (char& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    const std::vector<DifficultyProfile>& presets = difficultyPresets();
    for (const DifficultyProfile& p : presets) {
        if (p.name == name) return p;
    }
    for (const DifficultyProfile& p : presets) {
        if (p.name == DEFAULT_DIFFICULTY) return p;
    }
    return presets.front();
}

struct ScoredMove {
    MoveRecord move;
    int score;
};

// Picks uniformly among the first max(1, round(n * randomness)) entries of a
// list ranked best first. Randomness 0 always returns the head.
inline MoveRecord selectMove(const std::vector<ScoredMove>& ranked, double randomness, std::mt19937_64& rng) {
    if (ranked.empty()) return MoveRecord();
    if (randomness <= 0.0 || ranked.size() <= 1) return ranked.front().move;

    const long window = std::max(1L, std::lround(static_cast<double>(ranked.size()) * randomness));
    const std::size_t last = std::min(static_cast<std::size_t>(window), ranked.size()) - 1;
    std::uniform_int_distribution<std::size_t> dist(0, last);
    return ranked[dist(rng)].move;
}

} // namespace chessai

#endif // CHESSAI_DIFFICULTY_HPP
