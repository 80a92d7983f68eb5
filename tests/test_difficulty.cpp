#include <gtest/gtest.h>

#include <random>
#include <set>
#include <string>
#include <vector>

#include "chess_engine.hpp"
#include "difficulty.hpp"

using namespace chessai;

namespace {

std::vector<ScoredMove> rankedList(int n) {
    std::vector<ScoredMove> out;
    for (int i = 0; i < n; ++i) {
        MoveRecord m;
        m.code = static_cast<Move>(i + 1);
        out.push_back(ScoredMove{m, i * 10});
    }
    return out;
}

} // namespace

TEST(Difficulty, Presets) {
    const DifficultyProfile& beginner = difficultyProfile("beginner");
    EXPECT_EQ(beginner.depth, 2);
    EXPECT_EQ(beginner.nodeLimit, 8000u);
    EXPECT_DOUBLE_EQ(beginner.randomness, 0.35);
    EXPECT_EQ(beginner.timeMs, 800);

    const DifficultyProfile& moderate = difficultyProfile("moderate");
    EXPECT_EQ(moderate.depth, 3);
    EXPECT_EQ(moderate.nodeLimit, 20000u);
    EXPECT_DOUBLE_EQ(moderate.randomness, 0.05);
    EXPECT_EQ(moderate.timeMs, 1500);

    const DifficultyProfile& advanced = difficultyProfile("advanced");
    EXPECT_EQ(advanced.depth, 4);
    EXPECT_EQ(advanced.nodeLimit, 60000u);
    EXPECT_DOUBLE_EQ(advanced.randomness, 0.0);
    EXPECT_EQ(advanced.timeMs, 3000);
}

TEST(Difficulty, NamesInPresetOrder) {
    const std::vector<std::string> expected = {"beginner", "moderate", "advanced"};
    EXPECT_EQ(difficultyNames(), expected);
}

TEST(Difficulty, UnknownNameFallsBackToModerate) {
    EXPECT_EQ(difficultyProfile("grandmaster").name, "moderate");
    EXPECT_EQ(difficultyProfile("").name, "moderate");
    EXPECT_EQ(difficultyProfile(DEFAULT_DIFFICULTY).name, "moderate");
}

TEST(Difficulty, NamesAreCaseInsensitive) {
    EXPECT_EQ(difficultyProfile("Advanced").name, "advanced");
    EXPECT_EQ(difficultyProfile("BEGINNER").name, "beginner");
}

TEST(SelectMove, EmptyListGivesNullMove) {
    std::mt19937_64 rng(1);
    EXPECT_TRUE(selectMove(std::vector<ScoredMove>(), 0.5, rng).isNull());
}

TEST(SelectMove, ZeroRandomnessPicksHead) {
    std::mt19937_64 rng(7);
    const std::vector<ScoredMove> ranked = rankedList(10);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(selectMove(ranked, 0.0, rng).code, 1u);
    }
}

TEST(SelectMove, SingleCandidateIsDeterministic) {
    std::mt19937_64 rng(7);
    const std::vector<ScoredMove> ranked = rankedList(1);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(selectMove(ranked, 1.0, rng).code, 1u);
    }
}

TEST(SelectMove, PicksWithinRoundedWindow) {
    std::mt19937_64 rng(42);
    const std::vector<ScoredMove> ranked = rankedList(10);

    // round(10 * 0.35) = 4
    std::set<Move> seen;
    for (int i = 0; i < 400; ++i) {
        const MoveRecord m = selectMove(ranked, 0.35, rng);
        EXPECT_GE(m.code, 1u);
        EXPECT_LE(m.code, 4u);
        seen.insert(m.code);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(SelectMove, WindowNeverDropsBelowOne) {
    std::mt19937_64 rng(3);
    const std::vector<ScoredMove> ranked = rankedList(10);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(selectMove(ranked, 0.01, rng).code, 1u);
    }
}

TEST(SelectMove, FullRandomnessCoversEveryCandidate) {
    std::mt19937_64 rng(5);
    const std::vector<ScoredMove> ranked = rankedList(6);
    std::set<Move> seen;
    for (int i = 0; i < 600; ++i) seen.insert(selectMove(ranked, 1.0, rng).code);
    EXPECT_EQ(seen.size(), 6u);
}

TEST(SelectMove, SameSeedSameChoice) {
    const std::vector<ScoredMove> ranked = rankedList(20);
    std::mt19937_64 a(99);
    std::mt19937_64 b(99);
    for (int i = 0; i < 30; ++i) {
        EXPECT_EQ(selectMove(ranked, 0.5, a), selectMove(ranked, 0.5, b));
    }
}
