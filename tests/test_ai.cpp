#include <gtest/gtest.h>

#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "ai.hpp"

using namespace chessai;

namespace {

const char* KIWIPETE = "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";
const char* BLACK_MATES_IN_ONE = "r5k1/5ppp/8/8/8/8/5PPP/6K1 b - - 0 1";
const char* WHITE_MATES_IN_ONE = "6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1";
const char* ONLY_KING_STEP = "7k/8/8/8/8/8/8/6RK b - - 0 1";
const char* STALEMATE = "k7/8/1Q6/8/8/8/8/7K b - - 0 1";
const char* BEFORE_STALEMATE = "k7/8/8/1Q6/8/8/8/7K w - - 0 1";

DifficultyProfile fixedDepth(int depth) {
    DifficultyProfile p;
    p.name = "fixed";
    p.depth = depth;
    p.nodeLimit = NODES_UNLIMITED;
    p.randomness = 0.0;
    p.timeMs = 0;
    return p;
}

struct FlakyBoard : Board {
    using Board::Board;
    std::vector<MoveRecord> moves() const { throw std::runtime_error("move generator unavailable"); }
};

struct StubbornBoard : Board {
    using Board::Board;
    MoveRecord move(const MoveRecord&) { return MoveRecord(); }
};

} // namespace

TEST(FindBestMove, StartPositionDepthOneRegression) {
    Board board;
    EXPECT_EQ(findBestMove(board, fixedDepth(1)).notation, "c2c3");
    EXPECT_EQ(board.fen(), START_FEN);
}

TEST(FindBestMove, MateInOneAtEveryTier) {
    for (const std::string& tier : difficultyNames()) {
        Board black(BLACK_MATES_IN_ONE);
        EXPECT_EQ(findBestMove(black, tier).notation, "a8a1") << tier;
        EXPECT_EQ(black.fen(), BLACK_MATES_IN_ONE);

        Board white(WHITE_MATES_IN_ONE);
        EXPECT_EQ(findBestMove(white, tier).notation, "a1a8") << tier;
    }
}

TEST(FindBestMove, MateInOneSkipsDeepening) {
    Board board(BLACK_MATES_IN_ONE);
    int reports = 0;
    SearchOptions options;
    options.onInfo = [&reports](const SearchInfo&) { ++reports; };
    EXPECT_EQ(findBestMove(board, difficultyProfile("advanced"), options).notation, "a8a1");
    EXPECT_EQ(reports, 0);
}

TEST(FindBestMove, SingleLegalMoveAtEveryTier) {
    for (const std::string& tier : difficultyNames()) {
        Board board(ONLY_KING_STEP);
        ASSERT_EQ(board.moves().size(), 1u);
        EXPECT_EQ(findBestMove(board, tier).notation, "h8h7") << tier;
        EXPECT_EQ(board.fen(), ONLY_KING_STEP);
    }
}

TEST(FindBestMove, NullWhenGameIsOver) {
    Board mated;
    mated.move("f2f3");
    mated.move("e7e5");
    mated.move("g2g4");
    mated.move("d8h4");
    EXPECT_TRUE(findBestMove(mated).isNull());

    Board stalemate(STALEMATE);
    EXPECT_TRUE(findBestMove(stalemate).isNull());

    Board bare_kings("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
    EXPECT_TRUE(findBestMove(bare_kings).isNull());

    Board fifty("4k3/8/8/8/8/8/8/R3K3 w - - 100 80");
    EXPECT_TRUE(findBestMove(fifty).isNull());
}

TEST(FindBestMove, NullAfterThreefoldRepetition) {
    Board board;
    for (const char* m : {"e2e4", "e7e5", "g1f3", "b8c6", "f3g1", "c6b8", "g1f3", "b8c6", "f3g1", "c6b8"}) {
        ASSERT_FALSE(board.move(m).isNull()) << m;
    }
    ASSERT_TRUE(board.isDraw());
    EXPECT_TRUE(findBestMove(board, "moderate").isNull());
}

TEST(FindBestMove, OnePlyBeforeStalemate) {
    Board board(BEFORE_STALEMATE);
    const MoveRecord m = findBestMove(board, "moderate");
    EXPECT_FALSE(m.isNull());
    EXPECT_EQ(board.fen(), BEFORE_STALEMATE);

    ASSERT_FALSE(board.move("b5b6").isNull());
    EXPECT_TRUE(findBestMove(board, "moderate").isNull());
}

TEST(FindBestMove, ReturnsALegalMove) {
    for (const std::string& tier : difficultyNames()) {
        Board board(KIWIPETE);
        const MoveRecord m = findBestMove(board, tier);
        ASSERT_FALSE(m.isNull()) << tier;
        EXPECT_FALSE(board.move(m).isNull()) << tier;
    }
}

TEST(FindBestMove, LeavesThePositionUntouched) {
    Board board(KIWIPETE);
    board.move("e1c1");
    const std::string fen = board.fen();
    const uint64_t hash = board.hash();

    DifficultyProfile tight = fixedDepth(3);
    tight.nodeLimit = 300;
    findBestMove(board, tight);
    findBestMove(board, "beginner");

    EXPECT_EQ(board.fen(), fen);
    EXPECT_EQ(board.hash(), hash);
    EXPECT_EQ(board.history().size(), 1u);
}

TEST(FindBestMove, UnknownTierUsesModerate) {
    Board board;
    EXPECT_FALSE(findBestMove(board, "impossible").isNull());
    EXPECT_FALSE(findBestMove(board).isNull());
}

TEST(FindBestMove, ReportsEachDepth) {
    Board board;
    std::vector<SearchInfo> infos;
    SearchOptions options;
    options.onInfo = [&infos](const SearchInfo& info) { infos.push_back(info); };

    DifficultyProfile profile = fixedDepth(3);
    profile.nodeLimit = 2000;
    findBestMove(board, profile, options);

    ASSERT_EQ(infos.size(), 3u);
    for (std::size_t i = 0; i < infos.size(); ++i) {
        EXPECT_EQ(infos[i].depth, static_cast<int>(i) + 1);
        EXPECT_TRUE(infos[i].completed);
        EXPECT_LE(infos[i].nodes, profile.nodeLimit);
        EXPECT_FALSE(infos[i].best.isNull());
    }
    EXPECT_EQ(infos[0].best.notation, "c2c3");
}

TEST(FindBestMove, SeededSearchIsReproducible) {
    DifficultyProfile profile = difficultyProfile("beginner");
    profile.timeMs = 0;

    std::mt19937_64 a(2024);
    std::mt19937_64 b(2024);
    SearchOptions with_a;
    with_a.rng = &a;
    SearchOptions with_b;
    with_b.rng = &b;

    for (int i = 0; i < 5; ++i) {
        Board first;
        Board second;
        EXPECT_EQ(findBestMove(first, profile, with_a), findBestMove(second, profile, with_b));
    }
}

TEST(FindBestMove, RandomnessStaysAmongTopCandidates) {
    // At depth 1 the root scores are PST deltas, so the window is known:
    // round(20 * 0.1) = 2 picks between c2c3 and f2f3.
    DifficultyProfile profile = fixedDepth(1);
    profile.randomness = 0.1;
    std::mt19937_64 rng(11);
    SearchOptions options;
    options.rng = &rng;

    for (int i = 0; i < 40; ++i) {
        Board board;
        const std::string pick = findBestMove(board, profile, options).notation;
        EXPECT_TRUE(pick == "c2c3" || pick == "f2f3") << pick;
    }
}

TEST(FindBestMove, FailingMoveGenerationGivesNoMove) {
    FlakyBoard board;
    EXPECT_TRUE(findBestMove(board, "advanced").isNull());
}

TEST(FindBestMove, RefusedMovesNeverGetUndone) {
    StubbornBoard board;
    static_cast<Board&>(board).move("e2e4");
    const std::string fen = board.fen();
    findBestMove(board, fixedDepth(2));
    EXPECT_EQ(board.fen(), fen);
    EXPECT_EQ(board.history().size(), 1u);
}

TEST(FindBestMove, DeadlineKeepsTheLastDecision) {
    Board board(KIWIPETE);
    board.move("e1g1");
    const std::string fen = board.fen();

    DifficultyProfile profile = fixedDepth(8);
    profile.timeMs = 1;
    std::vector<SearchInfo> infos;
    SearchOptions options;
    options.onInfo = [&infos](const SearchInfo& info) { infos.push_back(info); };

    const MoveRecord m = findBestMove(board, profile, options);
    ASSERT_FALSE(m.isNull());
    ASSERT_FALSE(infos.empty());
    EXPECT_TRUE(infos.size() < 8u || !infos.back().completed);
    for (std::size_t i = 0; i < infos.size(); ++i) {
        EXPECT_EQ(infos[i].depth, static_cast<int>(i) + 1);
        EXPECT_FALSE(infos[i].best.isNull());
        if (i + 1 < infos.size()) EXPECT_TRUE(infos[i].completed);
    }
    EXPECT_EQ(m, infos.back().best);

    EXPECT_EQ(board.fen(), fen);
    EXPECT_EQ(board.history().size(), 1u);
    EXPECT_FALSE(board.move(m).isNull());
}
