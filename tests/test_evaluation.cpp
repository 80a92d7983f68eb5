#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "chess_engine.hpp"
#include "evaluation.hpp"

using namespace chessai;

namespace {

struct NewerApi {
    bool isThreefoldRepetition() const { return true; }
};

struct OlderApi {
    bool inThreefoldRepetition() const { return true; }
};

struct BothApis {
    bool isThreefoldRepetition() const { return false; }
    bool inThreefoldRepetition() const { return true; }
};

struct NoApi {};

// Move enumeration fails on every call.
struct FlakyBoard : Board {
    using Board::Board;
    std::vector<MoveRecord> moves() const { throw std::runtime_error("move generator unavailable"); }
};

// Reports repetition without counting it as a draw.
struct RepeatingBoard : Board {
    using Board::Board;
    bool isDraw() const { return false; }
    bool isThreefoldRepetition() const { return true; }
};

} // namespace

TEST(ThreefoldProbe, PrefersNewerName) {
    EXPECT_TRUE(isThreefold(NewerApi()));
    EXPECT_TRUE(isThreefold(OlderApi()));
    EXPECT_FALSE(isThreefold(BothApis()));
    EXPECT_FALSE(isThreefold(NoApi()));
}

TEST(ThreefoldProbe, BoardReportsRepetition) {
    Board board;
    for (int i = 0; i < 2; ++i) {
        board.move("g1f3");
        board.move("g8f6");
        board.move("f3g1");
        board.move("f6g8");
    }
    EXPECT_EQ(board.history().size(), 8u);
    EXPECT_TRUE(isThreefold(board));
    EXPECT_EQ(evaluate(board), 0);
}

TEST(SafeMoves, SwallowsEnumerationFailure) {
    EXPECT_TRUE(safeMoves(FlakyBoard()).empty());
    EXPECT_EQ(safeMoves(Board()).size(), 20u);
}

TEST(Evaluate, MaterialAndTablesCancelAtStart) {
    // Without mobility the mirrored armies sum to exactly zero.
    EXPECT_EQ(evaluate(FlakyBoard()), 0);
}

TEST(Evaluate, StartPositionMobility) {
    EXPECT_EQ(evaluate(Board()), 20 * MOBILITY_WEIGHT);
    EXPECT_EQ(evaluate(Board("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR b KQkq - 0 1")), -20 * MOBILITY_WEIGHT);
}

TEST(Evaluate, MateSentinelFavoursTheWinner) {
    Board white_mated;
    white_mated.move("f2f3");
    white_mated.move("e7e5");
    white_mated.move("g2g4");
    white_mated.move("d8h4");
    ASSERT_TRUE(white_mated.isCheckmate());
    EXPECT_EQ(evaluate(white_mated), -MATE_SCORE);

    Board black_mated("6k1/5ppp/8/8/8/8/5PPP/R5K1 w - - 0 1");
    ASSERT_FALSE(black_mated.move("a1a8").isNull());
    ASSERT_TRUE(black_mated.isCheckmate());
    EXPECT_EQ(evaluate(black_mated), MATE_SCORE);
}

TEST(Evaluate, DrawsScoreZero) {
    EXPECT_EQ(evaluate(Board("k7/8/1Q6/8/8/8/8/7K b - - 0 1")), 0);
    EXPECT_EQ(evaluate(Board("8/8/8/4k3/8/8/8/3NK3 w - - 0 1")), 0);
    EXPECT_EQ(evaluate(Board("4k3/8/8/8/8/8/8/R3K3 w - - 100 80")), 0);
    EXPECT_EQ(evaluate(RepeatingBoard()), 0);
}

TEST(Evaluate, BlackReadsMirroredTables) {
    // Pawn 100+5, knight 320-40, ten white moves.
    const int white_side = evaluate(Board("4k3/8/8/8/8/8/P7/1N2K3 w - - 0 1"));
    EXPECT_EQ(white_side, 405);
    EXPECT_EQ(evaluate(Board("1n2k3/p7/8/8/8/8/8/4K3 b - - 0 1")), -white_side);
}

TEST(Evaluate, IsPure) {
    Board board("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    const std::string fen = board.fen();
    const int first = evaluate(board);
    EXPECT_EQ(evaluate(board), first);
    EXPECT_EQ(board.fen(), fen);
    EXPECT_TRUE(board.history().empty());
}

TEST(Evaluate, MaterialTable) {
    EXPECT_EQ(materialValue(PAWN), 100);
    EXPECT_EQ(materialValue(KNIGHT), 320);
    EXPECT_EQ(materialValue(BISHOP), 330);
    EXPECT_EQ(materialValue(ROOK), 500);
    EXPECT_EQ(materialValue(QUEEN), 900);
    EXPECT_EQ(materialValue(KING), 20000);
    EXPECT_EQ(materialValue(NO_PIECE_TYPE), 0);
}
