#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

#include "chess_engine.hpp"
#include "move_ordering.hpp"

using namespace chessai;

namespace {

MoveRecord record(Move code, PieceType piece, PieceType captured = NO_PIECE_TYPE) {
    MoveRecord m;
    m.code = code;
    m.piece = piece;
    m.captured = captured;
    return m;
}

std::vector<Move> codes(const std::vector<MoveRecord>& moves) {
    std::vector<Move> out;
    for (const MoveRecord& m : moves) out.push_back(m.code);
    return out;
}

} // namespace

TEST(MoveOrdering, CaptureKey) {
    EXPECT_EQ(captureOrderScore(record(1, PAWN, QUEEN)), 8900);
    EXPECT_EQ(captureOrderScore(record(1, QUEEN, PAWN)), 100);
    EXPECT_EQ(captureOrderScore(record(1, KNIGHT)), -320);
    EXPECT_EQ(captureOrderScore(record(1, KING)), -20000);
}

TEST(MoveOrdering, MostValuableVictimFirst) {
    const std::vector<MoveRecord> moves = {
        record(1, PAWN),
        record(2, QUEEN, PAWN),
        record(3, KNIGHT, ROOK),
        record(4, PAWN, QUEEN),
        record(5, KING),
    };
    const std::vector<Move> expected = {4, 3, 2, 1, 5};
    EXPECT_EQ(codes(orderMoves(moves)), expected);
}

TEST(MoveOrdering, EqualKeysKeepInputOrder) {
    const std::vector<MoveRecord> moves = {
        record(7, PAWN), record(3, PAWN), record(9, BISHOP, KNIGHT), record(5, PAWN),
    };
    const std::vector<Move> expected = {9, 7, 3, 5};
    EXPECT_EQ(codes(orderMoves(moves)), expected);
}

TEST(MoveOrdering, IsSortedPermutationOfLegalMoves) {
    const Board board("r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    const std::vector<MoveRecord> legal = board.moves();
    const std::vector<MoveRecord> ordered = orderMoves(legal);

    ASSERT_EQ(ordered.size(), legal.size());
    std::vector<Move> a = codes(legal);
    std::vector<Move> b = codes(ordered);
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    EXPECT_EQ(a, b);

    for (std::size_t i = 1; i < ordered.size(); ++i) {
        EXPECT_GE(captureOrderScore(ordered[i - 1]), captureOrderScore(ordered[i]));
    }
}

TEST(MoveOrdering, PawnTakesQueenLeads) {
    const Board board("4k3/8/8/3q4/2P5/8/8/4K2R w K - 0 1");
    const std::vector<MoveRecord> ordered = orderMoves(board.moves());
    ASSERT_FALSE(ordered.empty());
    EXPECT_EQ(ordered.front().notation, "c4d5");
}

TEST(MoveOrdering, EmptyInput) {
    EXPECT_TRUE(orderMoves(std::vector<MoveRecord>()).empty());
}
