/*
 * Bitboard chess rules engine: legal move generation, apply/undo and
 * game-state detection. The search in ai.hpp talks to it only through the
 * Board facade at the bottom of this file.
 */

#ifndef CHESSAI_CHESS_ENGINE_HPP
#define CHESSAI_CHESS_ENGINE_HPP

#include <cstdint>
#include <cstdlib>   // For std::atoi
#include <vector>
#include <array>
#include <limits>
#include <algorithm> // For std::find, std::count
#include <string>    // For std::string
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error
#include <random>    // For Zobrist keys
#include <utility>

namespace chessai {

using Bitboard = uint64_t;
using Move     = uint32_t;

// Helper to count set bits and scan for the lowest/highest set bit
#if defined(__GNUC__) || defined(__clang__)
inline int popcount(Bitboard bb) { return __builtin_popcountll(bb); }
inline int lsb_idx(Bitboard bb) { return bb ? __builtin_ctzll(bb) : -1; }
inline int msb_idx(Bitboard bb) { return bb ? 63 - __builtin_clzll(bb) : -1; }
#else
inline int popcount(Bitboard bb) {
    int count = 0;
    while (bb) {
        bb &= (bb - 1);
        count++;
    }
    return count;
}
inline int lsb_idx(Bitboard bb) {
    if (bb == 0) return -1;
    int index = 0;
    while (!((bb >> index) & 1)) index++;
    return index;
}
inline int msb_idx(Bitboard bb) {
    if (bb == 0) return -1;
    int index = 63;
    while (!((bb >> index) & 1)) index--;
    return index;
}
#endif

// ───────────────────────── Piece constants ──────────────────────────
enum Piece {
    W_PAWN, W_KNIGHT, W_BISHOP, W_ROOK, W_QUEEN, W_KING, // 0-5
    B_PAWN, B_KNIGHT, B_BISHOP, B_ROOK, B_QUEEN, B_KING, // 6-11
    NO_PIECE // 12
};

// Colourless piece kind, as carried by move records and the evaluator.
enum PieceType { PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING, NO_PIECE_TYPE };

enum class Color : uint8_t { WHITE, BLACK };

constexpr std::array<char,13> PIECE_CHAR_REPR = {
    'P','N','B','R','Q','K',
    'p','n','b','r','q','k', ' '
};

inline PieceType typeOf(Piece p) {
    return p == NO_PIECE ? NO_PIECE_TYPE : static_cast<PieceType>(p % 6);
}
inline Color colorOf(Piece p) { return p < B_PAWN ? Color::WHITE : Color::BLACK; }
inline Piece makePiece(Color c, PieceType t) {
    if (t == NO_PIECE_TYPE) return NO_PIECE;
    return static_cast<Piece>(t + (c == Color::BLACK ? 6 : 0));
}

inline Piece pieceFromChar(char ch) {
    for (int i = W_PAWN; i <= B_KING; ++i) {
        if (PIECE_CHAR_REPR[i] == ch) return static_cast<Piece>(i);
    }
    return NO_PIECE;
}

// ───────────────────────── Board helpers (Square 0=a1, 63=h8) ──────
inline int file_of(int sq){ return sq & 7; }
inline int rank_of(int sq){ return sq >> 3; }
inline int square(int r, int f){ return r * 8 + f; }
inline bool on_board_rf(int r, int f){ return r>=0 && r<8 && f>=0 && f<8; }
inline bool on_board(int sq){ return sq>=0 && sq<64; }
inline Bitboard bit(int sq){ return 1ULL << sq; }

constexpr Bitboard RANK_1 = 0xFFULL;
constexpr Bitboard RANK_2 = RANK_1 << (8*1);
constexpr Bitboard RANK_7 = RANK_1 << (8*6);
constexpr Bitboard RANK_8 = RANK_1 << (8*7);
constexpr Bitboard LIGHT_SQUARES = 0x55AA55AA55AA55AAULL;

inline std::string squareToAlgebraic(int sq) {
    if (!on_board(sq)) return "??";
    char file = 'a' + file_of(sq);
    char rank = '1' + rank_of(sq);
    return std::string(1, file) + std::string(1, rank);
}

// Returns -1 when the text is not a square name like "e4".
inline int parseSquare(const std::string& s) {
    if (s.size() != 2) return -1;
    const int f = s[0] - 'a';
    const int r = s[1] - '1';
    if (!on_board_rf(r, f)) return -1;
    return square(r, f);
}

// ───────────────────────── Attack Generation ─────────────────────────
namespace attacks {

    // Ascending directions (index grows along the ray) come first.
    enum Direction { NORTH, EAST, NORTH_EAST, NORTH_WEST, SOUTH, WEST, SOUTH_EAST, SOUTH_WEST };

    struct Tables {
        std::array<Bitboard, 64> knight{};
        std::array<Bitboard, 64> king{};
        std::array<std::array<Bitboard, 64>, 2> pawn{};    // [color][square]
        std::array<std::array<Bitboard, 64>, 8> ray{};     // [direction][square]
        std::array<std::array<Bitboard, 64>, 64> between{}; // strictly between two aligned squares

        Tables() {
            const int knight_dr[] = {2, 2, 1, 1, -1, -1, -2, -2};
            const int knight_df[] = {1, -1, 2, -2, 2, -2, 1, -1};
            const int dir_dr[] = {1, 0, 1, 1, -1, 0, -1, -1};
            const int dir_df[] = {0, 1, 1, -1, 0, -1, 1, -1};

            for (int sq = 0; sq < 64; ++sq) {
                int r = rank_of(sq);
                int f = file_of(sq);

                for (int i = 0; i < 8; ++i) {
                    if (on_board_rf(r + knight_dr[i], f + knight_df[i])) {
                        knight[sq] |= bit(square(r + knight_dr[i], f + knight_df[i]));
                    }
                    if (on_board_rf(r + dir_dr[i], f + dir_df[i])) {
                        king[sq] |= bit(square(r + dir_dr[i], f + dir_df[i]));
                    }
                }

                if (on_board_rf(r + 1, f - 1)) pawn[0][sq] |= bit(square(r + 1, f - 1));
                if (on_board_rf(r + 1, f + 1)) pawn[0][sq] |= bit(square(r + 1, f + 1));
                if (on_board_rf(r - 1, f - 1)) pawn[1][sq] |= bit(square(r - 1, f - 1));
                if (on_board_rf(r - 1, f + 1)) pawn[1][sq] |= bit(square(r - 1, f + 1));

                for (int dir = 0; dir < 8; ++dir) {
                    Bitboard walked = 0ULL;
                    for (int i = 1; on_board_rf(r + dir_dr[dir] * i, f + dir_df[dir] * i); ++i) {
                        int to = square(r + dir_dr[dir] * i, f + dir_df[dir] * i);
                        between[sq][to] = walked;
                        walked |= bit(to);
                    }
                    ray[dir][sq] = walked;
                }
            }
        }
    };

    inline const Tables& tables() {
        static const Tables instance;
        return instance;
    }

    inline Bitboard slide(int sq, int dir, Bitboard occ) {
        const Tables& t = tables();
        Bitboard attacks = t.ray[dir][sq];
        const Bitboard blockers = attacks & occ;
        if (blockers) {
            const int first = dir < SOUTH ? lsb_idx(blockers) : msb_idx(blockers);
            attacks &= ~t.ray[dir][first];
        }
        return attacks;
    }

    inline Bitboard get_rook_attacks(int sq, Bitboard occ) {
        return slide(sq, NORTH, occ) | slide(sq, SOUTH, occ) | slide(sq, EAST, occ) | slide(sq, WEST, occ);
    }

    inline Bitboard get_bishop_attacks(int sq, Bitboard occ) {
        return slide(sq, NORTH_EAST, occ) | slide(sq, NORTH_WEST, occ) |
               slide(sq, SOUTH_EAST, occ) | slide(sq, SOUTH_WEST, occ);
    }

    inline Bitboard get_ray_between(int sq1, int sq2) {
        return tables().between[sq1][sq2];
    }

    // Segment from sq1 to sq2, both ends included. Empty if the squares are not aligned.
    inline Bitboard get_line_through(int sq1, int sq2) {
        const Bitboard inner = tables().between[sq1][sq2];
        const bool aligned = inner || (tables().king[sq1] & bit(sq2));
        return aligned ? (inner | bit(sq1) | bit(sq2)) : 0ULL;
    }

} // namespace attacks


// ───────────────────────── Move encoding ──────────────────
enum PromoPieceType { PROMO_TYPE_NONE, PROMO_TYPE_N, PROMO_TYPE_B, PROMO_TYPE_R, PROMO_TYPE_Q }; // 0-4
constexpr int EP_FLAG  = 1<<0; // En Passant
constexpr int DPP_FLAG = 1<<1; // Double Pawn Push
constexpr int KSC_FLAG = 1<<2; // King Side Castle
constexpr int QSC_FLAG = 1<<3; // Queen Side Castle

inline Move encodeMove(int f,int t,int promo_val=PROMO_TYPE_NONE,int flags=0){
    return f|(t<<6)|(promo_val<<12)|(flags<<16);
}
inline int  fromSquare(Move m){return  m & 0x3F;}
inline int    toSquare(Move m){return (m>>6)&0x3F;}
inline int promotion(Move m){return (m>>12)&0xF;}
inline int  moveFlags(Move m){return (m>>16)&0xF;}

inline PieceType promoToType(int promo) {
    switch (promo) {
        case PROMO_TYPE_N: return KNIGHT;
        case PROMO_TYPE_B: return BISHOP;
        case PROMO_TYPE_R: return ROOK;
        case PROMO_TYPE_Q: return QUEEN;
        default: return NO_PIECE_TYPE;
    }
}

inline std::string moveToString(Move m) {
    if (m == 0) return "0000"; // Null move representation
    std::stringstream ss;
    ss << squareToAlgebraic(fromSquare(m)) << squareToAlgebraic(toSquare(m));
    int promo = promotion(m);
    if (promo != PROMO_TYPE_NONE) {
        if (promo == PROMO_TYPE_Q) ss << "q";
        else if (promo == PROMO_TYPE_R) ss << "r";
        else if (promo == PROMO_TYPE_B) ss << "b";
        else if (promo == PROMO_TYPE_N) ss << "n";
    }
    return ss.str();
}

// ───────────────────────── Zobrist Hashing ───────────────────
struct ZobristKeys {
    std::array<std::array<uint64_t, 64>, 12> piece_square_keys;
    uint64_t black_to_move_key;
    std::array<uint64_t, 16> castling_keys;
    std::array<uint64_t, 8> ep_file_keys;

    ZobristKeys() {
        std::mt19937_64 rng(0xDEADBEEFCAFEFULL);
        std::uniform_int_distribution<uint64_t> dist(0, std::numeric_limits<uint64_t>::max());

        for (int piece = 0; piece < 12; ++piece) {
            for (int sq = 0; sq < 64; ++sq) {
                piece_square_keys[piece][sq] = dist(rng);
            }
        }
        black_to_move_key = dist(rng);
        for (int i = 0; i < 16; ++i) {
            castling_keys[i] = dist(rng);
        }
        for (int i = 0; i < 8; ++i) {
            ep_file_keys[i] = dist(rng);
        }
    }
};

inline const ZobristKeys& getZobristKeys() {
    static ZobristKeys keys_instance;
    return keys_instance;
}


// ───────────────────────── Position ────────────────────────────────
constexpr const char* START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

struct Position{
    std::array<Bitboard,12> bb{};
    std::array<Piece, 64> mailbox; // O(1) piece lookup
    Bitboard occWhite=0, occBlack=0, occ=0;

    uint8_t castlingRights=0;
    static const uint8_t WK_CASTLE_MASK = 0b0001;
    static const uint8_t WQ_CASTLE_MASK = 0b0010;
    static const uint8_t BK_CASTLE_MASK = 0b0100;
    static const uint8_t BQ_CASTLE_MASK = 0b1000;

    int epSquare = -1;
    bool whiteToMove = true;
    int halfmoveClock = 0;
    int fullmoveNumber = 1;
    uint64_t currentHash = 0;

    Position() {
        mailbox.fill(NO_PIECE);
    }

    static Position initial() { return fromFen(START_FEN); }

    static Position fromFen(const std::string& fen) {
        std::istringstream iss(fen);
        std::vector<std::string> fields;
        std::string token;
        while (iss >> token) fields.push_back(token);
        if (fields.size() < 2) throw std::runtime_error("Invalid FEN: expected <placement> <side> ...");

        Position p;
        int r = 7;
        int f = 0;
        for (char ch : fields[0]) {
            if (ch == '/') {
                if (f != 8) throw std::runtime_error("Invalid FEN: rank does not have 8 files");
                if (--r < 0) throw std::runtime_error("Invalid FEN: too many ranks");
                f = 0;
                continue;
            }
            if (ch >= '1' && ch <= '8') {
                f += ch - '0';
                if (f > 8) throw std::runtime_error("Invalid FEN: file overflow");
                continue;
            }
            Piece piece = pieceFromChar(ch);
            if (piece == NO_PIECE) throw std::runtime_error(std::string("Invalid FEN: unknown piece '") + ch + "'");
            if (f >= 8) throw std::runtime_error("Invalid FEN: too many files in rank");
            p.bb[piece] |= bit(square(r, f));
            ++f;
        }
        if (r != 0 || f != 8) throw std::runtime_error("Invalid FEN: board must be 8 ranks of 8 files");
        if (popcount(p.bb[W_KING]) != 1 || popcount(p.bb[B_KING]) != 1) {
            throw std::runtime_error("Invalid FEN: each side needs exactly one king");
        }

        if (fields[1] == "w") p.whiteToMove = true;
        else if (fields[1] == "b") p.whiteToMove = false;
        else throw std::runtime_error("Invalid FEN: side to move must be 'w' or 'b'");

        if (fields.size() > 2 && fields[2] != "-") {
            for (char ch : fields[2]) {
                if (ch == 'K') p.castlingRights |= WK_CASTLE_MASK;
                else if (ch == 'Q') p.castlingRights |= WQ_CASTLE_MASK;
                else if (ch == 'k') p.castlingRights |= BK_CASTLE_MASK;
                else if (ch == 'q') p.castlingRights |= BQ_CASTLE_MASK;
                else throw std::runtime_error(std::string("Invalid FEN: bad castling flag '") + ch + "'");
            }
        }

        if (fields.size() > 3 && fields[3] != "-") {
            p.epSquare = parseSquare(fields[3]);
            if (p.epSquare == -1) throw std::runtime_error("Invalid FEN: bad en passant square '" + fields[3] + "'");
        }

        if (fields.size() > 4) p.halfmoveClock = std::atoi(fields[4].c_str());
        if (fields.size() > 5) p.fullmoveNumber = std::max(1, std::atoi(fields[5].c_str()));

        p.updateOccupancies();
        p.syncMailboxFromBitboards();
        p.computeAndSetHash();
        return p;
    }

    std::string toFen() const {
        std::stringstream ss;
        for (int r = 7; r >= 0; --r) {
            int empty = 0;
            for (int f = 0; f < 8; ++f) {
                Piece piece = piece_at(square(r, f));
                if (piece == NO_PIECE) {
                    ++empty;
                    continue;
                }
                if (empty) {
                    ss << empty;
                    empty = 0;
                }
                ss << PIECE_CHAR_REPR[piece];
            }
            if (empty) ss << empty;
            if (r > 0) ss << '/';
        }
        ss << (whiteToMove ? " w " : " b ");
        if (castlingRights & WK_CASTLE_MASK) ss << "K";
        if (castlingRights & WQ_CASTLE_MASK) ss << "Q";
        if (castlingRights & BK_CASTLE_MASK) ss << "k";
        if (castlingRights & BQ_CASTLE_MASK) ss << "q";
        if (castlingRights == 0) ss << "-";
        ss << ' ' << (epSquare == -1 ? std::string("-") : squareToAlgebraic(epSquare));
        ss << ' ' << halfmoveClock << ' ' << fullmoveNumber;
        return ss.str();
    }

    void updateOccupancies(){
        occWhite=occBlack=0;
        for(int i=W_PAWN; i<=W_KING; ++i) occWhite |= bb[i];
        for(int i=B_PAWN; i<=B_KING; ++i) occBlack |= bb[i];
        occ = occWhite | occBlack;
    }

    void syncMailboxFromBitboards() {
        mailbox.fill(NO_PIECE);
        for (int piece_type = 0; piece_type < 12; ++piece_type) {
            Bitboard b = bb[piece_type];
            while(b) {
                int sq = lsb_idx(b);
                mailbox[sq] = static_cast<Piece>(piece_type);
                b &= b - 1;
            }
        }
    }

    Piece piece_at(int sq) const {
        return mailbox[sq];
    }

    void computeAndSetHash() {
        const auto& keys = getZobristKeys();
        uint64_t h = 0;
        for(int piece_type = 0; piece_type < 12; ++piece_type) {
            Bitboard current_piece_bb = bb[piece_type];
            while(current_piece_bb) {
                int sq = lsb_idx(current_piece_bb);
                h ^= keys.piece_square_keys[piece_type][sq];
                current_piece_bb &= current_piece_bb - 1;
            }
        }
        if (!whiteToMove) {
            h ^= keys.black_to_move_key;
        }
        h ^= keys.castling_keys[castlingRights & 0xF];
        if (epSquare != -1) {
            h ^= keys.ep_file_keys[file_of(epSquare)];
        }
        currentHash = h;
    }

    std::string pretty() const {
        std::stringstream ss;
        ss << "  +-----------------+\n";
        for (int r_disp = 7; r_disp >= 0; --r_disp) {
            ss << r_disp + 1 << " | ";
            for (int f_disp = 0; f_disp < 8; ++f_disp) {
                Piece p = piece_at(square(r_disp,f_disp));
                ss << (p == NO_PIECE ? '.' : PIECE_CHAR_REPR[p]) << " ";
            }
            ss << "|\n";
        }
        ss << "  +-----------------+\n";
        ss << "    a b c d e f g h\n";
        ss << (whiteToMove ? "White" : "Black") << " to move.\n";
        ss << "FEN: " << toFen() << "\n";
        return ss.str();
    }
};

// ───────────────────────── Outcome enum ────────────────────────────
enum class Outcome {
    ONGOING, CHECKMATE, STALEMATE, DRAW_FIFTY_MOVE, DRAW_THREEFOLD_REPETITION, DRAW_INSUFFICIENT_MATERIAL
};

// ───────────────────────── Attack queries ─────────────────────────
inline Bitboard getAttackers(const Position& p, int sq, bool by_white, Bitboard blockers) {
    const auto& t = attacks::tables();
    const Bitboard rooks_queens = by_white ? (p.bb[W_ROOK] | p.bb[W_QUEEN]) : (p.bb[B_ROOK] | p.bb[B_QUEEN]);
    const Bitboard bishops_queens = by_white ? (p.bb[W_BISHOP] | p.bb[W_QUEEN]) : (p.bb[B_BISHOP] | p.bb[B_QUEEN]);

    Bitboard attackers = 0ULL;
    attackers |= t.pawn[by_white ? 1 : 0][sq] & (by_white ? p.bb[W_PAWN] : p.bb[B_PAWN]);
    attackers |= t.knight[sq] & (by_white ? p.bb[W_KNIGHT] : p.bb[B_KNIGHT]);
    attackers |= t.king[sq] & (by_white ? p.bb[W_KING] : p.bb[B_KING]);
    attackers |= attacks::get_rook_attacks(sq, blockers) & rooks_queens;
    attackers |= attacks::get_bishop_attacks(sq, blockers) & bishops_queens;
    return attackers;
}

inline bool isSquareAttacked(const Position& p, int sq, bool by_white, Bitboard blockers) {
    return getAttackers(p, sq, by_white, blockers) != 0;
}

inline bool isSquareAttacked(const Position& p, int sq, bool by_white) {
    return isSquareAttacked(p, sq, by_white, p.occ);
}

inline bool inCheck(const Position& p) {
    const int king_sq = lsb_idx(p.bb[p.whiteToMove ? W_KING : B_KING]);
    return king_sq != -1 && isSquareAttacked(p, king_sq, !p.whiteToMove);
}

// ───────────────────────── Move generation ─────────────────────────
namespace detail {

    inline void addPromotions(int from_sq, int to_sq, std::vector<Move>& moves) {
        moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_Q));
        moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_R));
        moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_B));
        moves.push_back(encodeMove(from_sq, to_sq, PROMO_TYPE_N));
    }

    // En passant removes two pawns from the same rank, so it is checked against the
    // resulting occupancy instead of the pin and check masks.
    inline bool enPassantIsLegal(const Position& p, int from_sq) {
        const bool is_white = p.whiteToMove;
        const auto& t = attacks::tables();
        const int king_sq = lsb_idx(p.bb[is_white ? W_KING : B_KING]);
        const int captured_sq = p.epSquare + (is_white ? -8 : 8);
        const Bitboard occ_after = (p.occ ^ bit(from_sq) ^ bit(captured_sq)) | bit(p.epSquare);

        const Bitboard enemy_rooks_queens = is_white ? (p.bb[B_ROOK] | p.bb[B_QUEEN]) : (p.bb[W_ROOK] | p.bb[W_QUEEN]);
        const Bitboard enemy_bishops_queens = is_white ? (p.bb[B_BISHOP] | p.bb[B_QUEEN]) : (p.bb[W_BISHOP] | p.bb[W_QUEEN]);
        const Bitboard enemy_knights = is_white ? p.bb[B_KNIGHT] : p.bb[W_KNIGHT];
        const Bitboard enemy_pawns = (is_white ? p.bb[B_PAWN] : p.bb[W_PAWN]) & ~bit(captured_sq);

        if (attacks::get_rook_attacks(king_sq, occ_after) & enemy_rooks_queens) return false;
        if (attacks::get_bishop_attacks(king_sq, occ_after) & enemy_bishops_queens) return false;
        if (t.knight[king_sq] & enemy_knights) return false;
        if (t.pawn[is_white ? 0 : 1][king_sq] & enemy_pawns) return false;
        return true;
    }

    inline void addPawnMoves(const Position& p, int from_sq, std::vector<Move>& moves, Bitboard target_mask) {
        const bool is_white = p.whiteToMove;
        const int dir = is_white ? 8 : -8;
        const Bitboard enemy_pieces = is_white ? p.occBlack : p.occWhite;
        const Bitboard promotion_rank = is_white ? RANK_8 : RANK_1;
        const Bitboard start_rank = is_white ? RANK_2 : RANK_7;

        int to_sq_one_step = from_sq + dir;
        if (!(p.occ & bit(to_sq_one_step))) {
            if (target_mask & bit(to_sq_one_step)) {
                if (promotion_rank & bit(to_sq_one_step)) {
                    addPromotions(from_sq, to_sq_one_step, moves);
                } else {
                    moves.push_back(encodeMove(from_sq, to_sq_one_step));
                }
            }

            if (start_rank & bit(from_sq)) {
                int to_sq_two_steps = from_sq + dir * 2;
                if (!(p.occ & bit(to_sq_two_steps)) && (target_mask & bit(to_sq_two_steps))) {
                    moves.push_back(encodeMove(from_sq, to_sq_two_steps, PROMO_TYPE_NONE, DPP_FLAG));
                }
            }
        }

        const Bitboard pawn_attacks = attacks::tables().pawn[is_white ? 0 : 1][from_sq];
        Bitboard captures = pawn_attacks & enemy_pieces & target_mask;
        while (captures) {
            int to_sq = lsb_idx(captures);
            if (promotion_rank & bit(to_sq)) {
                addPromotions(from_sq, to_sq, moves);
            } else {
                moves.push_back(encodeMove(from_sq, to_sq));
            }
            captures &= captures - 1;
        }

        if (p.epSquare != -1 && (pawn_attacks & bit(p.epSquare)) && enPassantIsLegal(p, from_sq)) {
            moves.push_back(encodeMove(from_sq, p.epSquare, PROMO_TYPE_NONE, EP_FLAG));
        }
    }

    inline void addTargets(int from_sq, Bitboard targets, std::vector<Move>& moves) {
        while (targets) {
            moves.push_back(encodeMove(from_sq, lsb_idx(targets)));
            targets &= targets - 1;
        }
    }

    inline void addKingMoves(const Position& p, int from_sq, std::vector<Move>& moves) {
        const bool is_white = p.whiteToMove;
        const Bitboard friendly_occ = is_white ? p.occWhite : p.occBlack;
        const Bitboard blockers_without_king = p.occ & ~bit(from_sq);

        Bitboard king_moves = attacks::tables().king[from_sq] & ~friendly_occ;
        while (king_moves) {
            int to_sq = lsb_idx(king_moves);
            if (!isSquareAttacked(p, to_sq, !is_white, blockers_without_king)) {
                moves.push_back(encodeMove(from_sq, to_sq));
            }
            king_moves &= king_moves - 1;
        }

        const int king_home_sq = is_white ? 4 : 60;
        if (from_sq != king_home_sq || isSquareAttacked(p, king_home_sq, !is_white)) return;

        const Bitboard own_rooks = p.bb[is_white ? W_ROOK : B_ROOK];
        if ((p.castlingRights & (is_white ? Position::WK_CASTLE_MASK : Position::BK_CASTLE_MASK)) &&
            (own_rooks & bit(king_home_sq + 3))) {
            int f1_sq = king_home_sq + 1;
            int g1_sq = king_home_sq + 2;
            if (!(p.occ & (bit(f1_sq) | bit(g1_sq))) &&
                !isSquareAttacked(p, f1_sq, !is_white) && !isSquareAttacked(p, g1_sq, !is_white)) {
                moves.push_back(encodeMove(from_sq, g1_sq, PROMO_TYPE_NONE, KSC_FLAG));
            }
        }
        if ((p.castlingRights & (is_white ? Position::WQ_CASTLE_MASK : Position::BQ_CASTLE_MASK)) &&
            (own_rooks & bit(king_home_sq - 4))) {
            int d1_sq = king_home_sq - 1;
            int c1_sq = king_home_sq - 2;
            int b1_sq = king_home_sq - 3;
            if (!(p.occ & (bit(d1_sq) | bit(c1_sq) | bit(b1_sq))) &&
                !isSquareAttacked(p, d1_sq, !is_white) && !isSquareAttacked(p, c1_sq, !is_white)) {
                moves.push_back(encodeMove(from_sq, c1_sq, PROMO_TYPE_NONE, QSC_FLAG));
            }
        }
    }

} // namespace detail

// Legal moves only: pieces in pawn..queen order, squares in ascending order, king last.
inline void generateMoves(const Position& p, std::vector<Move>& moves) {
    moves.clear();
    const bool is_white = p.whiteToMove;
    const int king_sq = lsb_idx(p.bb[is_white ? W_KING : B_KING]);
    if (king_sq == -1) return;

    const Bitboard friendly_pieces = is_white ? p.occWhite : p.occBlack;
    const Bitboard checkers = getAttackers(p, king_sq, !is_white, p.occ);
    const int num_checkers = popcount(checkers);

    if (num_checkers > 1) { // Double check
        detail::addKingMoves(p, king_sq, moves);
        return;
    }

    Bitboard check_resolution_mask = ~0ULL;
    if (num_checkers == 1) {
        int checker_sq = lsb_idx(checkers);
        check_resolution_mask = bit(checker_sq);
        PieceType checker = typeOf(p.piece_at(checker_sq));
        if (checker == BISHOP || checker == ROOK || checker == QUEEN) {
            check_resolution_mask |= attacks::get_ray_between(king_sq, checker_sq);
        }
    }

    Bitboard pinned = 0ULL;
    std::array<Bitboard, 64> pin_ray_map{};

    const Bitboard enemy_rooks_queens = is_white ? (p.bb[B_ROOK] | p.bb[B_QUEEN]) : (p.bb[W_ROOK] | p.bb[W_QUEEN]);
    const Bitboard enemy_bishops_queens = is_white ? (p.bb[B_BISHOP] | p.bb[B_QUEEN]) : (p.bb[W_BISHOP] | p.bb[W_QUEEN]);

    Bitboard potential_pinners = (attacks::get_rook_attacks(king_sq, 0) & enemy_rooks_queens) |
                                 (attacks::get_bishop_attacks(king_sq, 0) & enemy_bishops_queens);
    while (potential_pinners) {
        int pinner_sq = lsb_idx(potential_pinners);
        potential_pinners &= potential_pinners - 1;

        Bitboard ray_between = attacks::get_ray_between(king_sq, pinner_sq);
        if (popcount(ray_between & p.occ) == 1) {
            Bitboard pinned_piece_bb = ray_between & friendly_pieces;
            if (pinned_piece_bb) {
                int pinned_sq = lsb_idx(pinned_piece_bb);
                pinned |= bit(pinned_sq);
                pin_ray_map[pinned_sq] = attacks::get_line_through(king_sq, pinner_sq);
            }
        }
    }

    const auto& t = attacks::tables();
    const Color us = is_white ? Color::WHITE : Color::BLACK;
    for (int kind = PAWN; kind <= QUEEN; ++kind) {
        Bitboard piece_bb = p.bb[makePiece(us, static_cast<PieceType>(kind))];
        while (piece_bb) {
            int from_sq = lsb_idx(piece_bb);
            piece_bb &= piece_bb - 1;

            Bitboard move_mask = check_resolution_mask;
            if (pinned & bit(from_sq)) move_mask &= pin_ray_map[from_sq];

            switch (kind) {
                case PAWN:
                    detail::addPawnMoves(p, from_sq, moves, move_mask);
                    break;
                case KNIGHT:
                    detail::addTargets(from_sq, t.knight[from_sq] & ~friendly_pieces & move_mask, moves);
                    break;
                case BISHOP:
                    detail::addTargets(from_sq, attacks::get_bishop_attacks(from_sq, p.occ) & ~friendly_pieces & move_mask, moves);
                    break;
                case ROOK:
                    detail::addTargets(from_sq, attacks::get_rook_attacks(from_sq, p.occ) & ~friendly_pieces & move_mask, moves);
                    break;
                default:
                    detail::addTargets(from_sq, (attacks::get_rook_attacks(from_sq, p.occ) |
                                                 attacks::get_bishop_attacks(from_sq, p.occ)) & ~friendly_pieces & move_mask, moves);
                    break;
            }
        }
    }
    detail::addKingMoves(p, king_sq, moves);
}

// Plays a legal move on p in place, updating the hash incrementally.
inline void applyMove(Position& p, Move m) {
    const int from = fromSquare(m);
    const int to   = toSquare(m);
    const int flags = moveFlags(m);
    const Piece moved_piece = p.piece_at(from);
    if (moved_piece == NO_PIECE) { return; }

    const auto& keys = getZobristKeys();
    const bool mover_is_white = p.whiteToMove;
    const Color us = mover_is_white ? Color::WHITE : Color::BLACK;
    uint64_t new_hash = p.currentHash;

    if (p.epSquare != -1) { new_hash ^= keys.ep_file_keys[file_of(p.epSquare)]; }
    new_hash ^= keys.castling_keys[p.castlingRights & 0xF];

    // Lift the mover.
    p.bb[moved_piece] &= ~bit(from);
    p.mailbox[from] = NO_PIECE;
    new_hash ^= keys.piece_square_keys[moved_piece][from];

    // Remove whatever is captured.
    Piece captured = NO_PIECE;
    int captured_sq = to;
    if (flags & EP_FLAG) {
        captured_sq = mover_is_white ? to - 8 : to + 8;
        captured = mover_is_white ? B_PAWN : W_PAWN;
    } else {
        captured = p.piece_at(to);
    }
    if (captured != NO_PIECE) {
        p.bb[captured] &= ~bit(captured_sq);
        p.mailbox[captured_sq] = NO_PIECE;
        new_hash ^= keys.piece_square_keys[captured][captured_sq];
    }

    // Drop the mover, or the promoted piece, on the target square.
    const PieceType promo_type = promoToType(promotion(m));
    const Piece placed = promo_type == NO_PIECE_TYPE ? moved_piece : makePiece(us, promo_type);
    p.bb[placed] |= bit(to);
    p.mailbox[to] = placed;
    new_hash ^= keys.piece_square_keys[placed][to];

    if (flags & (KSC_FLAG | QSC_FLAG)) {
        const int back_rank = mover_is_white ? 0 : 7;
        const int r_from_sq = (flags & KSC_FLAG) ? square(back_rank, 7) : square(back_rank, 0);
        const int r_to_sq   = (flags & KSC_FLAG) ? square(back_rank, 5) : square(back_rank, 3);
        const Piece r_piece = mover_is_white ? W_ROOK : B_ROOK;
        p.bb[r_piece] &= ~bit(r_from_sq);
        p.bb[r_piece] |= bit(r_to_sq);
        p.mailbox[r_from_sq] = NO_PIECE;
        p.mailbox[r_to_sq] = r_piece;
        new_hash ^= keys.piece_square_keys[r_piece][r_from_sq];
        new_hash ^= keys.piece_square_keys[r_piece][r_to_sq];
    }

    p.epSquare = -1;
    // The en passant square is only recorded when an enemy pawn can take on it,
    // so repeated placements hash alike.
    if (flags & DPP_FLAG) {
        const int skipped = mover_is_white ? (to - 8) : (to + 8);
        const Piece enemy_pawn = mover_is_white ? B_PAWN : W_PAWN;
        if (attacks::tables().pawn[mover_is_white ? 0 : 1][skipped] & p.bb[enemy_pawn]) {
            p.epSquare = skipped;
            new_hash ^= keys.ep_file_keys[file_of(p.epSquare)];
        }
    }

    if (moved_piece == W_KING) { p.castlingRights &= ~(Position::WK_CASTLE_MASK | Position::WQ_CASTLE_MASK); }
    else if (moved_piece == B_KING) { p.castlingRights &= ~(Position::BK_CASTLE_MASK | Position::BQ_CASTLE_MASK); }
    if (from == square(0,0) || to == square(0,0)) { p.castlingRights &= ~Position::WQ_CASTLE_MASK; }
    if (from == square(0,7) || to == square(0,7)) { p.castlingRights &= ~Position::WK_CASTLE_MASK; }
    if (from == square(7,0) || to == square(7,0)) { p.castlingRights &= ~Position::BQ_CASTLE_MASK; }
    if (from == square(7,7) || to == square(7,7)) { p.castlingRights &= ~Position::BK_CASTLE_MASK; }
    new_hash ^= keys.castling_keys[p.castlingRights & 0xF];

    if (typeOf(moved_piece) == PAWN || captured != NO_PIECE) {
        p.halfmoveClock = 0;
    } else {
        p.halfmoveClock++;
    }
    if (!mover_is_white) {
        p.fullmoveNumber++;
    }

    p.whiteToMove = !mover_is_white;
    new_hash ^= keys.black_to_move_key;

    p.updateOccupancies();
    p.currentHash = new_hash;
}

// ───────────────────────── Perft ─────────────────────────────────
inline uint64_t perft(const Position& p, int depth) {
    if (depth <= 0) return 1ULL;

    std::vector<Move> legal_moves;
    generateMoves(p, legal_moves);
    if (depth == 1) return static_cast<uint64_t>(legal_moves.size());

    uint64_t nodes = 0;
    for (Move m : legal_moves) {
        Position next_pos = p;
        applyMove(next_pos, m);
        nodes += perft(next_pos, depth - 1);
    }
    return nodes;
}

inline std::vector<std::pair<Move, uint64_t>> perftDivide(const Position& p, int depth) {
    std::vector<std::pair<Move, uint64_t>> out;
    if (depth <= 0) return out;

    std::vector<Move> legal_moves;
    generateMoves(p, legal_moves);
    std::sort(legal_moves.begin(), legal_moves.end(), [](Move a, Move b){
        return moveToString(a) < moveToString(b);
    });
    for (Move m : legal_moves) {
        Position next_pos = p;
        applyMove(next_pos, m);
        out.push_back(std::make_pair(m, perft(next_pos, depth - 1)));
    }
    return out;
}

// ───────────────────────── Move records ─────────────────────────
// A legal move with everything a caller needs to know about it. A record with
// code 0 stands for "no move".
struct MoveRecord {
    Move code = 0;
    int from = -1;
    int to = -1;
    Color color = Color::WHITE;
    PieceType piece = NO_PIECE_TYPE;
    PieceType captured = NO_PIECE_TYPE;
    PieceType promotion = NO_PIECE_TYPE;
    std::string notation = "0000";

    bool isNull() const { return code == 0; }
    explicit operator bool() const { return code != 0; }
    bool isCapture() const { return captured != NO_PIECE_TYPE; }
    bool isPromotion() const { return promotion != NO_PIECE_TYPE; }

    bool operator==(const MoveRecord& other) const { return code == other.code; }
    bool operator!=(const MoveRecord& other) const { return code != other.code; }
};

inline MoveRecord describeMove(const Position& p, Move m) {
    MoveRecord rec;
    rec.code = m;
    rec.from = fromSquare(m);
    rec.to = toSquare(m);
    rec.color = p.whiteToMove ? Color::WHITE : Color::BLACK;
    rec.piece = typeOf(p.piece_at(rec.from));
    rec.captured = (moveFlags(m) & EP_FLAG) ? PAWN : typeOf(p.piece_at(rec.to));
    rec.promotion = promoToType(promotion(m));
    rec.notation = moveToString(m);
    return rec;
}

// 8x8 grid of pieces as seen from White: row 0 is rank 8, column 0 is file a.
using BoardGrid = std::array<std::array<Piece, 8>, 8>;

// ───────────────────────── Board ─────────────────────────────────
// Game state with apply/undo history. This is the collaborator the search runs
// against: every move() must be paired with exactly one undo().
class Board {
public:
    Board() : Board(Position::initial()) {}
    explicit Board(const std::string& fen) : Board(Position::fromFen(fen)) {}
    explicit Board(const Position& pos) : pos_(pos) {
        if (pos_.currentHash == 0) pos_.computeAndSetHash();
    }

    void load(const std::string& fen) {
        pos_ = Position::fromFen(fen);
        stack_.clear();
        invalidate();
    }

    void reset() { load(START_FEN); }

    std::string fen() const { return pos_.toFen(); }
    const Position& position() const { return pos_; }
    Color turn() const { return pos_.whiteToMove ? Color::WHITE : Color::BLACK; }
    uint64_t hash() const { return pos_.currentHash; }

    std::vector<MoveRecord> moves() const {
        const std::vector<Move>& legal = legalMoves();
        std::vector<MoveRecord> out;
        out.reserve(legal.size());
        for (Move m : legal) out.push_back(describeMove(pos_, m));
        return out;
    }

    std::vector<MoveRecord> moves(int from_sq) const {
        std::vector<MoveRecord> out;
        for (Move m : legalMoves()) {
            if (fromSquare(m) == from_sq) out.push_back(describeMove(pos_, m));
        }
        return out;
    }

    std::vector<MoveRecord> moves(const std::string& from_square) const {
        const int sq = parseSquare(from_square);
        if (sq == -1) throw std::runtime_error("Invalid square '" + from_square + "'");
        return moves(sq);
    }

    // Returns the applied move, or a null record if m is not legal here.
    MoveRecord move(const MoveRecord& m) {
        const std::vector<Move>& legal = legalMoves();
        if (m.isNull() || std::find(legal.begin(), legal.end(), m.code) == legal.end()) return MoveRecord();
        return play(m.code);
    }

    // Long algebraic input ("e2e4", "e7e8q"); a missing promotion letter means queen.
    MoveRecord move(const std::string& uci) {
        for (Move m : legalMoves()) {
            const std::string text = moveToString(m);
            if (text == uci || (promotion(m) == PROMO_TYPE_Q && text.compare(0, 4, uci) == 0 && uci.size() == 4)) {
                return play(m);
            }
        }
        return MoveRecord();
    }

    MoveRecord undo() {
        if (stack_.empty()) return MoveRecord();
        MoveRecord last = stack_.back().played;
        pos_ = stack_.back().before;
        stack_.pop_back();
        invalidate();
        return last;
    }

    bool inCheck() const { return chessai::inCheck(pos_); }
    bool isCheckmate() const { return inCheck() && legalMoves().empty(); }
    bool isStalemate() const { return !inCheck() && legalMoves().empty(); }

    bool isInsufficientMaterial() const {
        const int total = popcount(pos_.occ);
        if (total == 2) return true; // bare kings
        const Bitboard knights = pos_.bb[W_KNIGHT] | pos_.bb[B_KNIGHT];
        const Bitboard bishops = pos_.bb[W_BISHOP] | pos_.bb[B_BISHOP];
        if (total == 3 && (knights || bishops)) return true;
        if (total == popcount(bishops) + 2) {
            return (bishops & LIGHT_SQUARES) == 0 || (bishops & ~LIGHT_SQUARES) == 0;
        }
        return false;
    }

    bool isThreefoldRepetition() const {
        int seen = 1;
        for (const Step& s : stack_) {
            if (s.before.currentHash == pos_.currentHash) ++seen;
        }
        return seen >= 3;
    }

    bool isDraw() const {
        return pos_.halfmoveClock >= 100 || isStalemate() || isInsufficientMaterial() || isThreefoldRepetition();
    }

    bool isGameOver() const { return isCheckmate() || isDraw(); }

    Outcome outcome() const {
        if (isCheckmate()) return Outcome::CHECKMATE;
        if (isStalemate()) return Outcome::STALEMATE;
        if (pos_.halfmoveClock >= 100) return Outcome::DRAW_FIFTY_MOVE;
        if (isInsufficientMaterial()) return Outcome::DRAW_INSUFFICIENT_MATERIAL;
        if (isThreefoldRepetition()) return Outcome::DRAW_THREEFOLD_REPETITION;
        return Outcome::ONGOING;
    }

    BoardGrid board() const {
        BoardGrid grid;
        for (int row = 0; row < 8; ++row) {
            for (int col = 0; col < 8; ++col) {
                grid[row][col] = pos_.piece_at(square(7 - row, col));
            }
        }
        return grid;
    }

    std::vector<MoveRecord> history() const {
        std::vector<MoveRecord> out;
        out.reserve(stack_.size());
        for (const Step& s : stack_) out.push_back(s.played);
        return out;
    }

    std::string pretty() const { return pos_.pretty(); }

private:
    struct Step {
        Position before;
        MoveRecord played;
    };

    Position pos_;
    std::vector<Step> stack_;

    // Legal moves of pos_, regenerated lazily after every change.
    mutable std::vector<Move> legal_;
    mutable bool legal_valid_ = false;

    const std::vector<Move>& legalMoves() const {
        if (!legal_valid_) {
            generateMoves(pos_, legal_);
            legal_valid_ = true;
        }
        return legal_;
    }

    void invalidate() { legal_valid_ = false; }

    MoveRecord play(Move m) {
        Step step;
        step.before = pos_;
        step.played = describeMove(pos_, m);
        applyMove(pos_, m);
        stack_.push_back(step);
        invalidate();
        return step.played;
    }
};

} // namespace chessai

#endif // CHESSAI_CHESS_ENGINE_HPP
