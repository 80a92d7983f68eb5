#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>       // std::vector, std::array, std::pair
#include <pybind11/functional.h>
#include "chess_engine.hpp"
#include "evaluation.hpp"
#include "move_ordering.hpp"
#include "difficulty.hpp"
#include "ai.hpp"

namespace py = pybind11;

namespace {

// Null records cross into Python as None.
py::object toPython(const chessai::MoveRecord& m) {
    if (m.isNull()) return py::none();
    return py::cast(m);
}

py::object findBestMove(chessai::Board& board, const std::string& difficulty, py::object seed,
                        const chessai::SearchInfoCallback& on_info) {
    const chessai::DifficultyProfile& profile = chessai::difficultyProfile(difficulty);
    chessai::SearchOptions options;
    std::mt19937_64 seeded;
    if (!seed.is_none()) {
        seeded.seed(seed.cast<uint64_t>());
        options.rng = &seeded;
    }
    options.onInfo = on_info;

    return toPython(chessai::findBestMove(board, profile, options));
}

} // namespace

PYBIND11_MODULE(chessai, m) {
    m.doc() = "Python bindings for the chessai search engine";

    py::enum_<chessai::Color>(m, "Color", "Side to move")
        .value("WHITE", chessai::Color::WHITE)
        .value("BLACK", chessai::Color::BLACK)
        .export_values();

    py::enum_<chessai::Piece>(m, "Piece", "Coloured chess pieces")
        .value("W_PAWN",   chessai::Piece::W_PAWN)
        .value("W_KNIGHT", chessai::Piece::W_KNIGHT)
        .value("W_BISHOP", chessai::Piece::W_BISHOP)
        .value("W_ROOK",   chessai::Piece::W_ROOK)
        .value("W_QUEEN",  chessai::Piece::W_QUEEN)
        .value("W_KING",   chessai::Piece::W_KING)
        .value("B_PAWN",   chessai::Piece::B_PAWN)
        .value("B_KNIGHT", chessai::Piece::B_KNIGHT)
        .value("B_BISHOP", chessai::Piece::B_BISHOP)
        .value("B_ROOK",   chessai::Piece::B_ROOK)
        .value("B_QUEEN",  chessai::Piece::B_QUEEN)
        .value("B_KING",   chessai::Piece::B_KING)
        .value("NO_PIECE", chessai::Piece::NO_PIECE)
        .export_values();

    py::enum_<chessai::PieceType>(m, "PieceType", "Colourless piece kinds")
        .value("PAWN",          chessai::PieceType::PAWN)
        .value("KNIGHT",        chessai::PieceType::KNIGHT)
        .value("BISHOP",        chessai::PieceType::BISHOP)
        .value("ROOK",          chessai::PieceType::ROOK)
        .value("QUEEN",         chessai::PieceType::QUEEN)
        .value("KING",          chessai::PieceType::KING)
        .value("NO_PIECE_TYPE", chessai::PieceType::NO_PIECE_TYPE)
        .export_values();

    py::enum_<chessai::Outcome>(m, "Outcome", "Possible game outcomes")
        .value("ONGOING", chessai::Outcome::ONGOING)
        .value("CHECKMATE", chessai::Outcome::CHECKMATE)
        .value("STALEMATE", chessai::Outcome::STALEMATE)
        .value("DRAW_FIFTY_MOVE", chessai::Outcome::DRAW_FIFTY_MOVE)
        .value("DRAW_THREEFOLD_REPETITION", chessai::Outcome::DRAW_THREEFOLD_REPETITION)
        .value("DRAW_INSUFFICIENT_MATERIAL", chessai::Outcome::DRAW_INSUFFICIENT_MATERIAL)
        .export_values();

    py::class_<chessai::MoveRecord>(m, "MoveRecord", "A legal move as reported by the board")
        .def_readonly("from_square", &chessai::MoveRecord::from, "Origin square index (0 = a1)")
        .def_readonly("to_square", &chessai::MoveRecord::to, "Destination square index")
        .def_readonly("color", &chessai::MoveRecord::color)
        .def_readonly("piece", &chessai::MoveRecord::piece)
        .def_readonly("captured", &chessai::MoveRecord::captured, "NO_PIECE_TYPE for quiet moves")
        .def_readonly("promotion", &chessai::MoveRecord::promotion, "NO_PIECE_TYPE unless promoting")
        .def_readonly("notation", &chessai::MoveRecord::notation, "Long algebraic, e.g. e7e8q")
        .def("is_capture", &chessai::MoveRecord::isCapture)
        .def("is_promotion", &chessai::MoveRecord::isPromotion)
        .def("__eq__", [](const chessai::MoveRecord& a, const chessai::MoveRecord& b) { return a == b; })
        .def("__hash__", [](const chessai::MoveRecord& a) { return a.code; })
        .def("__str__", [](const chessai::MoveRecord& a) { return a.notation; })
        .def("__repr__", [](const chessai::MoveRecord& a) { return "<MoveRecord " + a.notation + ">"; });

    py::class_<chessai::Board>(m, "Board", "Chess game with move history")
        .def(py::init<>())
        .def(py::init<const std::string&>(), py::arg("fen"), "Raises RuntimeError on a malformed FEN")
        .def("load", &chessai::Board::load, py::arg("fen"))
        .def("reset", &chessai::Board::reset)
        .def("fen", &chessai::Board::fen)
        .def("turn", &chessai::Board::turn)
        .def("hash", &chessai::Board::hash, "Zobrist hash of the current position")
        .def("moves", [](const chessai::Board& b) { return b.moves(); })
        .def("moves", [](const chessai::Board& b, const std::string& sq) { return b.moves(sq); }, py::arg("square"))
        .def("move", [](chessai::Board& b, const std::string& uci) { return toPython(b.move(uci)); }, py::arg("uci"),
             "Plays a long algebraic move; returns None if it is not legal.")
        .def("move", [](chessai::Board& b, const chessai::MoveRecord& mv) { return toPython(b.move(mv)); }, py::arg("move"))
        .def("undo", [](chessai::Board& b) { return toPython(b.undo()); })
        .def("in_check", &chessai::Board::inCheck)
        .def("is_checkmate", &chessai::Board::isCheckmate)
        .def("is_stalemate", &chessai::Board::isStalemate)
        .def("is_insufficient_material", &chessai::Board::isInsufficientMaterial)
        .def("is_threefold_repetition", &chessai::Board::isThreefoldRepetition)
        .def("is_draw", &chessai::Board::isDraw)
        .def("is_game_over", &chessai::Board::isGameOver)
        .def("outcome", &chessai::Board::outcome)
        .def("board", &chessai::Board::board, "8x8 grid of Piece, row 0 = rank 8")
        .def("history", &chessai::Board::history)
        .def("__str__", &chessai::Board::pretty);

    py::class_<chessai::DifficultyProfile>(m, "DifficultyProfile", "Search limits for one difficulty tier")
        .def_readonly("name", &chessai::DifficultyProfile::name)
        .def_readonly("depth", &chessai::DifficultyProfile::depth)
        .def_readonly("node_limit", &chessai::DifficultyProfile::nodeLimit)
        .def_readonly("randomness", &chessai::DifficultyProfile::randomness)
        .def_readonly("time_ms", &chessai::DifficultyProfile::timeMs);

    py::class_<chessai::SearchInfo>(m, "SearchInfo", "Progress report for one deepening iteration")
        .def_readonly("depth", &chessai::SearchInfo::depth)
        .def_readonly("score", &chessai::SearchInfo::score)
        .def_readonly("nodes", &chessai::SearchInfo::nodes)
        .def_readonly("time_ms", &chessai::SearchInfo::timeMs)
        .def_readonly("best", &chessai::SearchInfo::best)
        .def_readonly("completed", &chessai::SearchInfo::completed);

    m.def("difficulty_profile", &chessai::difficultyProfile, py::arg("name"),
          "Preset for a tier name; unknown names give the moderate preset.");
    m.def("difficulty_names", &chessai::difficultyNames);

    m.def("evaluate", [](const chessai::Board& b) { return chessai::evaluate(b); }, py::arg("board"),
          "Static evaluation in centipawns, positive when White is better.");
    m.def("order_moves", &chessai::orderMoves, py::arg("moves"));

    m.def("find_best_move", &findBestMove,
          py::arg("board"),
          py::arg("difficulty") = std::string(chessai::DEFAULT_DIFFICULTY),
          py::arg("seed") = py::none(),
          py::arg("on_info") = chessai::SearchInfoCallback(),
          "Move for the side to move, or None if the game is over.");

    m.def("perft", [](const chessai::Board& b, int depth) { return chessai::perft(b.position(), depth); },
          py::arg("board"), py::arg("depth"),
          "Run a performance test (perft) to the given depth from the position.");
}
