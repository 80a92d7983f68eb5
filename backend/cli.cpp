#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "chess_engine.hpp"
#include "evaluation.hpp"
#include "difficulty.hpp"
#include "ai.hpp"

using chessai::Board;
using chessai::MoveRecord;

static void usage(const std::string& exe) {
    std::cerr << "Usage:\n"
              << "  " << exe << " bestmove [--fen <fen>] [--difficulty <tier>] [--depth N] [--seed N] [--verbose]\n"
              << "  " << exe << " eval [--fen <fen>]\n"
              << "  " << exe << " perft <depth> [--fen <fen>] [--divide]\n"
              << "  " << exe << " play [--fen <fen>] [--difficulty <tier>] [--depth N] [--maxplies N] [--seed N]\n"
              << "       (you play White by typing moves like e2e4; 'undo' and 'quit' are also accepted)\n"
              << "  " << exe << " difficulties\n";
}

static bool argValue(int argc, char** argv, const std::string& key, std::string& out) {
    for (int i = 2; i + 1 < argc; ++i) {
        if (key == argv[i]) {
            out = argv[i + 1];
            return true;
        }
    }
    return false;
}

static bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 2; i < argc; ++i) {
        if (key == argv[i]) return true;
    }
    return false;
}

static int intArg(int argc, char** argv, const std::string& key, int def) {
    std::string v;
    if (argValue(argc, argv, key, v)) return std::atoi(v.c_str());
    return def;
}

static Board loadBoardFromArgs(int argc, char** argv) {
    std::string fen;
    if (argValue(argc, argv, "--fen", fen)) return Board(fen);
    return Board();
}

static chessai::DifficultyProfile profileFromArgs(int argc, char** argv) {
    std::string name = chessai::DEFAULT_DIFFICULTY;
    argValue(argc, argv, "--difficulty", name);
    for (char& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    const chessai::DifficultyProfile& preset = chessai::difficultyProfile(name);
    if (preset.name != name) {
        std::cerr << "warning: unknown difficulty '" << name << "', using " << preset.name << "\n";
    }
    chessai::DifficultyProfile profile = preset;
    profile.depth = intArg(argc, argv, "--depth", profile.depth);
    if (profile.depth < 1) throw std::runtime_error("--depth must be at least 1");
    return profile;
}

// Seeds from --seed when given, otherwise from the clock.
static std::mt19937_64 rngFromArgs(int argc, char** argv) {
    std::string seed;
    if (argValue(argc, argv, "--seed", seed)) return std::mt19937_64(std::stoull(seed));
    return std::mt19937_64(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
}

static void printInfo(const chessai::SearchInfo& info) {
    std::cerr << "info depth " << info.depth
              << " score " << info.score
              << " nodes " << info.nodes
              << " time " << info.timeMs
              << " pv " << info.best.notation
              << (info.completed ? "" : " (partial)") << "\n";
}

// A failing search is retried once with the default tier before giving up.
static MoveRecord searchWithFallback(Board& board, const chessai::DifficultyProfile& profile,
                                     const chessai::SearchOptions& options) {
    try {
        return chessai::findBestMove(board, profile, options);
    } catch (const std::exception& e) {
        if (profile.name == chessai::DEFAULT_DIFFICULTY) throw;
        std::cerr << "warning: " << profile.name << " search failed (" << e.what()
                  << "), falling back to " << chessai::DEFAULT_DIFFICULTY << "\n";
    }
    return chessai::findBestMove(board, chessai::difficultyProfile(chessai::DEFAULT_DIFFICULTY), options);
}

static std::string gameResult(const Board& board) {
    switch (board.outcome()) {
        case chessai::Outcome::CHECKMATE:
            return board.turn() == chessai::Color::WHITE ? "Checkmate! Black wins." : "Checkmate! White wins.";
        case chessai::Outcome::STALEMATE:                 return "Draw by stalemate.";
        case chessai::Outcome::DRAW_FIFTY_MOVE:           return "Draw by the fifty-move rule.";
        case chessai::Outcome::DRAW_THREEFOLD_REPETITION: return "Draw by threefold repetition.";
        case chessai::Outcome::DRAW_INSUFFICIENT_MATERIAL: return "Draw by insufficient material.";
        case chessai::Outcome::ONGOING:                   break;
    }
    return "";
}

static void cmdBestmove(int argc, char** argv) {
    Board board = loadBoardFromArgs(argc, argv);
    const chessai::DifficultyProfile profile = profileFromArgs(argc, argv);
    std::mt19937_64 rng = rngFromArgs(argc, argv);

    chessai::SearchOptions options;
    options.rng = &rng;
    if (hasFlag(argc, argv, "--verbose")) {
        std::cerr << board.pretty() << "\n";
        std::cerr << "FEN: " << board.fen() << "\n";
        options.onInfo = printInfo;
    }

    const MoveRecord best = searchWithFallback(board, profile, options);
    std::cout << "bestmove " << (best ? best.notation : std::string("(none)")) << "\n";
}

static void cmdEval(int argc, char** argv) {
    const Board board = loadBoardFromArgs(argc, argv);
    std::cout << chessai::evaluate(board) << "\n";
}

static void cmdPerft(int argc, char** argv) {
    if (argc < 3) throw std::runtime_error("perft: missing depth");
    const int depth = std::atoi(argv[2]);
    const Board board = loadBoardFromArgs(argc, argv);

    std::cout << board.pretty() << "\n";
    std::cout << "FEN: " << board.fen() << "\n\n";

    const auto start = std::chrono::steady_clock::now();
    uint64_t total = 0;
    if (hasFlag(argc, argv, "--divide")) {
        for (const auto& row : chessai::perftDivide(board.position(), depth)) {
            std::cout << chessai::moveToString(row.first) << "  " << row.second << "\n";
            total += row.second;
        }
    } else {
        total = chessai::perft(board.position(), depth);
    }
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::cout << "Nodes: " << total << "\n";
    std::cout << "Time : " << seconds << " s\n";
    if (seconds > 0.0) std::cout << "NPS  : " << static_cast<uint64_t>(static_cast<double>(total) / seconds) << "\n";
}

static void cmdPlay(int argc, char** argv) {
    Board board = loadBoardFromArgs(argc, argv);
    const chessai::DifficultyProfile profile = profileFromArgs(argc, argv);
    const int max_plies = intArg(argc, argv, "--maxplies", 0);
    std::mt19937_64 rng = rngFromArgs(argc, argv);

    chessai::SearchOptions options;
    options.rng = &rng;

    int plies = 0;
    while (!board.isGameOver() && (max_plies <= 0 || plies < max_plies)) {
        if (board.turn() == chessai::Color::BLACK) {
            const MoveRecord reply = searchWithFallback(board, profile, options);
            if (!reply) {
                std::cout << "Engine has no move.\n";
                break;
            }
            if (!board.move(reply)) throw std::runtime_error("engine chose an illegal move " + reply.notation);
            ++plies;
            std::cout << "Engine plays: " << reply.notation << "\n";
            continue;
        }

        std::cout << "\n" << board.pretty() << "\n";
        std::cout << "FEN: " << board.fen() << "\n";
        std::cout << "Your move: " << std::flush;

        std::string line;
        if (!std::getline(std::cin, line) || line == "quit") break;
        if (line.empty()) continue;
        if (line == "undo") {
            // Takes back the engine's reply together with your last move.
            if (board.undo()) --plies;
            if (board.turn() == chessai::Color::BLACK && board.undo()) --plies;
            continue;
        }
        if (!board.move(line)) {
            std::cout << "Illegal move '" << line << "'.\n";
            continue;
        }
        ++plies;
    }

    std::cout << "\n" << board.pretty() << "\n";
    const std::string result = gameResult(board);
    if (!result.empty()) std::cout << result << "\n";
}

static void cmdDifficulties() {
    for (const chessai::DifficultyProfile& p : chessai::difficultyPresets()) {
        std::cout << p.name
                  << "  depth " << p.depth
                  << "  nodes " << p.nodeLimit
                  << "  randomness " << p.randomness
                  << "  time " << p.timeMs << " ms"
                  << (p.name == chessai::DEFAULT_DIFFICULTY ? "  (default)" : "") << "\n";
    }
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            usage(argv[0]);
            return 1;
        }
        const std::string cmd = argv[1];
        if (cmd == "bestmove") {
            cmdBestmove(argc, argv);
            return 0;
        }
        if (cmd == "eval") {
            cmdEval(argc, argv);
            return 0;
        }
        if (cmd == "perft") {
            cmdPerft(argc, argv);
            return 0;
        }
        if (cmd == "play") {
            cmdPlay(argc, argv);
            return 0;
        }
        if (cmd == "difficulties") {
            cmdDifficulties();
            return 0;
        }

        usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
