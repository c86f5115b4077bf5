#include <catch2/catch_test_macros.hpp>
#include "gambit/chess/standard_chess_rules.hpp"
#include <initializer_list>
#include <string_view>

using namespace gambit;
using namespace gambit::chess;

namespace {
    void PlayAll(StandardChessRules& rules, std::initializer_list<std::string_view> moves) {
        for (const auto move : moves) {
            INFO("move " << move);
            REQUIRE(rules.ApplyMove(move).IsOk());
        }
    }

    StandardChessRules FromFen(std::string_view fen) {
        StandardChessRules rules;
        REQUIRE(rules.LoadFen(fen).IsOk());
        return rules;
    }
}

TEST_CASE("StandardChessRules - Initial position", "[chess]") {
    StandardChessRules rules;
    REQUIRE(rules.ToFen() == Position::kStartFen);
    REQUIRE(rules.SideToMove() == Color::White);
    REQUIRE(rules.GetTerminalState() == TerminalState::Ongoing);
    REQUIRE_FALSE(rules.IsInCheck());
    REQUIRE(rules.ToPgn().empty());
}

TEST_CASE("StandardChessRules - Accepted notations", "[chess]") {
    StandardChessRules rules;

    SECTION("SAN") {
        auto applied = rules.ApplyMove("e4");
        REQUIRE(applied.IsOk());
        REQUIRE(applied.Unwrap().san == "e4");
        REQUIRE(applied.Unwrap().uci == "e2e4");
        REQUIRE(applied.Unwrap().mover == Color::White);
        // No en passant square: no black pawn can take.
        REQUIRE(rules.ToFen() == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
        REQUIRE(rules.SideToMove() == Color::Black);
        REQUIRE(rules.CurrentPosition().PieceAt(MakeSquare(4, 3)) == Piece{PieceType::Pawn, Color::White});
        REQUIRE_FALSE(rules.CurrentPosition().PieceAt(MakeSquare(4, 1)).has_value());
    }

    SECTION("UCI") {
        auto applied = rules.ApplyMove("g1f3");
        REQUIRE(applied.IsOk());
        REQUIRE(applied.Unwrap().san == "Nf3");
    }

    SECTION("Annotations and surrounding whitespace") {
        REQUIRE(rules.ApplyMove("  e4!? ").Unwrap().san == "e4");
        REQUIRE(rules.ApplyMove("e5?").Unwrap().san == "e5");
    }

    SECTION("Validation leaves the board alone") {
        auto validated = rules.ValidateMove("d4");
        REQUIRE(validated.IsOk());
        REQUIRE(validated.Unwrap().uci == "d2d4");
        REQUIRE(rules.ToFen() == Position::kStartFen);
    }
}

TEST_CASE("StandardChessRules - Illegal moves", "[chess]") {
    StandardChessRules rules;
    const auto before = rules.ToFen();

    for (const auto move : {"e5", "Ke2", "e2e5", "Nf3xe5", "", "   ", "zz9", "O-O"}) {
        INFO("move '" << move << "'");
        auto result = rules.ApplyMove(move);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::IllegalMove);
    }
    REQUIRE(rules.ToFen() == before);
    REQUIRE(rules.History().empty());

    SECTION("Moving the opponent's piece") {
        REQUIRE(rules.ApplyMove("e7e5").IsErr());
    }
}

TEST_CASE("StandardChessRules - Castling", "[chess]") {
    SECTION("Both sides available") {
        auto rules = FromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
        REQUIRE(rules.ValidateMove("O-O-O").IsOk());
        REQUIRE(rules.ValidateMove("e1c1").Unwrap().san == "O-O-O");

        auto applied = rules.ApplyMove("0-0");
        REQUIRE(applied.IsOk());
        REQUIRE(applied.Unwrap().san == "O-O");
        REQUIRE(applied.Unwrap().uci == "e1g1");
        REQUIRE(rules.ToFen() == "r3k2r/8/8/8/8/8/8/R4RK1 b kq - 1 1");
    }

    SECTION("Not through an attacked square") {
        auto rules = FromFen("r3k2r/8/8/8/8/8/5r2/R3K2R w KQkq - 0 1");
        REQUIRE(rules.ValidateMove("O-O").IsErr());
        REQUIRE(rules.ValidateMove("O-O-O").IsOk());
    }

    SECTION("Rights lost after the king moves") {
        auto rules = FromFen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
        PlayAll(rules, {"Kf1", "Kd8", "Ke1", "Ke8"});
        REQUIRE(rules.ValidateMove("O-O").IsErr());
        REQUIRE(rules.ToFen() == "r3k2r/8/8/8/8/8/8/R3K2R w - - 4 3");
    }
}

TEST_CASE("StandardChessRules - En passant", "[chess]") {
    StandardChessRules rules;
    PlayAll(rules, {"e4", "a6", "e5", "d5"});
    REQUIRE(rules.ToFen() == "rnbqkbnr/1pp1pppp/p7/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");

    auto capture = rules.ApplyMove("exd6");
    REQUIRE(capture.IsOk());
    REQUIRE(capture.Unwrap().uci == "e5d6");
    REQUIRE(rules.ToFen() == "rnbqkbnr/1pp1pppp/p2P4/8/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");
}

TEST_CASE("StandardChessRules - En passant lapses after one move", "[chess]") {
    StandardChessRules rules;
    PlayAll(rules, {"e4", "a6", "e5", "d5", "h3", "h6"});
    REQUIRE(rules.ValidateMove("exd6").IsErr());
}

TEST_CASE("StandardChessRules - Promotion", "[chess]") {
    SECTION("Queen gives check") {
        auto rules = FromFen("8/P7/8/8/8/8/8/k6K w - - 0 1");
        auto applied = rules.ApplyMove("a8=Q");
        REQUIRE(applied.IsOk());
        REQUIRE(applied.Unwrap().san == "a8=Q+");
        REQUIRE(applied.Unwrap().uci == "a7a8q");
        REQUIRE(rules.IsInCheck());
    }

    SECTION("Underpromotion by UCI") {
        auto rules = FromFen("8/P7/8/8/8/8/8/k6K w - - 0 1");
        REQUIRE(rules.ApplyMove("a7a8n").Unwrap().san == "a8=N");
        REQUIRE(rules.ToFen() == "N7/8/8/8/8/8/8/k6K b - - 0 1");
    }

    SECTION("Promotion piece is required") {
        auto rules = FromFen("8/P7/8/8/8/8/8/k6K w - - 0 1");
        REQUIRE(rules.ValidateMove("a7a8").IsErr());
        REQUIRE(rules.ValidateMove("a8").IsErr());
    }
}

TEST_CASE("StandardChessRules - Disambiguation", "[chess]") {
    SECTION("By file") {
        auto rules = FromFen("4k3/8/8/8/8/8/8/1N2KN2 w - - 0 1");
        REQUIRE(rules.ValidateMove("b1d2").Unwrap().san == "Nbd2");
        REQUIRE(rules.ValidateMove("f1d2").Unwrap().san == "Nfd2");
        REQUIRE(rules.ValidateMove("Nd2").IsErr());
    }

    SECTION("By rank") {
        auto rules = FromFen("4k3/8/8/8/8/1N6/8/1N2K3 w - - 0 1");
        REQUIRE(rules.ValidateMove("b1d2").Unwrap().san == "N1d2");
        REQUIRE(rules.ValidateMove("b3d2").Unwrap().san == "N3d2");
    }
}

TEST_CASE("StandardChessRules - Checkmate", "[chess]") {
    StandardChessRules rules;
    PlayAll(rules, {"f3", "e5", "g4"});
    auto mate = rules.ApplyMove("Qh4");
    REQUIRE(mate.IsOk());
    REQUIRE(mate.Unwrap().san == "Qh4#");
    REQUIRE(mate.Unwrap().mover == Color::Black);

    REQUIRE(rules.GetTerminalState() == TerminalState::Checkmate);
    REQUIRE(rules.SideToMove() == Color::White);
    REQUIRE(rules.IsInCheck());
    REQUIRE(rules.ToPgn() == "1. f3 e5 2. g4 Qh4# 0-1");
    REQUIRE(rules.ValidateMove("Kf2").IsErr());
}

TEST_CASE("StandardChessRules - Draw detection", "[chess]") {
    SECTION("Stalemate") {
        auto rules = FromFen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
        REQUIRE(rules.GetTerminalState() == TerminalState::Stalemate);
        REQUIRE_FALSE(rules.IsInCheck());
    }

    SECTION("Insufficient material") {
        REQUIRE(FromFen("8/8/8/8/8/8/8/k6K w - - 0 1").GetTerminalState() ==
                TerminalState::InsufficientMaterial);
        REQUIRE(FromFen("k7/8/8/8/8/8/8/6BK w - - 0 1").GetTerminalState() ==
                TerminalState::InsufficientMaterial);
        REQUIRE(FromFen("k7/8/8/8/8/8/8/6RK w - - 0 1").GetTerminalState() ==
                TerminalState::Ongoing);
    }

    SECTION("Fifty-move rule") {
        auto rules = FromFen("k7/8/8/8/8/8/1r6/7K w - - 100 80");
        REQUIRE(rules.GetTerminalState() == TerminalState::FiftyMoveRule);
        REQUIRE(FromFen("k7/8/8/8/8/8/1r6/7K w - - 99 80").GetTerminalState() == TerminalState::Ongoing);
    }

    SECTION("Threefold repetition") {
        StandardChessRules rules;
        PlayAll(rules, {"Nf3", "Nf6", "Ng1", "Ng8"});
        REQUIRE(rules.GetTerminalState() == TerminalState::Ongoing);
        PlayAll(rules, {"Nf3", "Nf6", "Ng1", "Ng8"});
        REQUIRE(rules.GetTerminalState() == TerminalState::ThreefoldRepetition);
        REQUIRE(rules.ToPgn() == "1. Nf3 Nf6 2. Ng1 Ng8 3. Nf3 Nf6 4. Ng1 Ng8 1/2-1/2");
    }
}

TEST_CASE("StandardChessRules - PGN from a custom start", "[chess]") {
    auto rules = FromFen("4k3/8/8/8/8/8/4P3/4K3 b - - 0 12");
    PlayAll(rules, {"Kd7", "e4"});
    REQUIRE(rules.ToPgn() ==
            "[SetUp \"1\"]\n[FEN \"4k3/8/8/8/8/8/4P3/4K3 b - - 0 12\"]\n\n12... Kd7 13. e4");
}

TEST_CASE("StandardChessRules - FEN loading and reset", "[chess]") {
    StandardChessRules rules;
    PlayAll(rules, {"e4", "e5"});

    SECTION("Malformed FEN keeps the current game") {
        const auto before = rules.ToFen();
        for (const auto fen : {"", "not a fen", "8/8/8 w - - 0 1", "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"}) {
            INFO("fen '" << fen << "'");
            auto result = rules.LoadFen(fen);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
        }
        REQUIRE(rules.ToFen() == before);
    }

    SECTION("Reset") {
        rules.Reset();
        REQUIRE(rules.ToFen() == Position::kStartFen);
        REQUIRE(rules.History().empty());
        REQUIRE(rules.ToPgn().empty());
    }
}
