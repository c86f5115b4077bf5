#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gambit::chess {

enum class Color : uint8_t {
    White,
    Black
};

constexpr Color Opposite(const Color color) noexcept {
    return color == Color::White ? Color::Black : Color::White;
}

enum class PieceType : uint8_t {
    Pawn,
    Knight,
    Bishop,
    Rook,
    Queen,
    King
};

struct Piece {
    PieceType type = PieceType::Pawn;
    Color color = Color::White;

    constexpr bool operator==(const Piece&) const noexcept = default;
};

/// 0..63, a1 = 0, h1 = 7, a8 = 56.
using Square = uint8_t;

inline constexpr int kBoardFiles = 8;
inline constexpr int kBoardRanks = 8;
inline constexpr int kSquareCount = kBoardFiles * kBoardRanks;

constexpr Square MakeSquare(const int file, const int rank) noexcept {
    return static_cast<Square>(rank * kBoardFiles + file);
}
constexpr int FileOf(const Square square) noexcept { return square % kBoardFiles; }
constexpr int RankOf(const Square square) noexcept { return square / kBoardFiles; }

std::string SquareName(Square square);
std::optional<Square> ParseSquare(std::string_view text);

struct Move {
    Square from = 0;
    Square to = 0;
    std::optional<PieceType> promotion;

    constexpr bool operator==(const Move&) const noexcept = default;
};

enum class TerminalState {
    Ongoing,
    Checkmate,
    Stalemate,
    InsufficientMaterial,
    FiftyMoveRule,
    ThreefoldRepetition
};

constexpr std::string_view ToString(const TerminalState state) noexcept {
    switch (state) {
        case TerminalState::Ongoing: return "Ongoing";
        case TerminalState::Checkmate: return "Checkmate";
        case TerminalState::Stalemate: return "Stalemate";
        case TerminalState::InsufficientMaterial: return "InsufficientMaterial";
        case TerminalState::FiftyMoveRule: return "FiftyMoveRule";
        case TerminalState::ThreefoldRepetition: return "ThreefoldRepetition";
    }
    return "Unknown";
}

/// A move as accepted by the rules, in both notations, with the side that played it.
struct AppliedMove {
    std::string san;
    std::string uci;
    Color mover = Color::White;
};

}
