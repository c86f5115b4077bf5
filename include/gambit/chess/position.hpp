#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/chess/types.hpp"
#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gambit::chess {

/**
 * Immutable-by-convention board state: placement, side to move, castling
 * rights, en passant target and move clocks. Apply() returns a new position.
 *
 * The en passant target is only recorded when an enemy pawn stands next to
 * the double-pushed pawn, so FEN and repetition keys match for positions
 * that are indistinguishable in play.
 */
class Position {
public:
    static constexpr std::string_view kStartFen =
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    [[nodiscard]] static Position Initial();
    [[nodiscard]] static Result<Position, ProtocolFailure> FromFen(std::string_view fen);

    [[nodiscard]] std::string ToFen() const;

    /// Placement, side, castling and en passant: the parts that define a repetition.
    [[nodiscard]] std::string RepetitionKey() const;

    [[nodiscard]] std::optional<Piece> PieceAt(Square square) const { return board_[square]; }
    [[nodiscard]] Color SideToMove() const noexcept { return side_to_move_; }
    [[nodiscard]] int HalfmoveClock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int FullmoveNumber() const noexcept { return fullmove_number_; }

    [[nodiscard]] std::vector<Move> LegalMoves() const;
    [[nodiscard]] bool IsInCheck() const;
    [[nodiscard]] bool IsSquareAttacked(Square square, Color by) const;
    [[nodiscard]] bool HasInsufficientMaterial() const;

    /// Applies a move produced by LegalMoves(); no legality check.
    [[nodiscard]] Position Apply(const Move& move) const;

    [[nodiscard]] std::string ToSan(const Move& move) const;
    [[nodiscard]] static std::string ToUci(const Move& move);

private:
    enum CastlingRight : uint8_t {
        kWhiteKingside = 1 << 0,
        kWhiteQueenside = 1 << 1,
        kBlackKingside = 1 << 2,
        kBlackQueenside = 1 << 3
    };

    Position() = default;

    void GeneratePseudoLegal(std::vector<Move>& moves) const;
    void GeneratePawnMoves(Square from, std::vector<Move>& moves) const;
    void GenerateStepMoves(Square from, const int (*deltas)[2], size_t count, std::vector<Move>& moves) const;
    void GenerateSlidingMoves(Square from, const int (*deltas)[2], size_t count, std::vector<Move>& moves) const;
    void GenerateCastlingMoves(Square from, std::vector<Move>& moves) const;
    [[nodiscard]] std::optional<Square> FindKing(Color color) const;
    [[nodiscard]] bool IsCapture(const Move& move) const;
    [[nodiscard]] bool EnemyPawnBeside(Square square, Color enemy) const;

    std::array<std::optional<Piece>, kSquareCount> board_{};
    Color side_to_move_ = Color::White;
    uint8_t castling_rights_ = 0;
    std::optional<Square> en_passant_;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
};

}
