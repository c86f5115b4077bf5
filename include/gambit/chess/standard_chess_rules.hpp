#pragma once
#include "gambit/chess/i_chess_rules.hpp"
#include "gambit/chess/position.hpp"
#include <map>
#include <string>
#include <vector>

namespace gambit::chess {

/**
 * Standard chess over Position, with the automatic draw rules
 * (stalemate, insufficient material, fifty moves, threefold repetition)
 * and a running SAN history for PGN export.
 */
class StandardChessRules final : public IChessRules {
public:
    StandardChessRules();

    [[nodiscard]] Result<AppliedMove, ProtocolFailure> ValidateMove(std::string_view notation) const override;
    [[nodiscard]] Result<AppliedMove, ProtocolFailure> ApplyMove(std::string_view notation) override;

    [[nodiscard]] Color SideToMove() const override;
    [[nodiscard]] TerminalState GetTerminalState() const override;
    [[nodiscard]] bool IsInCheck() const override;

    [[nodiscard]] std::string ToFen() const override;
    [[nodiscard]] std::string ToPgn() const override;

    [[nodiscard]] Result<Unit, ProtocolFailure> LoadFen(std::string_view fen) override;
    void Reset() override;

    [[nodiscard]] const Position& CurrentPosition() const noexcept { return position_; }
    [[nodiscard]] const std::vector<std::string>& History() const noexcept { return san_history_; }

private:
    struct ResolvedMove {
        Move move;
        AppliedMove applied;
    };

    [[nodiscard]] Result<ResolvedMove, ProtocolFailure> Resolve(std::string_view notation) const;
    void StartFrom(Position position, bool from_standard_start);

    Position position_;
    Position start_position_;
    bool custom_start_ = false;
    std::vector<std::string> san_history_;
    std::map<std::string, int> repetitions_;
};

}
