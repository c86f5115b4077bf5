#pragma once
#include "gambit/core/result.hpp"
#include "gambit/core/failures.hpp"
#include "gambit/chess/types.hpp"
#include <string>
#include <string_view>

namespace gambit::chess {

/**
 * Rules authority for one game. Accepts moves in SAN or UCI and answers
 * every question the session asks about the current position.
 */
class IChessRules {
public:
    virtual ~IChessRules() = default;

    /// Checks `notation` against the current position without changing it.
    [[nodiscard]] virtual Result<AppliedMove, ProtocolFailure> ValidateMove(std::string_view notation) const = 0;

    [[nodiscard]] virtual Result<AppliedMove, ProtocolFailure> ApplyMove(std::string_view notation) = 0;

    [[nodiscard]] virtual Color SideToMove() const = 0;
    [[nodiscard]] virtual TerminalState GetTerminalState() const = 0;
    [[nodiscard]] virtual bool IsInCheck() const = 0;

    [[nodiscard]] virtual std::string ToFen() const = 0;
    [[nodiscard]] virtual std::string ToPgn() const = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> LoadFen(std::string_view fen) = 0;
    virtual void Reset() = 0;
};

}
