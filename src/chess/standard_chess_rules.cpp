#include "gambit/chess/standard_chess_rules.hpp"
#include "gambit/core/format.hpp"
#include <algorithm>
#include <cctype>

namespace gambit::chess {

namespace {
    std::string_view Trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }

    /// Drops check/mate marks and annotation glyphs, accepts zero-castling.
    std::string NormalizeSan(std::string_view text) {
        std::string out(text);
        while (!out.empty() && std::string_view("+#!?").find(out.back()) != std::string_view::npos) {
            out.pop_back();
        }
        if (out == "0-0" || out == "0-0-0") {
            std::replace(out.begin(), out.end(), '0', 'O');
        }
        return out;
    }

    std::string WithoutPromotionMark(std::string text) {
        text.erase(std::remove(text.begin(), text.end(), '='), text.end());
        return text;
    }

    std::string Lowercase(std::string_view text) {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string_view ResultToken(const TerminalState state, const Color side_to_move) {
        switch (state) {
            case TerminalState::Ongoing:
                return "";
            case TerminalState::Checkmate:
                return side_to_move == Color::White ? "0-1" : "1-0";
            case TerminalState::Stalemate:
            case TerminalState::InsufficientMaterial:
            case TerminalState::FiftyMoveRule:
            case TerminalState::ThreefoldRepetition:
                return "1/2-1/2";
        }
        return "";
    }
}

StandardChessRules::StandardChessRules()
    : position_(Position::Initial())
    , start_position_(Position::Initial()) {
    StartFrom(Position::Initial(), true);
}

void StandardChessRules::StartFrom(Position position, const bool from_standard_start) {
    position_ = position;
    start_position_ = std::move(position);
    custom_start_ = !from_standard_start;
    san_history_.clear();
    repetitions_.clear();
    repetitions_[position_.RepetitionKey()] = 1;
}

Result<StandardChessRules::ResolvedMove, ProtocolFailure> StandardChessRules::Resolve(
    std::string_view notation) const {
    using ResolveResult = Result<ResolvedMove, ProtocolFailure>;

    const std::string_view trimmed = Trim(notation);
    if (trimmed.empty()) {
        return ResolveResult::Err(ProtocolFailure::IllegalMove("Move notation is empty"));
    }

    const auto legal_moves = position_.LegalMoves();
    const auto resolved = [this](const Move& move) {
        return ResolvedMove{
            move,
            AppliedMove{position_.ToSan(move), Position::ToUci(move), position_.SideToMove()}
        };
    };

    const std::string as_uci = Lowercase(trimmed);
    for (const auto& move : legal_moves) {
        if (Position::ToUci(move) == as_uci) {
            return ResolveResult::Ok(resolved(move));
        }
    }

    const std::string as_san = WithoutPromotionMark(NormalizeSan(trimmed));
    for (const auto& move : legal_moves) {
        if (WithoutPromotionMark(NormalizeSan(position_.ToSan(move))) == as_san) {
            return ResolveResult::Ok(resolved(move));
        }
    }

    return ResolveResult::Err(
        ProtocolFailure::IllegalMove(
            compat::format("Illegal move '{}' in position {}", trimmed, position_.ToFen())));
}

Result<AppliedMove, ProtocolFailure> StandardChessRules::ValidateMove(std::string_view notation) const {
    auto resolved = Resolve(notation);
    if (resolved.IsErr()) {
        return Result<AppliedMove, ProtocolFailure>::Err(std::move(resolved).UnwrapErr());
    }
    return Result<AppliedMove, ProtocolFailure>::Ok(std::move(resolved).Unwrap().applied);
}

Result<AppliedMove, ProtocolFailure> StandardChessRules::ApplyMove(std::string_view notation) {
    auto resolved = Resolve(notation);
    if (resolved.IsErr()) {
        return Result<AppliedMove, ProtocolFailure>::Err(std::move(resolved).UnwrapErr());
    }
    ResolvedMove move = std::move(resolved).Unwrap();
    position_ = position_.Apply(move.move);
    san_history_.push_back(move.applied.san);
    repetitions_[position_.RepetitionKey()] += 1;
    return Result<AppliedMove, ProtocolFailure>::Ok(std::move(move.applied));
}

Color StandardChessRules::SideToMove() const {
    return position_.SideToMove();
}

TerminalState StandardChessRules::GetTerminalState() const {
    if (position_.LegalMoves().empty()) {
        return position_.IsInCheck() ? TerminalState::Checkmate : TerminalState::Stalemate;
    }
    if (position_.HasInsufficientMaterial()) {
        return TerminalState::InsufficientMaterial;
    }
    if (position_.HalfmoveClock() >= 100) {
        return TerminalState::FiftyMoveRule;
    }
    const auto it = repetitions_.find(position_.RepetitionKey());
    if (it != repetitions_.end() && it->second >= 3) {
        return TerminalState::ThreefoldRepetition;
    }
    return TerminalState::Ongoing;
}

bool StandardChessRules::IsInCheck() const {
    return position_.IsInCheck();
}

std::string StandardChessRules::ToFen() const {
    return position_.ToFen();
}

std::string StandardChessRules::ToPgn() const {
    std::vector<std::string> tokens;
    int number = start_position_.FullmoveNumber();
    Color side = start_position_.SideToMove();
    for (size_t i = 0; i < san_history_.size(); ++i) {
        if (side == Color::White) {
            tokens.push_back(compat::format("{}.", number));
        } else if (i == 0) {
            tokens.push_back(compat::format("{}...", number));
        }
        tokens.push_back(san_history_[i]);
        if (side == Color::Black) {
            ++number;
        }
        side = Opposite(side);
    }
    const std::string_view result = ResultToken(GetTerminalState(), position_.SideToMove());
    if (!result.empty()) {
        tokens.emplace_back(result);
    }

    std::string pgn;
    if (custom_start_) {
        pgn = compat::format("[SetUp \"1\"]\n[FEN \"{}\"]\n\n", start_position_.ToFen());
    }
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) {
            pgn.push_back(' ');
        }
        pgn += tokens[i];
    }
    return pgn;
}

Result<Unit, ProtocolFailure> StandardChessRules::LoadFen(std::string_view fen) {
    auto position = Position::FromFen(Trim(fen));
    if (position.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(std::move(position).UnwrapErr());
    }
    const bool standard = position.Unwrap().ToFen() == Position::kStartFen;
    StartFrom(std::move(position).Unwrap(), standard);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void StandardChessRules::Reset() {
    StartFrom(Position::Initial(), true);
}

}
