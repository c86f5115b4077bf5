#include "gambit/chess/position.hpp"
#include "gambit/core/format.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace gambit::chess {

namespace {
    constexpr int kKnightDeltas[8][2] = {
        {1, 2}, {2, 1}, {2, -1}, {1, -2}, {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}
    };
    constexpr int kKingDeltas[8][2] = {
        {1, 0}, {1, 1}, {0, 1}, {-1, 1}, {-1, 0}, {-1, -1}, {0, -1}, {1, -1}
    };
    constexpr int kBishopDeltas[4][2] = {{1, 1}, {-1, 1}, {-1, -1}, {1, -1}};
    constexpr int kRookDeltas[4][2] = {{1, 0}, {0, 1}, {-1, 0}, {0, -1}};
    constexpr PieceType kPromotionPieces[4] = {
        PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight
    };

    constexpr Square kA1 = MakeSquare(0, 0);
    constexpr Square kE1 = MakeSquare(4, 0);
    constexpr Square kH1 = MakeSquare(7, 0);
    constexpr Square kA8 = MakeSquare(0, 7);
    constexpr Square kE8 = MakeSquare(4, 7);
    constexpr Square kH8 = MakeSquare(7, 7);

    bool OnBoard(const int file, const int rank) {
        return file >= 0 && file < kBoardFiles && rank >= 0 && rank < kBoardRanks;
    }

    int PawnDirection(const Color color) {
        return color == Color::White ? 1 : -1;
    }

    char PieceLetter(const PieceType type) {
        switch (type) {
            case PieceType::Pawn: return 'p';
            case PieceType::Knight: return 'n';
            case PieceType::Bishop: return 'b';
            case PieceType::Rook: return 'r';
            case PieceType::Queen: return 'q';
            case PieceType::King: return 'k';
        }
        return '?';
    }

    std::optional<PieceType> PieceFromLetter(const char letter) {
        switch (std::tolower(static_cast<unsigned char>(letter))) {
            case 'p': return PieceType::Pawn;
            case 'n': return PieceType::Knight;
            case 'b': return PieceType::Bishop;
            case 'r': return PieceType::Rook;
            case 'q': return PieceType::Queen;
            case 'k': return PieceType::King;
            default: return std::nullopt;
        }
    }

    char SanLetter(const PieceType type) {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(PieceLetter(type))));
    }

    std::vector<std::string_view> SplitFields(std::string_view text) {
        std::vector<std::string_view> fields;
        size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && text[pos] == ' ') {
                ++pos;
            }
            if (pos >= text.size()) {
                break;
            }
            const size_t end = std::min(text.find(' ', pos), text.size());
            fields.push_back(text.substr(pos, end - pos));
            pos = end;
        }
        return fields;
    }

    std::optional<int> ParseCounter(std::string_view text) {
        int value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
            return std::nullopt;
        }
        return value;
    }

    Result<Position, ProtocolFailure> FenError(std::string_view fen, std::string_view reason) {
        return Result<Position, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(compat::format("Invalid FEN '{}': {}", fen, reason)));
    }
}

std::string SquareName(const Square square) {
    std::string name;
    name.push_back(static_cast<char>('a' + FileOf(square)));
    name.push_back(static_cast<char>('1' + RankOf(square)));
    return name;
}

std::optional<Square> ParseSquare(std::string_view text) {
    if (text.size() != 2) {
        return std::nullopt;
    }
    const int file = text[0] - 'a';
    const int rank = text[1] - '1';
    if (!OnBoard(file, rank)) {
        return std::nullopt;
    }
    return MakeSquare(file, rank);
}

Position Position::Initial() {
    auto position = FromFen(kStartFen);
    return std::move(position).Unwrap();
}

Result<Position, ProtocolFailure> Position::FromFen(std::string_view fen) {
    const auto fields = SplitFields(fen);
    if (fields.size() != 6) {
        return FenError(fen, "expected 6 fields");
    }

    Position position;
    int rank = kBoardRanks - 1;
    int file = 0;
    for (const char c : fields[0]) {
        if (c == '/') {
            if (file != kBoardFiles || rank == 0) {
                return FenError(fen, "malformed rank");
            }
            --rank;
            file = 0;
        } else if (c >= '1' && c <= '8') {
            file += c - '0';
            if (file > kBoardFiles) {
                return FenError(fen, "rank overflows");
            }
        } else {
            const auto type = PieceFromLetter(c);
            if (!type.has_value() || file >= kBoardFiles) {
                return FenError(fen, "bad piece placement");
            }
            const Color color = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
            if (*type == PieceType::Pawn && (rank == 0 || rank == kBoardRanks - 1)) {
                return FenError(fen, "pawn on back rank");
            }
            position.board_[MakeSquare(file, rank)] = Piece{*type, color};
            ++file;
        }
    }
    if (rank != 0 || file != kBoardFiles) {
        return FenError(fen, "placement does not cover 8 ranks");
    }

    if (fields[1] == "w") {
        position.side_to_move_ = Color::White;
    } else if (fields[1] == "b") {
        position.side_to_move_ = Color::Black;
    } else {
        return FenError(fen, "bad side to move");
    }

    if (fields[2] != "-") {
        for (const char c : fields[2]) {
            switch (c) {
                case 'K': position.castling_rights_ |= kWhiteKingside; break;
                case 'Q': position.castling_rights_ |= kWhiteQueenside; break;
                case 'k': position.castling_rights_ |= kBlackKingside; break;
                case 'q': position.castling_rights_ |= kBlackQueenside; break;
                default: return FenError(fen, "bad castling field");
            }
        }
    }
    const auto has = [&position](const Square square, const PieceType type, const Color color) {
        return position.board_[square] == std::optional<Piece>(Piece{type, color});
    };
    if ((position.castling_rights_ & kWhiteKingside) &&
        !(has(kE1, PieceType::King, Color::White) && has(kH1, PieceType::Rook, Color::White))) {
        position.castling_rights_ &= static_cast<uint8_t>(~kWhiteKingside);
    }
    if ((position.castling_rights_ & kWhiteQueenside) &&
        !(has(kE1, PieceType::King, Color::White) && has(kA1, PieceType::Rook, Color::White))) {
        position.castling_rights_ &= static_cast<uint8_t>(~kWhiteQueenside);
    }
    if ((position.castling_rights_ & kBlackKingside) &&
        !(has(kE8, PieceType::King, Color::Black) && has(kH8, PieceType::Rook, Color::Black))) {
        position.castling_rights_ &= static_cast<uint8_t>(~kBlackKingside);
    }
    if ((position.castling_rights_ & kBlackQueenside) &&
        !(has(kE8, PieceType::King, Color::Black) && has(kA8, PieceType::Rook, Color::Black))) {
        position.castling_rights_ &= static_cast<uint8_t>(~kBlackQueenside);
    }

    if (fields[3] != "-") {
        const auto square = ParseSquare(fields[3]);
        const int expected_rank = position.side_to_move_ == Color::White ? 5 : 2;
        if (!square.has_value() || RankOf(*square) != expected_rank) {
            return FenError(fen, "bad en passant square");
        }
        position.en_passant_ = square;
    }

    const auto halfmove = ParseCounter(fields[4]);
    const auto fullmove = ParseCounter(fields[5]);
    if (!halfmove.has_value() || !fullmove.has_value() || *fullmove < 1) {
        return FenError(fen, "bad move counters");
    }
    position.halfmove_clock_ = *halfmove;
    position.fullmove_number_ = *fullmove;

    int white_kings = 0;
    int black_kings = 0;
    for (const auto& piece : position.board_) {
        if (piece.has_value() && piece->type == PieceType::King) {
            (piece->color == Color::White ? white_kings : black_kings) += 1;
        }
    }
    if (white_kings != 1 || black_kings != 1) {
        return FenError(fen, "each side needs exactly one king");
    }
    const auto opponent_king = position.FindKing(Opposite(position.side_to_move_));
    if (position.IsSquareAttacked(*opponent_king, position.side_to_move_)) {
        return FenError(fen, "side not to move is in check");
    }
    return Result<Position, ProtocolFailure>::Ok(std::move(position));
}

std::string Position::RepetitionKey() const {
    std::string key;
    for (int rank = kBoardRanks - 1; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < kBoardFiles; ++file) {
            const auto& piece = board_[MakeSquare(file, rank)];
            if (!piece.has_value()) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                key.push_back(static_cast<char>('0' + empty));
                empty = 0;
            }
            const char letter = PieceLetter(piece->type);
            key.push_back(piece->color == Color::White
                ? static_cast<char>(std::toupper(static_cast<unsigned char>(letter)))
                : letter);
        }
        if (empty > 0) {
            key.push_back(static_cast<char>('0' + empty));
        }
        if (rank > 0) {
            key.push_back('/');
        }
    }

    key += side_to_move_ == Color::White ? " w " : " b ";
    if (castling_rights_ == 0) {
        key.push_back('-');
    } else {
        if (castling_rights_ & kWhiteKingside) key.push_back('K');
        if (castling_rights_ & kWhiteQueenside) key.push_back('Q');
        if (castling_rights_ & kBlackKingside) key.push_back('k');
        if (castling_rights_ & kBlackQueenside) key.push_back('q');
    }
    key.push_back(' ');
    key += en_passant_.has_value() ? SquareName(*en_passant_) : "-";
    return key;
}

std::string Position::ToFen() const {
    return compat::format("{} {} {}", RepetitionKey(), halfmove_clock_, fullmove_number_);
}

std::optional<Square> Position::FindKing(const Color color) const {
    for (int square = 0; square < kSquareCount; ++square) {
        const auto& piece = board_[square];
        if (piece.has_value() && piece->type == PieceType::King && piece->color == color) {
            return static_cast<Square>(square);
        }
    }
    return std::nullopt;
}

bool Position::IsSquareAttacked(const Square square, const Color by) const {
    const int file = FileOf(square);
    const int rank = RankOf(square);
    const auto holds = [this](const int f, const int r, const Color color,
                              const PieceType a, const PieceType b) {
        const auto& piece = board_[MakeSquare(f, r)];
        return piece.has_value() && piece->color == color && (piece->type == a || piece->type == b);
    };

    const int pawn_rank = rank - PawnDirection(by);
    for (const int df : {-1, 1}) {
        if (OnBoard(file + df, pawn_rank) &&
            holds(file + df, pawn_rank, by, PieceType::Pawn, PieceType::Pawn)) {
            return true;
        }
    }
    for (const auto& d : kKnightDeltas) {
        if (OnBoard(file + d[0], rank + d[1]) &&
            holds(file + d[0], rank + d[1], by, PieceType::Knight, PieceType::Knight)) {
            return true;
        }
    }
    for (const auto& d : kKingDeltas) {
        if (OnBoard(file + d[0], rank + d[1]) &&
            holds(file + d[0], rank + d[1], by, PieceType::King, PieceType::King)) {
            return true;
        }
    }
    const auto slides = [&](const int (*deltas)[2], const PieceType a, const PieceType b) {
        for (size_t i = 0; i < 4; ++i) {
            int f = file + deltas[i][0];
            int r = rank + deltas[i][1];
            while (OnBoard(f, r)) {
                if (board_[MakeSquare(f, r)].has_value()) {
                    if (holds(f, r, by, a, b)) {
                        return true;
                    }
                    break;
                }
                f += deltas[i][0];
                r += deltas[i][1];
            }
        }
        return false;
    };
    return slides(kBishopDeltas, PieceType::Bishop, PieceType::Queen) ||
           slides(kRookDeltas, PieceType::Rook, PieceType::Queen);
}

bool Position::IsInCheck() const {
    const auto king = FindKing(side_to_move_);
    return king.has_value() && IsSquareAttacked(*king, Opposite(side_to_move_));
}

void Position::GeneratePawnMoves(const Square from, std::vector<Move>& moves) const {
    const Color color = side_to_move_;
    const int dir = PawnDirection(color);
    const int file = FileOf(from);
    const int rank = RankOf(from);
    const int start_rank = color == Color::White ? 1 : 6;
    const int last_rank = color == Color::White ? 7 : 0;

    const auto push = [&](const Square to) {
        if (RankOf(to) == last_rank) {
            for (const auto promotion : kPromotionPieces) {
                moves.push_back(Move{from, to, promotion});
            }
        } else {
            moves.push_back(Move{from, to, std::nullopt});
        }
    };

    if (OnBoard(file, rank + dir) && !board_[MakeSquare(file, rank + dir)].has_value()) {
        push(MakeSquare(file, rank + dir));
        if (rank == start_rank && !board_[MakeSquare(file, rank + 2 * dir)].has_value()) {
            moves.push_back(Move{from, MakeSquare(file, rank + 2 * dir), std::nullopt});
        }
    }
    for (const int df : {-1, 1}) {
        if (!OnBoard(file + df, rank + dir)) {
            continue;
        }
        const Square to = MakeSquare(file + df, rank + dir);
        const auto& target = board_[to];
        if ((target.has_value() && target->color != color) || en_passant_ == to) {
            push(to);
        }
    }
}

void Position::GenerateStepMoves(
    const Square from, const int (*deltas)[2], const size_t count, std::vector<Move>& moves) const {
    for (size_t i = 0; i < count; ++i) {
        const int f = FileOf(from) + deltas[i][0];
        const int r = RankOf(from) + deltas[i][1];
        if (!OnBoard(f, r)) {
            continue;
        }
        const auto& target = board_[MakeSquare(f, r)];
        if (!target.has_value() || target->color != side_to_move_) {
            moves.push_back(Move{from, MakeSquare(f, r), std::nullopt});
        }
    }
}

void Position::GenerateSlidingMoves(
    const Square from, const int (*deltas)[2], const size_t count, std::vector<Move>& moves) const {
    for (size_t i = 0; i < count; ++i) {
        int f = FileOf(from) + deltas[i][0];
        int r = RankOf(from) + deltas[i][1];
        while (OnBoard(f, r)) {
            const auto& target = board_[MakeSquare(f, r)];
            if (target.has_value()) {
                if (target->color != side_to_move_) {
                    moves.push_back(Move{from, MakeSquare(f, r), std::nullopt});
                }
                break;
            }
            moves.push_back(Move{from, MakeSquare(f, r), std::nullopt});
            f += deltas[i][0];
            r += deltas[i][1];
        }
    }
}

void Position::GenerateCastlingMoves(const Square from, std::vector<Move>& moves) const {
    const Color color = side_to_move_;
    const Color enemy = Opposite(color);
    const int rank = color == Color::White ? 0 : 7;
    if (from != MakeSquare(4, rank) || IsSquareAttacked(from, enemy)) {
        return;
    }
    const uint8_t kingside = color == Color::White ? kWhiteKingside : kBlackKingside;
    const uint8_t queenside = color == Color::White ? kWhiteQueenside : kBlackQueenside;
    const auto empty = [&](const int file) { return !board_[MakeSquare(file, rank)].has_value(); };
    const auto safe = [&](const int file) { return !IsSquareAttacked(MakeSquare(file, rank), enemy); };

    if ((castling_rights_ & kingside) && empty(5) && empty(6) && safe(5) && safe(6)) {
        moves.push_back(Move{from, MakeSquare(6, rank), std::nullopt});
    }
    if ((castling_rights_ & queenside) && empty(3) && empty(2) && empty(1) && safe(3) && safe(2)) {
        moves.push_back(Move{from, MakeSquare(2, rank), std::nullopt});
    }
}

void Position::GeneratePseudoLegal(std::vector<Move>& moves) const {
    for (int index = 0; index < kSquareCount; ++index) {
        const auto& piece = board_[index];
        if (!piece.has_value() || piece->color != side_to_move_) {
            continue;
        }
        const auto from = static_cast<Square>(index);
        switch (piece->type) {
            case PieceType::Pawn:
                GeneratePawnMoves(from, moves);
                break;
            case PieceType::Knight:
                GenerateStepMoves(from, kKnightDeltas, 8, moves);
                break;
            case PieceType::Bishop:
                GenerateSlidingMoves(from, kBishopDeltas, 4, moves);
                break;
            case PieceType::Rook:
                GenerateSlidingMoves(from, kRookDeltas, 4, moves);
                break;
            case PieceType::Queen:
                GenerateSlidingMoves(from, kBishopDeltas, 4, moves);
                GenerateSlidingMoves(from, kRookDeltas, 4, moves);
                break;
            case PieceType::King:
                GenerateStepMoves(from, kKingDeltas, 8, moves);
                GenerateCastlingMoves(from, moves);
                break;
        }
    }
}

std::vector<Move> Position::LegalMoves() const {
    std::vector<Move> candidates;
    candidates.reserve(64);
    GeneratePseudoLegal(candidates);

    std::vector<Move> legal;
    legal.reserve(candidates.size());
    for (const auto& move : candidates) {
        const Position next = Apply(move);
        const auto king = next.FindKing(side_to_move_);
        if (king.has_value() && !next.IsSquareAttacked(*king, next.side_to_move_)) {
            legal.push_back(move);
        }
    }
    return legal;
}

bool Position::EnemyPawnBeside(const Square square, const Color enemy) const {
    for (const int df : {-1, 1}) {
        const int file = FileOf(square) + df;
        if (!OnBoard(file, RankOf(square))) {
            continue;
        }
        const auto& piece = board_[MakeSquare(file, RankOf(square))];
        if (piece.has_value() && piece->type == PieceType::Pawn && piece->color == enemy) {
            return true;
        }
    }
    return false;
}

Position Position::Apply(const Move& move) const {
    Position next = *this;
    const Piece piece = *board_[move.from];
    const bool capture = IsCapture(move);
    const int from_file = FileOf(move.from);
    const int to_file = FileOf(move.to);

    next.en_passant_.reset();

    if (piece.type == PieceType::Pawn && en_passant_ == move.to && from_file != to_file &&
        !board_[move.to].has_value()) {
        next.board_[MakeSquare(to_file, RankOf(move.from))].reset();
    }
    if (piece.type == PieceType::King && std::abs(to_file - from_file) == 2) {
        const int rank = RankOf(move.from);
        const int rook_from = to_file > from_file ? 7 : 0;
        const int rook_to = to_file > from_file ? 5 : 3;
        next.board_[MakeSquare(rook_to, rank)] = next.board_[MakeSquare(rook_from, rank)];
        next.board_[MakeSquare(rook_from, rank)].reset();
    }

    next.board_[move.to] = move.promotion.has_value() ? Piece{*move.promotion, piece.color} : piece;
    next.board_[move.from].reset();

    if (piece.type == PieceType::Pawn && std::abs(RankOf(move.to) - RankOf(move.from)) == 2 &&
        next.EnemyPawnBeside(move.to, Opposite(piece.color))) {
        next.en_passant_ = MakeSquare(from_file, (RankOf(move.from) + RankOf(move.to)) / 2);
    }

    if (piece.type == PieceType::King) {
        next.castling_rights_ &= piece.color == Color::White
            ? static_cast<uint8_t>(~(kWhiteKingside | kWhiteQueenside))
            : static_cast<uint8_t>(~(kBlackKingside | kBlackQueenside));
    }
    for (const Square touched : {move.from, move.to}) {
        if (touched == kA1) next.castling_rights_ &= static_cast<uint8_t>(~kWhiteQueenside);
        if (touched == kH1) next.castling_rights_ &= static_cast<uint8_t>(~kWhiteKingside);
        if (touched == kA8) next.castling_rights_ &= static_cast<uint8_t>(~kBlackQueenside);
        if (touched == kH8) next.castling_rights_ &= static_cast<uint8_t>(~kBlackKingside);
    }

    next.halfmove_clock_ = (piece.type == PieceType::Pawn || capture) ? 0 : halfmove_clock_ + 1;
    if (side_to_move_ == Color::Black) {
        ++next.fullmove_number_;
    }
    next.side_to_move_ = Opposite(side_to_move_);
    return next;
}

bool Position::IsCapture(const Move& move) const {
    if (board_[move.to].has_value()) {
        return true;
    }
    const auto& piece = board_[move.from];
    return piece.has_value() && piece->type == PieceType::Pawn &&
           en_passant_ == move.to && FileOf(move.from) != FileOf(move.to);
}

bool Position::HasInsufficientMaterial() const {
    int others = 0;
    int minors = 0;
    int bishops_on_light = 0;
    int bishops_on_dark = 0;
    for (int square = 0; square < kSquareCount; ++square) {
        const auto& piece = board_[square];
        if (!piece.has_value() || piece->type == PieceType::King) {
            continue;
        }
        ++others;
        if (piece->type == PieceType::Knight) {
            ++minors;
        } else if (piece->type == PieceType::Bishop) {
            ++minors;
            ((FileOf(static_cast<Square>(square)) + RankOf(static_cast<Square>(square))) % 2 == 0
                ? bishops_on_dark : bishops_on_light) += 1;
        }
    }
    if (others == 0) {
        return true;
    }
    if (others == 1 && minors == 1) {
        return true;
    }
    // Any number of bishops, all on one square colour.
    const int bishops = bishops_on_light + bishops_on_dark;
    return bishops == others && (bishops_on_light == 0 || bishops_on_dark == 0);
}

std::string Position::ToUci(const Move& move) {
    std::string uci = SquareName(move.from) + SquareName(move.to);
    if (move.promotion.has_value()) {
        uci.push_back(PieceLetter(*move.promotion));
    }
    return uci;
}

std::string Position::ToSan(const Move& move) const {
    const Piece piece = *board_[move.from];
    std::string san;

    if (piece.type == PieceType::King && std::abs(FileOf(move.to) - FileOf(move.from)) == 2) {
        san = FileOf(move.to) > FileOf(move.from) ? "O-O" : "O-O-O";
    } else {
        const bool capture = IsCapture(move);
        if (piece.type == PieceType::Pawn) {
            if (capture) {
                san.push_back(static_cast<char>('a' + FileOf(move.from)));
            }
        } else {
            san.push_back(SanLetter(piece.type));
            bool ambiguous = false;
            bool same_file = false;
            bool same_rank = false;
            for (const auto& other : LegalMoves()) {
                if (other.to != move.to || other.from == move.from ||
                    board_[other.from]->type != piece.type) {
                    continue;
                }
                ambiguous = true;
                same_file |= FileOf(other.from) == FileOf(move.from);
                same_rank |= RankOf(other.from) == RankOf(move.from);
            }
            if (ambiguous) {
                if (!same_file) {
                    san.push_back(static_cast<char>('a' + FileOf(move.from)));
                } else if (!same_rank) {
                    san.push_back(static_cast<char>('1' + RankOf(move.from)));
                } else {
                    san += SquareName(move.from);
                }
            }
        }
        if (capture) {
            san.push_back('x');
        }
        san += SquareName(move.to);
        if (move.promotion.has_value()) {
            san.push_back('=');
            san.push_back(SanLetter(*move.promotion));
        }
    }

    const Position next = Apply(move);
    if (next.IsInCheck()) {
        san.push_back(next.LegalMoves().empty() ? '#' : '+');
    }
    return san;
}

}
