#include "tessera/move.hpp"
#include "tessera/piece.hpp"
#include "tessera/square.hpp"
#include <ostream>
#include <string>

namespace tessera {

const char* move_type_name(MoveType t) {
  switch (t) {
    case MoveType::Quiet:                return "quiet";
    case MoveType::DoublePawnPush:       return "double-pawn-push";
    case MoveType::KingsideCastle:       return "kingside-castle";
    case MoveType::QueensideCastle:      return "queenside-castle";
    case MoveType::Capture:              return "capture";
    case MoveType::EnPassant:            return "en-passant";
    case MoveType::KnightPromote:        return "knight-promote";
    case MoveType::BishopPromote:        return "bishop-promote";
    case MoveType::RookPromote:          return "rook-promote";
    case MoveType::QueenPromote:         return "queen-promote";
    case MoveType::KnightPromoteCapture: return "knight-promote-capture";
    case MoveType::BishopPromoteCapture: return "bishop-promote-capture";
    case MoveType::RookPromoteCapture:   return "rook-promote-capture";
    case MoveType::QueenPromoteCapture:  return "queen-promote-capture";
  }
  return "unknown";
}

Move::Move(ColoredPiece piece, Square from, Square to, MoveType type)
  : piece_(piece), from_(from), to_(to), type_(type) {
  if (!is_valid_square(from)) throw InvalidSquareError("Move origin out of range: " + std::to_string(from));
  if (!is_valid_square(to))   throw InvalidSquareError("Move target out of range: " + std::to_string(to));
  if (from == to) throw InvalidSquareError("Move origin and target are both " + square_name(from));
  if (piece.piece == Piece::None) throw InvalidPieceError("Move needs a piece type");
}

Move::Move(ColoredPiece piece, std::string_view from, std::string_view to, MoveType type)
  : Move(piece, to_index(from), to_index(to), type) {}

std::ostream& operator<<(std::ostream& os, MoveType t) {
  return os << move_type_name(t);
}

std::ostream& operator<<(std::ostream& os, const Move& m) {
  return os << m.piece() << ' ' << square_name(m.from()) << square_name(m.to())
            << " (" << m.type() << ')';
}

} // namespace tessera
