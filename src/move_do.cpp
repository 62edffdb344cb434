#include "tessera/move_do.hpp"

namespace tessera {

// Rook home / post-castle squares on the king's back rank
static inline Square castle_rook_from(MoveType t, int rank) {
  return make_square(t == MoveType::KingsideCastle ? 7 : 0, rank); // h / a
}
static inline Square castle_rook_to(MoveType t, int rank) {
  return make_square(t == MoveType::KingsideCastle ? 5 : 3, rank); // f / d
}

Position apply(const Position& pos, const Move& m) {
  Position next = pos;

  const ColoredPiece mover = m.piece();
  const Color them = other(mover.color);
  const Bitboard from_bb = Bitboard::from_index(m.from());
  const Bitboard to_bb = Bitboard::from_index(m.to());

  switch (m.type()) {
    case MoveType::Quiet:
    case MoveType::DoublePawnPush:
      next.xor_bits(mover, from_bb ^ to_bb);
      break;

    case MoveType::Capture:
      next.remove_at(them, m.to());
      next.xor_bits(mover, from_bb ^ to_bb);
      break;

    case MoveType::EnPassant: {
      // captured pawn sits beside the origin, on the target's file
      const Square cap_sq = make_square(file_of(m.to()), rank_of(m.from()));
      // anything other than an opposing pawn there is left in place
      if (next.bitboard_for(them, Piece::Pawn).test(cap_sq)) {
        next.xor_bits({them, Piece::Pawn}, Bitboard::from_index(cap_sq));
        next.write_slot(cap_sq, std::nullopt);
      }
      next.xor_bits(mover, from_bb ^ to_bb);
      break;
    }

    case MoveType::KingsideCastle:
    case MoveType::QueensideCastle: {
      const int rank = rank_of(m.from());
      const Square rook_from = castle_rook_from(m.type(), rank);
      const Square rook_to = castle_rook_to(m.type(), rank);
      const ColoredPiece rook{mover.color, Piece::Rook};
      next.xor_bits(mover, from_bb ^ to_bb);
      // no rook at home: only the king moves
      if (next.bitboard_for(mover.color, Piece::Rook).test(rook_from)) {
        next.xor_bits(rook, Bitboard::from_index(rook_from) ^ Bitboard::from_index(rook_to));
        next.write_slot(rook_from, std::nullopt);
        next.write_slot(rook_to, rook);
      }
      break;
    }

    case MoveType::KnightPromote:
    case MoveType::BishopPromote:
    case MoveType::RookPromote:
    case MoveType::QueenPromote:
    case MoveType::KnightPromoteCapture:
    case MoveType::BishopPromoteCapture:
    case MoveType::RookPromoteCapture:
    case MoveType::QueenPromoteCapture: {
      const ColoredPiece promoted{mover.color, promotion_piece(m.type())};
      if (m.is_capture()) next.remove_at(them, m.to());
      next.xor_bits(mover, from_bb);
      next.xor_bits(promoted, to_bb);
      next.write_slot(m.from(), std::nullopt);
      next.write_slot(m.to(), promoted);
      return next;
    }
  }

  next.write_slot(m.from(), std::nullopt);
  next.write_slot(m.to(), mover);
  return next;
}

Position apply(const Position& pos, ColoredPiece piece,
               std::string_view from, std::string_view to, MoveType type) {
  return apply(pos, Move(piece, from, to, type));
}

} // namespace tessera
