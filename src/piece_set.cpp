#include "tessera/piece_set.hpp"
#include "tessera/piece.hpp"

namespace tessera {

static inline std::size_t slot(Piece p) {
  if (p == Piece::None) throw InvalidPieceError("Piece::None has no bitboard");
  return static_cast<std::size_t>(p);
}

PieceSet PieceSet::starting(Color c) {
  PieceSet ps;
  const auto& masks = START_MASKS[static_cast<std::size_t>(c)];
  for (std::size_t p = 0; p < masks.size(); ++p) ps.bb_[p] = Bitboard(masks[p]);
  return ps;
}

Bitboard PieceSet::get(Piece p) const { return bb_[slot(p)]; }

void PieceSet::set(Piece p, Bitboard mask) { bb_[slot(p)] = mask; }

Bitboard PieceSet::occupancy() const {
  Bitboard occ;
  for (const auto& b : bb_) occ |= b;
  return occ;
}

} // namespace tessera
