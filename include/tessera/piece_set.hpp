#pragma once
#include <array>
#include "tessera/bitboard.hpp"
#include "tessera/types.hpp"

namespace tessera {

// START_MASKS[color][piece]: standard initial arrangement
inline constexpr std::array<std::array<U64, PIECE_N>, COLOR_N> START_MASKS{{
  // pawn                   knight                 bishop                 rook                   queen                  king
  {{0x000000000000FF00ULL, 0x0000000000000042ULL, 0x0000000000000024ULL, 0x0000000000000081ULL, 0x0000000000000008ULL, 0x0000000000000010ULL}},
  {{0x00FF000000000000ULL, 0x4200000000000000ULL, 0x2400000000000000ULL, 0x8100000000000000ULL, 0x0800000000000000ULL, 0x1000000000000000ULL}},
}};

// Six bitboards for one side. Masks are replaced whole, never edited bit by bit here.
class PieceSet {
public:
  PieceSet() = default;

  static PieceSet starting(Color c);

  // Both throw InvalidPieceError for Piece::None
  Bitboard get(Piece p) const;
  void set(Piece p, Bitboard mask);

  Bitboard occupancy() const;

  friend bool operator==(const PieceSet&, const PieceSet&) = default;

private:
  std::array<Bitboard, PIECE_N> bb_{};
};

} // namespace tessera
