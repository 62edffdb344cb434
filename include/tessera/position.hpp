#pragma once
#include <array>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include "tessera/bitboard.hpp"
#include "tessera/piece_set.hpp"
#include "tessera/types.hpp"

namespace tessera {

class Move;

struct PositionOptions {
  bool mailbox = true; // keep the square-indexed view alongside the bitboards
};

// Twelve bitboards (two PieceSets) plus an optional mailbox.
//
// Every public mutator updates bitboards, mailbox and hash together; the
// twelve bitboards never share a set bit and the mailbox (when enabled)
// always names the single piece whose bit is set on that square.
class Position {
public:
  static Position standard(PositionOptions opts = {});
  static Position empty(PositionOptions opts = {});

  const PieceSet& pieces(Color c) const { return sides_[static_cast<std::size_t>(c)]; }
  Bitboard bitboard_for(Color c, Piece p) const;

  // Whole-mask replacement. Squares in `mask` are taken away from every other
  // bitboard so occupancy stays disjoint.
  void set_bitboard(Color c, Piece p, Bitboard mask);

  // Throw InvalidSquareError on malformed text / index
  std::optional<ColoredPiece> get_square(std::string_view text) const;
  void set_square(std::string_view text, std::optional<ColoredPiece> piece);
  std::optional<ColoredPiece> piece_on(Square s) const;
  void put(Square s, std::optional<ColoredPiece> piece);

  Bitboard occupancy(Color c) const { return pieces(c).occupancy(); }
  Bitboard occupied() const { return occupancy(Color::White) | occupancy(Color::Black); }
  int piece_count() const { return occupied().popcount(); }

  bool has_mailbox() const { return mailbox_enabled_; }
  U64 hash() const { return hash_; }

  // Full invariant check: disjoint bitboards, mailbox agreement, hash.
  bool is_consistent() const;

  // Glyph grid, rank 8 first, '.' on empty squares
  std::string render() const;

  friend bool operator==(const Position&, const Position&) = default;

private:
  explicit Position(PositionOptions opts) : mailbox_enabled_(opts.mailbox) {}

  friend Position apply(const Position& pos, const Move& m);

  // Primitives for apply. Each keeps the hash in step with the bitboards;
  // the caller owns the mailbox side through write_slot.
  void xor_bits(ColoredPiece p, Bitboard toggle);
  Piece remove_at(Color c, Square s);
  void write_slot(Square s, std::optional<ColoredPiece> piece);

  std::optional<ColoredPiece> scan(Square s) const;
  void sync_slot(Square s);
  U64 compute_hash() const;

  std::array<PieceSet, COLOR_N> sides_{};
  std::array<std::optional<ColoredPiece>, SQUARE_N> mailbox_{};
  bool mailbox_enabled_ = true;
  U64 hash_ = 0ULL;
};

std::ostream& operator<<(std::ostream& os, const Position& pos);

} // namespace tessera
