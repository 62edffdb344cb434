#include "tessera/position.hpp"
#include "tessera/piece.hpp"
#include "tessera/square.hpp"
#include "tessera/zobrist.hpp"
#include <ostream>

namespace tessera {

static constexpr std::array<Piece, PIECE_N> ALL_PIECES{
  Piece::Pawn, Piece::Knight, Piece::Bishop, Piece::Rook, Piece::Queen, Piece::King};
static constexpr std::array<Color, COLOR_N> ALL_COLORS{Color::White, Color::Black};

static void require_square(Square s) {
  if (!is_valid_square(s)) throw InvalidSquareError("Square index out of range: " + std::to_string(s));
}

Position Position::standard(PositionOptions opts) {
  Position pos(opts);
  for (Color c : ALL_COLORS) pos.sides_[static_cast<std::size_t>(c)] = PieceSet::starting(c);
  if (pos.mailbox_enabled_)
    for (Square s = 0; s < SQUARE_N; ++s) pos.mailbox_[static_cast<std::size_t>(s)] = pos.scan(s);
  pos.hash_ = pos.compute_hash();
  return pos;
}

Position Position::empty(PositionOptions opts) {
  return Position(opts);
}

Bitboard Position::bitboard_for(Color c, Piece p) const {
  return pieces(c).get(p);
}

void Position::set_bitboard(Color c, Piece p, Bitboard mask) {
  const Bitboard old = bitboard_for(c, p); // throws for Piece::None before any change

  for (Color oc : ALL_COLORS) {
    for (Piece op : ALL_PIECES) {
      if (oc == c && op == p) continue;
      const Bitboard overlap = bitboard_for(oc, op) & mask;
      if (!overlap.empty()) xor_bits({oc, op}, overlap);
    }
  }
  xor_bits({c, p}, old ^ mask);

  Bitboard touched = old | mask;
  while (!touched.empty()) sync_slot(touched.pop_lsb());
}

std::optional<ColoredPiece> Position::get_square(std::string_view text) const {
  return piece_on(to_index(text));
}

void Position::set_square(std::string_view text, std::optional<ColoredPiece> piece) {
  put(to_index(text), piece);
}

std::optional<ColoredPiece> Position::piece_on(Square s) const {
  require_square(s);
  if (mailbox_enabled_) return mailbox_[static_cast<std::size_t>(s)];
  return scan(s);
}

void Position::put(Square s, std::optional<ColoredPiece> piece) {
  require_square(s);
  if (piece && piece->piece == Piece::None)
    throw InvalidPieceError("Cannot place Piece::None on " + square_name(s));

  for (Color c : ALL_COLORS) remove_at(c, s);
  if (piece) xor_bits(*piece, Bitboard::from_index(s));
  write_slot(s, piece);
}

bool Position::is_consistent() const {
  Bitboard seen;
  int total = 0;
  for (Color c : ALL_COLORS) {
    for (Piece p : ALL_PIECES) {
      const Bitboard b = bitboard_for(c, p);
      seen |= b;
      total += b.popcount();
    }
  }
  if (total != seen.popcount()) return false;

  if (mailbox_enabled_) {
    for (Square s = 0; s < SQUARE_N; ++s)
      if (mailbox_[static_cast<std::size_t>(s)] != scan(s)) return false;
  } else {
    for (const auto& slot : mailbox_)
      if (slot) return false;
  }
  return hash_ == compute_hash();
}

std::string Position::render() const {
  std::string out;
  for (int r = 7; r >= 0; --r) {
    for (int f = 0; f < 8; ++f) {
      const auto pc = piece_on(make_square(f, r));
      out += pc ? glyph_of(*pc) : std::string(".");
    }
    out += '\n';
  }
  out += "abcdefgh\n";
  return out;
}

void Position::xor_bits(ColoredPiece p, Bitboard toggle) {
  PieceSet& side = sides_[static_cast<std::size_t>(p.color)];
  side.set(p.piece, side.get(p.piece) ^ toggle);

  const auto& Z = Zobrist::instance();
  while (!toggle.empty()) hash_ ^= Z.key(p, toggle.pop_lsb());
}

Piece Position::remove_at(Color c, Square s) {
  const Bitboard mask = Bitboard::from_index(s);
  for (Piece p : ALL_PIECES) {
    if (bitboard_for(c, p).test(s)) {
      xor_bits({c, p}, mask);
      return p;
    }
  }
  return Piece::None;
}

void Position::write_slot(Square s, std::optional<ColoredPiece> piece) {
  if (mailbox_enabled_) mailbox_[static_cast<std::size_t>(s)] = piece;
}

std::optional<ColoredPiece> Position::scan(Square s) const {
  for (Color c : ALL_COLORS)
    for (Piece p : ALL_PIECES)
      if (bitboard_for(c, p).test(s)) return ColoredPiece{c, p};
  return std::nullopt;
}

void Position::sync_slot(Square s) {
  write_slot(s, scan(s));
}

U64 Position::compute_hash() const {
  const auto& Z = Zobrist::instance();
  U64 h = 0ULL;
  for (Color c : ALL_COLORS) {
    for (Piece p : ALL_PIECES) {
      Bitboard b = bitboard_for(c, p);
      while (!b.empty()) h ^= Z.key({c, p}, b.pop_lsb());
    }
  }
  return h;
}

std::ostream& operator<<(std::ostream& os, const Position& pos) {
  return os << pos.render();
}

} // namespace tessera
