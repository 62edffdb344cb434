#include <cassert>
#include <optional>
#include <string>
#include "tessera/position.hpp"
#include "tessera/square.hpp"
#include "tessera/piece.hpp"
#include "test_util.hpp"

using namespace tessera;

static int total_bits(const Position& p) {
  int n = 0;
  for (Color c : {Color::White, Color::Black})
    for (int t = 0; t < PIECE_N; ++t) n += p.bitboard_for(c, static_cast<Piece>(t)).popcount();
  return n;
}

int main() {
  const ColoredPiece WK{Color::White, Piece::King};
  const ColoredPiece WQ{Color::White, Piece::Queen};
  const ColoredPiece WR{Color::White, Piece::Rook};
  const ColoredPiece BN{Color::Black, Piece::Knight};
  const ColoredPiece BQ{Color::Black, Piece::Queen};

  // --- Standard start ---
  {
    const Position p = Position::standard();
    Bitboard rank2;
    for (char f = 'a'; f <= 'h'; ++f) rank2 |= Bitboard::from_square(std::string{f, '2'});
    assert(p.bitboard_for(Color::White, Piece::Pawn) == rank2);
    assert(p.bitboard_for(Color::Black, Piece::King) == Bitboard::from_square("e8"));

    // 32 pieces, no two bitboards share a square
    assert(total_bits(p) == 32);
    assert(p.occupied().popcount() == 32);
    assert(p.piece_count() == 32);

    assert(p.get_square("e1") == WK);
    assert(p.get_square("D8") == BQ);
    assert(p.get_square("a1") == WR);
    assert(!p.get_square("e4"));
    for (Square s = 0; s < SQUARE_N; ++s)
      assert(p.piece_on(s).has_value() == p.occupied().test(s));

    assert(p.has_mailbox());
    assert(p.is_consistent());

    const std::string r = p.render();
    assert(r.substr(0, r.find('\n')) == "♜♞♝♛♚♝♞♜");
    assert(r.find("........\n") != std::string::npos);
  }

  // --- Empty ---
  {
    const Position e = Position::empty();
    assert(total_bits(e) == 0);
    assert(e.piece_count() == 0);
    assert(e.hash() == 0ULL);
    for (Square s = 0; s < SQUARE_N; ++s) assert(!e.piece_on(s));
    assert(e.is_consistent());
    assert(e != Position::standard());
  }

  // --- Square setters keep both views in step ---
  {
    Position p = Position::empty();
    p.set_square("e4", WQ);
    assert(p.get_square("e4") == WQ);
    assert(p.bitboard_for(Color::White, Piece::Queen) == Bitboard::from_square("e4"));
    assert(p.is_consistent());

    // overwrite
    p.set_square("e4", BN);
    assert(p.get_square("e4") == BN);
    assert(p.bitboard_for(Color::White, Piece::Queen).empty());
    assert(p.bitboard_for(Color::Black, Piece::Knight) == Bitboard::from_square("e4"));
    assert(p.is_consistent());

    p.set_square("e4", std::nullopt);
    assert(!p.get_square("e4"));
    assert(p.piece_count() == 0);
    assert(p.is_consistent());
    assert(p == Position::empty());
  }

  // --- Malformed input leaves the position alone ---
  {
    Position p = Position::standard();
    const Position before = p;
    assert(throws<InvalidSquareError>([&] { p.set_square("z1", WQ); }));
    assert(throws<InvalidSquareError>([&] { p.set_square("e9", std::nullopt); }));
    assert(throws<InvalidSquareError>([&] { p.get_square("e"); }));
    assert(throws<InvalidSquareError>([&] { p.piece_on(64); }));
    assert(throws<InvalidPieceError>([&] { p.set_square("e4", ColoredPiece{Color::White, Piece::None}); }));
    assert(throws<InvalidPieceError>([&] { p.set_bitboard(Color::Black, Piece::None, Bitboard(1)); }));
    assert(p == before);
  }

  // --- Whole-bitboard replacement ---
  {
    Position p = Position::standard();
    const Bitboard rooks = Bitboard::from_square("a1") | Bitboard::from_square("e8");
    p.set_bitboard(Color::White, Piece::Rook, rooks);
    assert(p.bitboard_for(Color::White, Piece::Rook) == rooks);
    assert(p.bitboard_for(Color::Black, Piece::King).empty()); // e8 taken over
    assert(p.get_square("e8") == WR);
    assert(!p.get_square("h1"));
    assert(p.get_square("a1") == WR);
    assert(p.piece_count() == 31);
    assert(p.is_consistent());
  }

  // --- Without the mailbox, lookups scan the bitboards ---
  {
    Position p = Position::standard({.mailbox = false});
    assert(!p.has_mailbox());
    assert(p.get_square("e1") == WK);
    assert(p.get_square("d8") == BQ);
    assert(!p.get_square("e5"));
    assert(p.hash() == Position::standard().hash());
    assert(p.is_consistent());

    p.set_square("e5", BN);
    assert(p.get_square("e5") == BN);
    assert(p.is_consistent());
  }

  // --- Rebuilding the start square by square gives the same value ---
  {
    const Position start = Position::standard();
    Position built = Position::empty();
    for (Square s = 0; s < SQUARE_N; ++s)
      if (auto pc = start.piece_on(s)) built.put(s, pc);
    assert(built == start);
    assert(built.hash() == start.hash());
  }

  return 0;
}
