#include "tessera/piece.hpp"
#include <array>
#include <ostream>

namespace tessera {

namespace {

struct GlyphEntry {
  std::string_view glyph;
  ColoredPiece piece;
};

constexpr std::array<GlyphEntry, 12> GLYPHS{{
  {"♔", {Color::White, Piece::King}},
  {"♕", {Color::White, Piece::Queen}},
  {"♖", {Color::White, Piece::Rook}},
  {"♗", {Color::White, Piece::Bishop}},
  {"♘", {Color::White, Piece::Knight}},
  {"♙", {Color::White, Piece::Pawn}},
  {"♚", {Color::Black, Piece::King}},
  {"♛", {Color::Black, Piece::Queen}},
  {"♜", {Color::Black, Piece::Rook}},
  {"♝", {Color::Black, Piece::Bishop}},
  {"♞", {Color::Black, Piece::Knight}},
  {"♟", {Color::Black, Piece::Pawn}},
}};

} // namespace

ColoredPiece piece_from_glyph(std::string_view glyph) {
  for (const auto& e : GLYPHS)
    if (e.glyph == glyph) return e.piece;
  throw InvalidPieceError("Unrecognized piece glyph '" + std::string(glyph) + "'");
}

std::string glyph_of(ColoredPiece p) {
  for (const auto& e : GLYPHS)
    if (e.piece == p) return std::string(e.glyph);
  throw InvalidPieceError(std::string("No glyph for piece type ") + piece_name(p.piece));
}

const char* piece_name(Piece p) {
  switch (p) {
    case Piece::Pawn:   return "pawn";
    case Piece::Knight: return "knight";
    case Piece::Bishop: return "bishop";
    case Piece::Rook:   return "rook";
    case Piece::Queen:  return "queen";
    case Piece::King:   return "king";
    case Piece::None:   break;
  }
  return "none";
}

std::ostream& operator<<(std::ostream& os, ColoredPiece p) {
  return os << (p.color == Color::White ? "white " : "black ") << piece_name(p.piece);
}

} // namespace tessera
