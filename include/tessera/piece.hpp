#pragma once
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include "tessera/types.hpp"

namespace tessera {

struct InvalidPieceError : std::runtime_error { using std::runtime_error::runtime_error; };

// Unicode chess glyphs (UTF-8), U+2654..U+265F.
ColoredPiece piece_from_glyph(std::string_view glyph);
std::string glyph_of(ColoredPiece p);

// "pawn", "knight", ... ("none" for Piece::None)
const char* piece_name(Piece p);

std::ostream& operator<<(std::ostream& os, ColoredPiece p);

} // namespace tessera
