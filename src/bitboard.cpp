#include "tessera/bitboard.hpp"
#include "tessera/square.hpp"
#include <ostream>

namespace tessera {

Bitboard Bitboard::from_square(std::string_view text) {
  return Bitboard(1ULL << to_index(text));
}

Bitboard Bitboard::from_index(Square s) {
  if (!is_valid_square(s)) throw InvalidSquareError("Square index out of range: " + std::to_string(s));
  return Bitboard(1ULL << s);
}

std::string Bitboard::render() const {
  std::string out;
  out.reserve(9 * 9);
  for (int r = 7; r >= 0; --r) {
    for (int f = 0; f < 8; ++f) out += test(make_square(f, r)) ? '1' : '0';
    out += '\n';
  }
  out += "abcdefgh\n";
  return out;
}

std::ostream& operator<<(std::ostream& os, Bitboard b) {
  return os << b.render();
}

} // namespace tessera
