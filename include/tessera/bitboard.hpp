#pragma once
#include <bit>
#include <iosfwd>
#include <string>
#include <string_view>
#include "tessera/types.hpp"

namespace tessera {

// 64-bit occupancy mask, bit i <-> square i (a1 = bit 0, h8 = bit 63).
class Bitboard {
public:
  constexpr Bitboard() = default;
  constexpr explicit Bitboard(U64 bits) : bits_(bits) {}

  // Single-bit masks. Both throw InvalidSquareError on bad input.
  static Bitboard from_square(std::string_view text);
  static Bitboard from_index(Square s);

  constexpr U64 bits() const { return bits_; }
  constexpr bool empty() const { return bits_ == 0ULL; }
  constexpr bool test(Square s) const { return is_valid_square(s) && ((bits_ >> s) & 1ULL) != 0; }
  constexpr int popcount() const { return std::popcount(bits_); }

  // Lowest set square, NO_SQUARE when empty
  constexpr Square lsb() const { return bits_ ? std::countr_zero(bits_) : NO_SQUARE; }
  constexpr Square pop_lsb() {
    const Square s = lsb();
    bits_ &= bits_ - 1;
    return s;
  }

  constexpr Bitboard& operator^=(Bitboard o) { bits_ ^= o.bits_; return *this; }
  constexpr Bitboard& operator|=(Bitboard o) { bits_ |= o.bits_; return *this; }
  constexpr Bitboard& operator&=(Bitboard o) { bits_ &= o.bits_; return *this; }

  friend constexpr Bitboard operator^(Bitboard a, Bitboard b) { return Bitboard(a.bits_ ^ b.bits_); }
  friend constexpr Bitboard operator|(Bitboard a, Bitboard b) { return Bitboard(a.bits_ | b.bits_); }
  friend constexpr Bitboard operator&(Bitboard a, Bitboard b) { return Bitboard(a.bits_ & b.bits_); }
  friend constexpr Bitboard operator~(Bitboard a) { return Bitboard(~a.bits_); }
  friend constexpr bool operator==(Bitboard, Bitboard) = default;

  // Rank 8 first, file a leftmost, then an "abcdefgh" footer line.
  std::string render() const;

private:
  U64 bits_ = 0ULL;
};

std::ostream& operator<<(std::ostream& os, Bitboard b);

} // namespace tessera
