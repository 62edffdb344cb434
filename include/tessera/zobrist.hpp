#pragma once
#include <array>
#include <cstdint>
#include "tessera/types.hpp"


namespace tessera {


// Placement keys for Position::hash(). Side to move, castling and en-passant
// state are not part of this core, so only piece_on is keyed.
struct Zobrist {
// piece_on[color][piece][square]
std::array<std::array<std::array<U64, SQUARE_N>, PIECE_N>, COLOR_N> piece_on{};
std::uint64_t seed{0};


static constexpr std::uint64_t DEFAULT_SEED = 0x9E3779B97F4A7C15ULL;


explicit Zobrist(std::uint64_t seed = DEFAULT_SEED);

// Table behind every Position::hash(), fixed at DEFAULT_SEED for the process
static const Zobrist& instance();

U64 key(ColoredPiece p, Square s) const {
return piece_on[static_cast<std::size_t>(p.color)]
               [static_cast<std::size_t>(p.piece)]
               [static_cast<std::size_t>(s)];
}
};


// Mix helper for deterministic RNG seeding
inline std::uint64_t splitmix64(std::uint64_t& x) {
x += 0x9e3779b97f4a7c15ULL;
std::uint64_t z = x;
z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
return z ^ (z >> 31);
}


} // namespace tessera
