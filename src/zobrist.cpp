#include "tessera/zobrist.hpp"


namespace tessera {


Zobrist::Zobrist(std::uint64_t s) : seed(s) {
std::uint64_t x = s;
for (auto& by_color : piece_on)
for (auto& by_piece : by_color)
for (auto& k : by_piece)
k = splitmix64(x);
}


const Zobrist& Zobrist::instance() {
static const Zobrist z;
return z;
}


} // namespace tessera
