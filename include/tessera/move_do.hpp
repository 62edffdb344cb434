#pragma once
#include <string_view>
#include "tessera/move.hpp"
#include "tessera/position.hpp"

namespace tessera {

// Successor of `pos` after `m`. `pos` is left untouched, so callers keep the
// old value for undo or for exploring sibling moves.
Position apply(const Position& pos, const Move& m);

// Square text is validated (InvalidSquareError) before anything is built.
Position apply(const Position& pos, ColoredPiece piece,
               std::string_view from, std::string_view to, MoveType type);

} // namespace tessera
