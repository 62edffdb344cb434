#pragma once
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include "tessera/types.hpp"

namespace tessera {

enum class MoveType : std::uint8_t {
  Quiet,
  DoublePawnPush,
  KingsideCastle,
  QueensideCastle,
  Capture,
  EnPassant,
  KnightPromote,
  BishopPromote,
  RookPromote,
  QueenPromote,
  KnightPromoteCapture,
  BishopPromoteCapture,
  RookPromoteCapture,
  QueenPromoteCapture,
};

inline constexpr std::uint8_t CAPTURE_FLAG   = 0x04;
inline constexpr std::uint8_t PROMOTION_FLAG = 0x08; // promotions are tags 0x8..0xF

// 4-bit tag: bit 2 = capture, bit 3 = promotion, low bits = variant
constexpr std::uint8_t move_flags(MoveType t) {
  switch (t) {
    case MoveType::Quiet:                return 0x0;
    case MoveType::DoublePawnPush:       return 0x1;
    case MoveType::KingsideCastle:       return 0x2;
    case MoveType::QueensideCastle:      return 0x3;
    case MoveType::Capture:              return 0x4;
    case MoveType::EnPassant:            return 0x5;
    case MoveType::KnightPromote:        return 0x8;
    case MoveType::BishopPromote:        return 0x9;
    case MoveType::RookPromote:          return 0xA;
    case MoveType::QueenPromote:         return 0xB;
    case MoveType::KnightPromoteCapture: return 0xC;
    case MoveType::BishopPromoteCapture: return 0xD;
    case MoveType::RookPromoteCapture:   return 0xE;
    case MoveType::QueenPromoteCapture:  return 0xF;
  }
  return 0x0;
}

constexpr bool is_capture(MoveType t)   { return (move_flags(t) & CAPTURE_FLAG) != 0; }
constexpr bool is_promotion(MoveType t) { return (move_flags(t) & PROMOTION_FLAG) != 0; }
constexpr bool is_castle(MoveType t) {
  return t == MoveType::KingsideCastle || t == MoveType::QueensideCastle;
}

// Piece::None unless t is a promotion
constexpr Piece promotion_piece(MoveType t) {
  if (!is_promotion(t)) return Piece::None;
  switch (move_flags(t) & 0x3) {
    case 0:  return Piece::Knight;
    case 1:  return Piece::Bishop;
    case 2:  return Piece::Rook;
    default: return Piece::Queen;
  }
}

static_assert(!is_capture(MoveType::Quiet) && !is_capture(MoveType::QueensideCastle));
static_assert(is_capture(MoveType::EnPassant) && is_capture(MoveType::KnightPromoteCapture));
static_assert(!is_capture(MoveType::QueenPromote) && is_promotion(MoveType::QueenPromote));
static_assert(!is_promotion(MoveType::EnPassant));
static_assert(promotion_piece(MoveType::RookPromoteCapture) == Piece::Rook);

const char* move_type_name(MoveType t);

// Immutable move descriptor. Squares are validated on construction
// (InvalidSquareError); nothing else is, the move generator is trusted.
class Move {
public:
  Move(ColoredPiece piece, Square from, Square to, MoveType type);
  Move(ColoredPiece piece, std::string_view from, std::string_view to, MoveType type);

  ColoredPiece piece() const { return piece_; }
  Square from() const { return from_; }
  Square to() const { return to_; }
  MoveType type() const { return type_; }

  bool is_capture() const { return tessera::is_capture(type_); }
  bool is_promotion() const { return tessera::is_promotion(type_); }

  friend bool operator==(const Move&, const Move&) = default;

private:
  ColoredPiece piece_;
  Square from_;
  Square to_;
  MoveType type_;
};

std::ostream& operator<<(std::ostream& os, MoveType t);
std::ostream& operator<<(std::ostream& os, const Move& m);

} // namespace tessera
