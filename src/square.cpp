#include "tessera/square.hpp"

namespace tessera {

static inline char lower_ascii(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

static std::string quoted(std::string_view text) {
  std::string out = "'";
  out.append(text);
  out += '\'';
  return out;
}

Square to_index(std::string_view text) {
  if (text.size() != 2) throw InvalidSquareError("Invalid square " + quoted(text) + ": expected two characters");
  const char f = lower_ascii(text[0]);
  const char r = text[1];
  if (f < 'a' || f > 'h') throw InvalidSquareError("Invalid square " + quoted(text) + ": file must be a-h");
  if (r < '1' || r > '8') throw InvalidSquareError("Invalid square " + quoted(text) + ": rank must be 1-8");
  return make_square(f - 'a', r - '1');
}

std::string square_name(Square s) {
  if (!is_valid_square(s)) throw InvalidSquareError("Square index out of range: " + std::to_string(s));
  std::string out;
  out += char('a' + file_of(s));
  out += char('1' + rank_of(s));
  return out;
}

int file_index_of(char file) {
  const char f = lower_ascii(file);
  if (f < 'a' || f > 'h') throw InvalidFileError(std::string("Invalid file '") + file + "': expected a-h");
  return f - 'a';
}

char file_for_index(int index) {
  if (index < 0 || index > 7) throw InvalidFileError("Invalid file index " + std::to_string(index) + ": expected 0-7");
  return static_cast<char>('a' + index);
}

} // namespace tessera
