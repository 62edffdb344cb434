#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "tessera/types.hpp"

namespace tessera {

struct InvalidSquareError : std::runtime_error { using std::runtime_error::runtime_error; };
struct InvalidFileError : std::runtime_error { using std::runtime_error::runtime_error; };

// "e4" -> 28. Exactly one letter a-h (either case) followed by one digit 1-8.
Square to_index(std::string_view text);

// 28 -> "e4" (always lower case)
std::string square_name(Square s);

int file_index_of(char file);
char file_for_index(int index);

} // namespace tessera
