#pragma once

#include <string>
#include <string_view>

namespace tabula
{

// Base-26 "numbers" written with uppercase letters: 1 -> "A", 27 -> "AA".
// Zero maps to the empty string; negative values throw InvalidArgument.
std::string int_to_alphabet(int value);

// Inverse of int_to_alphabet. Throws InvalidArgument on any letter outside A-Z.
int alphabet_to_int(std::string_view letters);

} // namespace tabula
