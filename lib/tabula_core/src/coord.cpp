#include "tabula/coord.hpp"

#include "tabula/alphabet.hpp"
#include "tabula/error.hpp"

#include <charconv>

namespace tabula
{

std::string Size::to_string() const
{
    return "(" + std::to_string(width) + " x " + std::to_string(height) + ")";
}

std::string Coord::to_string() const
{
    return int_to_alphabet(x) + std::to_string(y);
}

Coord Coord::parse(std::string_view text)
{
    std::size_t split = 0;
    while (split < text.size() && text[split] >= 'A' && text[split] <= 'Z')
        ++split;
    if (split == 0 || split == text.size())
        throw Error(ErrorKind::InvalidArgument, "invalid coordinate '" + std::string(text) + "'");

    int row = 0;
    auto digits = text.substr(split);
    auto rc = std::from_chars(digits.data(), digits.data() + digits.size(), row);
    if (rc.ec != std::errc() || rc.ptr != digits.data() + digits.size() || row < 1)
        throw Error(ErrorKind::InvalidArgument, "invalid coordinate '" + std::string(text) + "'");

    return Coord(alphabet_to_int(text.substr(0, split)), row);
}

} // namespace tabula
