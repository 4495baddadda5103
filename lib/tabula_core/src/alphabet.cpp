#include "tabula/alphabet.hpp"

#include "tabula/error.hpp"

#include <algorithm>
#include <limits>

namespace tabula
{
namespace
{
constexpr int kRadix = 26;
}

std::string int_to_alphabet(int value)
{
    if (value < 0)
        throw Error(ErrorKind::InvalidArgument, "negative alphabet value " + std::to_string(value));

    std::string letters;
    while (value > 0)
    {
        int remainder = (value - 1) % kRadix;
        letters.push_back(static_cast<char>('A' + remainder));
        value = (value - 1) / kRadix;
    }
    std::reverse(letters.begin(), letters.end());
    return letters;
}

int alphabet_to_int(std::string_view letters)
{
    long long value = 0;
    for (char letter : letters)
    {
        if (letter < 'A' || letter > 'Z')
            throw Error(ErrorKind::InvalidArgument, "not an alphabet number: '" + std::string(letters) + "'");
        value = value * kRadix + (letter - 'A' + 1);
        if (value > std::numeric_limits<int>::max())
            throw Error(ErrorKind::InvalidArgument, "alphabet number too large: '" + std::string(letters) + "'");
    }
    return static_cast<int>(value);
}

} // namespace tabula
