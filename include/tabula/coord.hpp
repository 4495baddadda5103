#pragma once

#include "tabula/size.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace tabula
{

// Column (x) and row (y) of a grid position, 1-indexed.
// Ordered row first: (y, x).
struct Coord
{
    int x = 1;
    int y = 1;

    constexpr Coord() = default;
    constexpr Coord(int col, int row) : x(col), y(row) {}

    // Spreadsheet form: "E6" for (5, 6).
    std::string to_string() const;
    static Coord parse(std::string_view text);

    friend constexpr bool operator==(const Coord &, const Coord &) = default;
    friend constexpr std::strong_ordering operator<=>(const Coord &a, const Coord &b)
    {
        if (auto cmp = a.y <=> b.y; cmp != 0)
            return cmp;
        return a.x <=> b.x;
    }
};

constexpr Coord operator+(Coord c, Size s) { return {c.x + s.width, c.y + s.height}; }
constexpr Coord operator-(Coord c, Size s) { return {c.x - s.width, c.y - s.height}; }

} // namespace tabula
