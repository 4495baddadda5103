#pragma once

#include "tabula/coord.hpp"
#include "tabula/size.hpp"

#include <compare>
#include <optional>
#include <span>
#include <string>

namespace tabula
{

// Axis-aligned rectangle of grid positions, bounds inclusive.
// Always valid: 1 <= min.x <= max.x and 1 <= min.y <= max.y.
class Box
{
public:
    // Unit box at A1.
    constexpr Box() = default;

    static Box from_corners(Coord min, Coord max);
    // Throws InvalidBounds for an empty span or one past the coordinate range.
    static Box from_origin_and_size(Coord min, Size size);
    static Box from_bounds(int min_x, int min_y, int max_x, int max_y);
    static Box unit_at(Coord coord);
    static Box unit_at(int x, int y);

    // Smallest box containing every box of the range; empty range gives no value.
    static std::optional<Box> bounding_box(std::span<const Box> boxes);
    // Common part of every box of the range; empty range gives no value.
    // Throws InvalidBounds when the boxes do not all overlap.
    static std::optional<Box> intersection(std::span<const Box> boxes);

    const Coord &min() const noexcept { return min_; }
    const Coord &max() const noexcept { return max_; }
    int width() const noexcept { return max_.x - min_.x + 1; }
    int height() const noexcept { return max_.y - min_.y + 1; }
    Size size() const noexcept { return {width(), height()}; }

    // "E6" for a unit box, "E6:G8" otherwise.
    std::string to_string() const;

    bool contains(Coord coord) const noexcept;
    bool contains(const Box &other) const noexcept;

    // Corner test: true when a corner of one box lies inside the other.
    // A box crossing through the middle of another without enclosing one of
    // its corners is not detected.
    bool intersect(const Box &other) const noexcept;
    bool is_disjoint(const Box &other) const noexcept { return !intersect(other); }

    Box unite(const Box &other) const;
    // Throws InvalidBounds when the boxes do not overlap.
    Box intersection(const Box &other) const;

    // Same min corner, max corner moved by delta. Throws InvalidBounds when
    // the result is inverted or leaves the coordinate range.
    Box extend(Size delta) const;
    Box transform(std::optional<Coord> coord, std::optional<Size> size) const;
    Box move_to(Coord coord) const { return transform(coord, std::nullopt); }
    Box resize(Size size) const { return transform(std::nullopt, size); }

    friend bool operator==(const Box &, const Box &) = default;
    // Row-major: (min.y, min.x, max.y, max.x).
    friend std::strong_ordering operator<=>(const Box &a, const Box &b) noexcept;

private:
    constexpr Box(Coord min, Coord max) : min_(min), max_(max) {}

    Coord min_{1, 1};
    Coord max_{1, 1};
};

inline Box operator|(const Box &a, const Box &b) { return a.unite(b); }
inline Box operator&(const Box &a, const Box &b) { return a.intersection(b); }

} // namespace tabula
