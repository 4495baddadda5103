#include "tabula/box.hpp"

#include "tabula/error.hpp"

#include <algorithm>
#include <limits>

namespace tabula
{
namespace
{
std::string describe_bounds(int min_x, int min_y, int max_x, int max_y)
{
    return "(" + std::to_string(min_x) + ", " + std::to_string(min_y) + ", " + std::to_string(max_x) + ", " +
           std::to_string(max_y) + ")";
}

// base + offset, or InvalidBounds when the result does not fit a coordinate.
int checked_bound(int base, long long offset, const Box &box)
{
    const long long bound = static_cast<long long>(base) + offset;
    if (bound < 1 || bound > std::numeric_limits<int>::max())
        throw Error(ErrorKind::InvalidBounds,
                    "box " + box.to_string() + " cannot reach coordinate " + std::to_string(bound));
    return static_cast<int>(bound);
}
} // namespace

Box Box::from_bounds(int min_x, int min_y, int max_x, int max_y)
{
    if (0 < min_x && min_x <= max_x && 0 < min_y && min_y <= max_y)
        return Box(Coord(min_x, min_y), Coord(max_x, max_y));
    throw Error(ErrorKind::InvalidBounds, "box " + describe_bounds(min_x, min_y, max_x, max_y));
}

Box Box::from_corners(Coord min, Coord max)
{
    return from_bounds(min.x, min.y, max.x, max.y);
}

Box Box::from_origin_and_size(Coord min, Size size)
{
    if (size.width < 1 || size.height < 1)
        throw Error(ErrorKind::InvalidBounds, "span " + size.to_string() + " at " + min.to_string());
    const Box origin = unit_at(min);
    return from_bounds(min.x, min.y, checked_bound(min.x, size.width - 1LL, origin),
                       checked_bound(min.y, size.height - 1LL, origin));
}

Box Box::unit_at(Coord coord)
{
    return from_bounds(coord.x, coord.y, coord.x, coord.y);
}

Box Box::unit_at(int x, int y)
{
    return from_bounds(x, y, x, y);
}

std::optional<Box> Box::bounding_box(std::span<const Box> boxes)
{
    if (boxes.empty())
        return std::nullopt;
    Box result = boxes.front();
    for (const auto &box : boxes.subspan(1))
        result = result.unite(box);
    return result;
}

std::string Box::to_string() const
{
    if (width() == 1 && height() == 1)
        return min_.to_string();
    return min_.to_string() + ":" + max_.to_string();
}

bool Box::contains(Coord coord) const noexcept
{
    return min_.x <= coord.x && coord.x <= max_.x && min_.y <= coord.y && coord.y <= max_.y;
}

bool Box::contains(const Box &other) const noexcept
{
    return contains(other.min_) && contains(other.max_);
}

bool Box::intersect(const Box &other) const noexcept
{
    return other.contains(min_) || other.contains(max_) || contains(other.min_) || contains(other.max_);
}

Box Box::unite(const Box &other) const
{
    return Box(Coord(std::min(min_.x, other.min_.x), std::min(min_.y, other.min_.y)),
               Coord(std::max(max_.x, other.max_.x), std::max(max_.y, other.max_.y)));
}

std::optional<Box> Box::intersection(std::span<const Box> boxes)
{
    if (boxes.empty())
        return std::nullopt;
    Box result = boxes.front();
    for (const auto &box : boxes.subspan(1))
        result = result.intersection(box);
    return result;
}

Box Box::intersection(const Box &other) const
{
    return from_bounds(std::max(min_.x, other.min_.x), std::max(min_.y, other.min_.y),
                       std::min(max_.x, other.max_.x), std::min(max_.y, other.max_.y));
}

Box Box::extend(Size delta) const
{
    return from_bounds(min_.x, min_.y, checked_bound(max_.x, delta.width, *this),
                       checked_bound(max_.y, delta.height, *this));
}

Box Box::transform(std::optional<Coord> coord, std::optional<Size> size) const
{
    return from_origin_and_size(coord.value_or(min_), size.value_or(this->size()));
}

std::strong_ordering operator<=>(const Box &a, const Box &b) noexcept
{
    if (auto cmp = a.min_.y <=> b.min_.y; cmp != 0)
        return cmp;
    if (auto cmp = a.min_.x <=> b.min_.x; cmp != 0)
        return cmp;
    if (auto cmp = a.max_.y <=> b.max_.y; cmp != 0)
        return cmp;
    return a.max_.x <=> b.max_.x;
}

} // namespace tabula
