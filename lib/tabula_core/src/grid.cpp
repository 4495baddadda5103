#include "tabula/grid.hpp"

#include "tabula/drawing.hpp"
#include "tabula/error.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace tabula
{

Grid::Grid(const std::vector<Cell> &cells)
{
    for (const auto &cell : cells)
        set(cell.min(), cell);
}

Grid::Grid(const Grid &other)
{
    cells_.reserve(other.cells_.size());
    for (const auto &cell : other.cells_)
        cells_.push_back(std::make_unique<Cell>(*cell));
}

Grid &Grid::operator=(const Grid &other)
{
    if (this != &other)
    {
        Grid copy(other);
        cells_ = std::move(copy.cells_);
    }
    return *this;
}

const Cell *Grid::find(Coord coord) const noexcept
{
    for (const auto &cell : cells_)
    {
        if (cell->contains(coord))
            return cell.get();
    }
    return nullptr;
}

Cell *Grid::find(Coord coord) noexcept
{
    return const_cast<Cell *>(std::as_const(*this).find(coord));
}

const Cell &Grid::at(Coord coord) const
{
    if (const Cell *cell = find(coord))
        return *cell;
    throw Error(ErrorKind::NotFound, "no cell at " + coord.to_string());
}

Cell &Grid::at(Coord coord)
{
    return const_cast<Cell &>(std::as_const(*this).at(coord));
}

Cell &Grid::set(Coord coord, const Cell &cell)
{
    auto placed = std::make_unique<Cell>(cell.move_to(coord));
    for (const auto &existing : cells_)
    {
        if (existing->box().intersect(placed->box()))
        {
            throw Error(ErrorKind::Collision, "cell " + placed->box().to_string() + " overlaps cell " +
                                                  existing->box().to_string());
        }
    }
    return insert_sorted(std::move(placed));
}

void Grid::erase(Coord coord)
{
    auto it = std::find_if(cells_.begin(), cells_.end(), [&](const auto &cell) { return cell->contains(coord); });
    if (it == cells_.end())
        throw Error(ErrorKind::NotFound, "no cell at " + coord.to_string());
    cells_.erase(it);
}

Cell &Grid::merge(Coord start, Coord end, const ContentAppender &appender)
{
    return merge_into(Box::from_corners(start, end), nullptr, appender);
}

Cell &Grid::expand(Coord coord, int width, int height, const ContentAppender &appender)
{
    const Cell &cell = at(coord);
    return merge_into(cell.box().extend(Size(width, height)), &cell, appender);
}

Cell &Grid::merge_into(const Box &target, const Cell *anchor, const ContentAppender &appender)
{
    std::vector<const Cell *> merged;
    for (const auto &cell : cells_)
    {
        if (cell.get() == anchor || target.contains(cell->box()))
            merged.push_back(cell.get());
        else if (cell->box().intersect(target))
            throw Error(ErrorKind::AmbiguousMerge, "cell " + cell->box().to_string() + " straddles " +
                                                       target.to_string());
    }
    if (merged.empty())
        throw Error(ErrorKind::EmptyMerge, "nothing to merge in " + target.to_string());

    auto result = std::make_unique<Cell>(merged.front()->transform(target.min(), target.size()));
    for (auto it = std::next(merged.begin()); it != merged.end(); ++it)
    {
        const Cell &other = **it;
        result->set_content(appender ? appender(result->content(), other.content())
                                     : append_content(result->content(), other.content()));
        for (const auto &[key, value] : other.styles())
            result->styles().insert_or_assign(key, value);
    }

    std::unordered_set<const Cell *> doomed(merged.begin(), merged.end());
    std::erase_if(cells_, [&](const auto &cell) { return doomed.count(cell.get()) != 0; });
    return insert_sorted(std::move(result));
}

std::optional<Box> Grid::bounding_box() const
{
    std::vector<Box> boxes;
    boxes.reserve(cells_.size());
    for (const auto &cell : cells_)
        boxes.push_back(cell->box());
    return Box::bounding_box(boxes);
}

std::vector<std::vector<const Cell *>> Grid::iter_rows() const
{
    std::vector<std::vector<const Cell *>> rows;
    for (const auto &cell : cells_)
    {
        if (rows.empty() || rows.back().front()->min().y != cell->min().y)
            rows.emplace_back();
        rows.back().push_back(cell.get());
    }
    return rows;
}

std::string Grid::to_string() const
{
    return draw(*this);
}

Grid::CellList::iterator Grid::insertion_point(const Box &box)
{
    const Box key = Box::unit_at(box.min());
    return std::lower_bound(cells_.begin(), cells_.end(), key,
                            [](const std::unique_ptr<Cell> &cell, const Box &value) { return cell->box() < value; });
}

Cell &Grid::insert_sorted(std::unique_ptr<Cell> cell)
{
    auto it = cells_.insert(insertion_point(cell->box()), std::move(cell));
    return **it;
}

} // namespace tabula
