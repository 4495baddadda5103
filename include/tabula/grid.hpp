#pragma once

#include "tabula/box.hpp"
#include "tabula/cell.hpp"
#include "tabula/content.hpp"
#include "tabula/indirect_iterator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabula
{

// Collision-free collection of cells, kept sorted in Box order.
//
// No two cell boxes intersect (see Box::intersect). Every mutating call
// validates before it changes anything: on error the grid is unchanged.
// Cell addresses stay valid until the cell is erased or merged away.
// Not safe for concurrent mutation.
class Grid
{
public:
    using CellList = std::vector<std::unique_ptr<Cell>>;
    using iterator = IndirectIterator<Cell, CellList::iterator>;
    using const_iterator = IndirectIterator<const Cell, CellList::const_iterator>;

    Grid() = default;
    // Inserts each cell at its own position. Throws Collision on overlap.
    explicit Grid(const std::vector<Cell> &cells);

    Grid(const Grid &other);
    Grid &operator=(const Grid &other);
    Grid(Grid &&) noexcept = default;
    Grid &operator=(Grid &&) noexcept = default;

    std::size_t size() const noexcept { return cells_.size(); }
    bool empty() const noexcept { return cells_.empty(); }

    iterator begin() noexcept { return iterator(cells_.begin()); }
    iterator end() noexcept { return iterator(cells_.end()); }
    const_iterator begin() const noexcept { return const_iterator(cells_.begin()); }
    const_iterator end() const noexcept { return const_iterator(cells_.end()); }

    bool contains(Coord coord) const noexcept { return find(coord) != nullptr; }
    const Cell *find(Coord coord) const noexcept;
    Cell *find(Coord coord) noexcept;
    // Throws NotFound.
    const Cell &at(Coord coord) const;
    Cell &at(Coord coord);

    // Inserts a copy of cell moved to coord. Throws Collision.
    Cell &set(Coord coord, const Cell &cell);
    // Removes the cell covering coord. Throws NotFound.
    void erase(Coord coord);

    // Replaces the cells enclosed by the box [start, end] with one cell
    // spanning the box. Contents are combined left to right with appender
    // (append_content when empty), styles of later cells override earlier
    // ones, nature comes from the first cell.
    // Throws InvalidBounds, EmptyMerge or AmbiguousMerge.
    Cell &merge(Coord start, Coord end, const ContentAppender &appender = {});

    // Grows (or shrinks) the cell at coord by a column/row delta, as a merge
    // against the recomputed box. The cell itself always takes part in the
    // merge, so shrinking uncovers positions instead of failing.
    Cell &expand(Coord coord, int width = 0, int height = 0, const ContentAppender &appender = {});

    // Union of every cell box; no value for an empty grid.
    std::optional<Box> bounding_box() const;

    // Cells grouped by top row, in Box order.
    std::vector<std::vector<const Cell *>> iter_rows() const;

    // Debug drawing, see drawing.hpp.
    std::string to_string() const;

private:
    // anchor, when not null, is merged even if it is not enclosed by target.
    Cell &merge_into(const Box &target, const Cell *anchor, const ContentAppender &appender);
    CellList::iterator insertion_point(const Box &box);
    Cell &insert_sorted(std::unique_ptr<Cell> cell);

    CellList cells_;
};

} // namespace tabula
