#pragma once

#include "tabula/box.hpp"
#include "tabula/cell.hpp"
#include "tabula/content.hpp"
#include "tabula/grid.hpp"
#include "tabula/indirect_iterator.hpp"
#include "tabula/styled.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tabula
{

class Table;

// Projection of the table cells on one row or one column.
//
// owned cells have their top-left corner on this row/column, caught cells
// pass through it (owned cells are always caught too). Both lists are kept
// in Box order. A view belongs to its table and is refreshed by it; a view
// obtained before a merge, delete or expand may have been discarded.
class TableView : public Styled
{
public:
    TableView(const TableView &) = delete;
    TableView &operator=(const TableView &) = delete;
    virtual ~TableView() = default;

    int pos() const noexcept { return pos_; }
    const Table &table() const noexcept { return *table_; }

    const std::vector<Cell *> &owned_cells() const noexcept { return owned_; }
    const std::vector<Cell *> &caught_cells() const noexcept { return caught_; }

    // Inserts a new cell at the first position of this row/column not
    // covered by a caught cell, or after the last one. The nature defaults
    // to the nature of the view. Throws InvalidBounds or Collision.
    Cell &insert_cell(CellContent content, StyleMap styles = {}, std::optional<std::string> nature = std::nullopt,
                      int width = 1, int height = 1);

    virtual bool can_own(const Cell &cell) const noexcept = 0;
    virtual bool can_catch(const Cell &cell) const noexcept = 0;

protected:
    TableView(Table &table, int pos, std::string nature);

    // Position along the view axis of the next free slot.
    int next_free_slot() const;
    virtual Coord slot_coord(int slot) const noexcept = 0;
    virtual int axis_of(Coord coord) const noexcept = 0;

private:
    friend class Table;

    void adopt(Cell &cell);
    void clear() noexcept;

    Table *table_;
    int pos_;
    std::vector<Cell *> owned_;
    std::vector<Cell *> caught_;
};

class RowView : public TableView
{
public:
    RowView(Table &table, int pos, std::string nature = kBodyNature);

    int row_pos() const noexcept { return pos(); }

    bool can_own(const Cell &cell) const noexcept override;
    bool can_catch(const Cell &cell) const noexcept override;

protected:
    Coord slot_coord(int slot) const noexcept override { return Coord(slot, pos()); }
    int axis_of(Coord coord) const noexcept override { return coord.x; }
};

class ColView : public TableView
{
public:
    ColView(Table &table, int pos, std::string nature = kBodyNature);

    int col_pos() const noexcept { return pos(); }

    bool can_own(const Cell &cell) const noexcept override;
    bool can_catch(const Cell &cell) const noexcept override;

protected:
    Coord slot_coord(int slot) const noexcept override { return Coord(pos(), slot); }
    int axis_of(Coord coord) const noexcept override { return coord.y; }
};

// Table model shared by every format adapter: a Grid plus row and column
// views, table styles and nature.
//
// Views are refreshed deterministically by each mutating call: set adopts
// the new cell into the views it touches, erase/merge/expand invalidate
// and rebuild every view. Not safe for concurrent mutation.
class Table : public Styled
{
public:
    template <typename View>
    using ViewList = std::vector<std::unique_ptr<View>>;
    using iterator = Grid::iterator;
    using const_iterator = Grid::const_iterator;
    using row_iterator = IndirectIterator<const RowView, ViewList<RowView>::const_iterator>;
    using col_iterator = IndirectIterator<const ColView, ViewList<ColView>::const_iterator>;

    // Throws Collision when two cells of the list intersect.
    explicit Table(const std::vector<Cell> &cells = {}, StyleMap styles = {}, std::string nature = kBodyNature);

    Table(const Table &other);
    Table &operator=(const Table &other);
    Table(Table &&other) noexcept;
    Table &operator=(Table &&other) noexcept;
    ~Table() = default;

    const Grid &grid() const noexcept { return grid_; }
    std::optional<Box> bounding_box() const { return grid_.bounding_box(); }

    std::size_t size() const noexcept { return grid_.size(); }
    bool empty() const noexcept { return grid_.empty(); }
    iterator begin() noexcept { return grid_.begin(); }
    iterator end() noexcept { return grid_.end(); }
    const_iterator begin() const noexcept { return grid_.begin(); }
    const_iterator end() const noexcept { return grid_.end(); }

    bool contains(Coord coord) const noexcept { return grid_.contains(coord); }
    const Cell *find(Coord coord) const noexcept { return grid_.find(coord); }
    Cell *find(Coord coord) noexcept { return grid_.find(coord); }
    const Cell &at(Coord coord) const { return grid_.at(coord); }
    Cell &at(Coord coord) { return grid_.at(coord); }

    Cell &set(Coord coord, const Cell &cell);
    void erase(Coord coord);
    Cell &merge(Coord start, Coord end, const ContentAppender &appender = {});
    Cell &expand(Coord coord, int width = 0, int height = 0, const ContentAppender &appender = {});

    // Inserts a 1x1 placeholder at every uncovered position of box, row by
    // row. The nature defaults to the table nature.
    void fill_missing(const Box &box, const CellContent &content, const StyleMap &styles = {},
                      std::optional<std::string> nature = std::nullopt);
    // Same on the current bounding box; does nothing on an empty table.
    void fill_missing(const CellContent &content, const StyleMap &styles = {},
                      std::optional<std::string> nature = std::nullopt);

    // Row/column views, 1-based. Addressing past the current list creates
    // empty views with the table nature. Throws InvalidArgument when pos < 1.
    RowView &row(int pos);
    ColView &col(int pos);

    std::size_t row_count() const noexcept { return rows_.size(); }
    std::size_t col_count() const noexcept { return cols_.size(); }
    row_iterator rows_begin() const noexcept { return row_iterator(rows_.cbegin()); }
    row_iterator rows_end() const noexcept { return row_iterator(rows_.cend()); }
    col_iterator cols_begin() const noexcept { return col_iterator(cols_.cbegin()); }
    col_iterator cols_end() const noexcept { return col_iterator(cols_.cend()); }
    std::vector<const RowView *> rows() const;
    std::vector<const ColView *> cols() const;

    // Always true between public calls: every mutation refreshes the views
    // before it returns, so rows(), cols() and the view iterators are current.
    bool is_fresh() const noexcept { return fresh_; }
    // Rebuilds the views when invalidated.
    void ensure_fresh();
    // Fits both view lists to the bounding box, clears them and adopts
    // every cell again. View styles and natures are kept.
    void refresh_all();

    std::string to_string() const { return grid_.to_string(); }

private:
    void invalidate() noexcept { fresh_ = false; }
    void adopt_cell(Cell &cell);
    void readopt_all();
    void rebind_views() noexcept;
    template <typename View>
    void grow_views(ViewList<View> &views, std::size_t size);
    template <typename View>
    void copy_views(ViewList<View> &views, const ViewList<View> &source);

    Grid grid_;
    ViewList<RowView> rows_;
    ViewList<ColView> cols_;
    bool fresh_ = true;
};

} // namespace tabula
