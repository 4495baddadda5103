#include "tabula/table.hpp"

#include "tabula/error.hpp"

#include <algorithm>
#include <utility>

namespace tabula
{
namespace
{
void insert_ordered(std::vector<Cell *> &cells, Cell &cell)
{
    auto it = std::upper_bound(cells.begin(), cells.end(), &cell,
                               [](const Cell *value, const Cell *item) { return value->box() < item->box(); });
    cells.insert(it, &cell);
}

template <typename View>
void shrink_views(std::vector<std::unique_ptr<View>> &views, std::size_t size)
{
    if (views.size() > size)
        views.erase(views.begin() + static_cast<std::ptrdiff_t>(size), views.end());
}
} // namespace

// ---------- TableView ----------

TableView::TableView(Table &table, int pos, std::string nature)
    : Styled({}, std::move(nature)), table_(&table), pos_(pos)
{
}

Cell &TableView::insert_cell(CellContent content, StyleMap styles, std::optional<std::string> nature, int width,
                             int height)
{
    const Coord coord = slot_coord(next_free_slot());
    Cell cell(std::move(content), std::move(styles), nature ? std::move(*nature) : this->nature(), coord,
              Size(width, height));
    return table_->set(coord, cell);
}

int TableView::next_free_slot() const
{
    if (caught_.empty())
        return 1;

    int last = 0;
    for (const Cell *cell : caught_)
        last = std::max(last, axis_of(cell->max()));

    for (int slot = 1; slot <= last; ++slot)
    {
        const Coord coord = slot_coord(slot);
        bool covered = std::any_of(caught_.begin(), caught_.end(),
                                   [&](const Cell *cell) { return cell->contains(coord); });
        if (!covered)
            return slot;
    }
    return last + 1;
}

void TableView::adopt(Cell &cell)
{
    if (can_own(cell))
        insert_ordered(owned_, cell);
    if (can_catch(cell))
        insert_ordered(caught_, cell);
}

void TableView::clear() noexcept
{
    owned_.clear();
    caught_.clear();
}

RowView::RowView(Table &table, int pos, std::string nature)
    : TableView(table, pos, std::move(nature))
{
}

bool RowView::can_own(const Cell &cell) const noexcept
{
    return cell.min().y == pos();
}

bool RowView::can_catch(const Cell &cell) const noexcept
{
    return cell.min().y <= pos() && pos() <= cell.max().y;
}

ColView::ColView(Table &table, int pos, std::string nature)
    : TableView(table, pos, std::move(nature))
{
}

bool ColView::can_own(const Cell &cell) const noexcept
{
    return cell.min().x == pos();
}

bool ColView::can_catch(const Cell &cell) const noexcept
{
    return cell.min().x <= pos() && pos() <= cell.max().x;
}

// ---------- Table ----------

Table::Table(const std::vector<Cell> &cells, StyleMap styles, std::string nature)
    : Styled(std::move(styles), std::move(nature)), grid_(cells)
{
    refresh_all();
}

Table::Table(const Table &other)
    : Styled(other), grid_(other.grid_), fresh_(other.fresh_)
{
    copy_views(rows_, other.rows_);
    copy_views(cols_, other.cols_);
    readopt_all();
}

Table &Table::operator=(const Table &other)
{
    if (this != &other)
    {
        Table copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Table::Table(Table &&other) noexcept
    : Styled(std::move(other)), grid_(std::move(other.grid_)), rows_(std::move(other.rows_)),
      cols_(std::move(other.cols_)), fresh_(other.fresh_)
{
    rebind_views();
}

Table &Table::operator=(Table &&other) noexcept
{
    if (this != &other)
    {
        Styled::operator=(std::move(other));
        grid_ = std::move(other.grid_);
        rows_ = std::move(other.rows_);
        cols_ = std::move(other.cols_);
        fresh_ = other.fresh_;
        rebind_views();
    }
    return *this;
}

Cell &Table::set(Coord coord, const Cell &cell)
{
    Cell &placed = grid_.set(coord, cell);
    if (fresh_)
        adopt_cell(placed);
    return placed;
}

void Table::erase(Coord coord)
{
    grid_.erase(coord);
    invalidate();
    ensure_fresh();
}

Cell &Table::merge(Coord start, Coord end, const ContentAppender &appender)
{
    Cell &merged = grid_.merge(start, end, appender);
    invalidate();
    ensure_fresh();
    return merged;
}

Cell &Table::expand(Coord coord, int width, int height, const ContentAppender &appender)
{
    Cell &expanded = grid_.expand(coord, width, height, appender);
    invalidate();
    ensure_fresh();
    return expanded;
}

void Table::fill_missing(const Box &box, const CellContent &content, const StyleMap &styles,
                         std::optional<std::string> nature)
{
    const std::string cell_nature = nature ? std::move(*nature) : this->nature();
    for (int y = box.min().y; y <= box.max().y; ++y)
    {
        for (int x = box.min().x; x <= box.max().x; ++x)
        {
            const Coord coord(x, y);
            if (!grid_.contains(coord))
                set(coord, Cell(content, styles, cell_nature));
        }
    }
}

void Table::fill_missing(const CellContent &content, const StyleMap &styles, std::optional<std::string> nature)
{
    if (auto bounds = bounding_box())
        fill_missing(*bounds, content, styles, std::move(nature));
}

RowView &Table::row(int pos)
{
    if (pos < 1)
        throw Error(ErrorKind::InvalidArgument, "row position " + std::to_string(pos));
    ensure_fresh();
    grow_views(rows_, static_cast<std::size_t>(pos));
    return *rows_[static_cast<std::size_t>(pos - 1)];
}

ColView &Table::col(int pos)
{
    if (pos < 1)
        throw Error(ErrorKind::InvalidArgument, "column position " + std::to_string(pos));
    ensure_fresh();
    grow_views(cols_, static_cast<std::size_t>(pos));
    return *cols_[static_cast<std::size_t>(pos - 1)];
}

std::vector<const RowView *> Table::rows() const
{
    std::vector<const RowView *> result;
    result.reserve(rows_.size());
    for (const auto &view : rows_)
        result.push_back(view.get());
    return result;
}

std::vector<const ColView *> Table::cols() const
{
    std::vector<const ColView *> result;
    result.reserve(cols_.size());
    for (const auto &view : cols_)
        result.push_back(view.get());
    return result;
}

void Table::ensure_fresh()
{
    if (!fresh_)
        refresh_all();
}

void Table::refresh_all()
{
    auto bounds = grid_.bounding_box();
    const std::size_t height = bounds ? static_cast<std::size_t>(bounds->max().y) : 0;
    const std::size_t width = bounds ? static_cast<std::size_t>(bounds->max().x) : 0;

    shrink_views(rows_, height);
    shrink_views(cols_, width);
    grow_views(rows_, height);
    grow_views(cols_, width);
    readopt_all();
    fresh_ = true;
}

void Table::adopt_cell(Cell &cell)
{
    grow_views(rows_, static_cast<std::size_t>(cell.max().y));
    grow_views(cols_, static_cast<std::size_t>(cell.max().x));
    for (int y = cell.min().y; y <= cell.max().y; ++y)
        rows_[static_cast<std::size_t>(y - 1)]->adopt(cell);
    for (int x = cell.min().x; x <= cell.max().x; ++x)
        cols_[static_cast<std::size_t>(x - 1)]->adopt(cell);
}

void Table::readopt_all()
{
    for (auto &view : rows_)
        view->clear();
    for (auto &view : cols_)
        view->clear();
    for (auto &cell : grid_)
        adopt_cell(cell);
}

void Table::rebind_views() noexcept
{
    for (auto &view : rows_)
        view->table_ = this;
    for (auto &view : cols_)
        view->table_ = this;
}

template <typename View>
void Table::grow_views(ViewList<View> &views, std::size_t size)
{
    while (views.size() < size)
        views.push_back(std::make_unique<View>(*this, static_cast<int>(views.size() + 1), nature()));
}

template <typename View>
void Table::copy_views(ViewList<View> &views, const ViewList<View> &source)
{
    views.clear();
    for (const auto &view : source)
    {
        auto copy = std::make_unique<View>(*this, view->pos(), view->nature());
        copy->set_styles(view->styles());
        views.push_back(std::move(copy));
    }
}

} // namespace tabula
