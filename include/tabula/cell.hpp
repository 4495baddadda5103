#pragma once

#include "tabula/box.hpp"
#include "tabula/content.hpp"
#include "tabula/styled.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tabula
{

// Content holder of a grid cell. The box (position and span) is fixed at
// construction: moving or resizing produces a new Cell.
class Cell : public Styled
{
public:
    explicit Cell(CellContent content = {}, StyleMap styles = {}, std::string nature = kBodyNature,
                  Coord min = {1, 1}, Size size = {1, 1});

    Cell(const Cell &) = default;
    Cell(Cell &&) noexcept = default;
    // Not assignable: a cell held by a grid must keep its box.
    Cell &operator=(const Cell &) = delete;
    Cell &operator=(Cell &&) = delete;

    const CellContent &content() const noexcept { return content_; }
    CellContent &content() noexcept { return content_; }
    void set_content(CellContent content) { content_ = std::move(content); }

    const Box &box() const noexcept { return box_; }
    const Coord &min() const noexcept { return box_.min(); }
    const Coord &max() const noexcept { return box_.max(); }
    Size size() const noexcept { return box_.size(); }
    int width() const noexcept { return box_.width(); }
    int height() const noexcept { return box_.height(); }

    bool contains(Coord coord) const noexcept { return box_.contains(coord); }
    bool contains(const Box &box) const noexcept { return box_.contains(box); }

    Cell transform(std::optional<Coord> coord, std::optional<Size> size) const;
    Cell move_to(Coord coord) const { return transform(coord, std::nullopt); }
    Cell resize(Size size) const { return transform(std::nullopt, size); }

    // Text of the content.
    std::string text() const { return content_.to_text(); }
    // Debug form: <Cell('red', styles={}, nature='body', x=1, y=1, width=1, height=2)>
    std::string describe() const;

private:
    Cell(const Cell &source, const Box &box);

    CellContent content_;
    Box box_;
};

inline bool operator<(const Cell &a, const Cell &b) noexcept
{
    return a.box() < b.box();
}

} // namespace tabula
