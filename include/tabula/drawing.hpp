#pragma once

#include <functional>
#include <string>

namespace tabula
{

class Grid;

// Characters used to draw cell borders. Each column is drawn
// label_width + 3 characters wide.
struct TileSet
{
    std::string corner = "+";
    std::string horizontal = "-";
    std::string vertical = "|";
    int label_width = 9;
};

// Emits the drawing of the grid one line at a time, top to bottom. A cell
// label is centered in the middle tile of its box and clipped to
// label_width characters, counted as UTF-8 code points. Uncovered
// positions are drawn as empty unit cells.
// Nothing is emitted for an empty grid.
void draw(const Grid &grid, const std::function<void(const std::string &)> &on_line, const TileSet &tiles = {});

// Lines of the drawing joined by '\n', without a trailing newline.
std::string draw(const Grid &grid, const TileSet &tiles = {});

} // namespace tabula
