#include "tabula/drawing.hpp"

#include "tabula/grid.hpp"

#include <algorithm>
#include <vector>

namespace tabula
{
namespace
{
std::string repeat(const std::string &pattern, int count)
{
    std::string out;
    for (int i = 0; i < count; ++i)
        out += pattern;
    return out;
}

bool is_continuation(char byte)
{
    return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}

// Number of UTF-8 code points; continuation bytes are not counted.
int display_length(const std::string &text)
{
    return static_cast<int>(std::count_if(text.begin(), text.end(), [](char byte) { return !is_continuation(byte); }));
}

// Longest prefix holding at most count code points, cut before a lead byte.
std::string clip(const std::string &text, int count)
{
    std::size_t end = 0;
    int seen = 0;
    while (end < text.size())
    {
        if (!is_continuation(text[end]) && seen++ == count)
            break;
        ++end;
    }
    return text.substr(0, end);
}

std::string center_label(std::string text, int width)
{
    std::replace(text.begin(), text.end(), '\n', ' ');
    const int length = display_length(text);
    if (length >= width)
        return clip(text, std::max(width, 0));
    int padding = width - length;
    int left = padding / 2;
    return std::string(static_cast<std::size_t>(left), ' ') + text +
           std::string(static_cast<std::size_t>(padding - left), ' ');
}

// One tile: the top line (border when the box starts on this row), the
// label line and, on the last row of the grid, the bottom border.
struct Tile
{
    std::vector<std::string> lines;
};

Tile make_tile(const TileSet &tiles, bool left, bool top, bool right, bool bottom, const std::string &label)
{
    const int inner = tiles.label_width + 2;
    const std::string border = repeat(tiles.horizontal, inner);
    const std::string blank(static_cast<std::size_t>(inner), ' ');

    Tile tile;
    if (top)
        tile.lines.push_back((left ? tiles.corner : tiles.horizontal) + border + (right ? tiles.corner : ""));
    else
        tile.lines.push_back((left ? tiles.vertical : " ") + blank + (right ? tiles.vertical : ""));
    tile.lines.push_back((left ? tiles.vertical : " ") + " " + label + " " + (right ? tiles.vertical : ""));
    if (bottom)
        tile.lines.push_back((left ? tiles.corner : tiles.horizontal) + border + (right ? tiles.corner : ""));
    return tile;
}
} // namespace

void draw(const Grid &grid, const std::function<void(const std::string &)> &on_line, const TileSet &tiles)
{
    auto bounds = grid.bounding_box();
    if (!bounds)
        return;

    for (int row = bounds->min().y; row <= bounds->max().y; ++row)
    {
        std::vector<Tile> line_tiles;
        for (int col = bounds->min().x; col <= bounds->max().x; ++col)
        {
            const Coord coord(col, row);
            const Cell *cell = grid.find(coord);
            const Box box = cell ? cell->box() : Box::unit_at(coord);

            const bool left = box.min().x == col;
            const bool top = box.min().y == row;
            const bool right = bounds->max().x == col;
            const bool bottom = bounds->max().y == row;

            std::string label(static_cast<std::size_t>(std::max(tiles.label_width, 0)), ' ');
            if (cell && (box.min().x + box.max().x) / 2 == col && (box.min().y + box.max().y) / 2 == row)
                label = center_label(cell->text(), tiles.label_width);

            line_tiles.push_back(make_tile(tiles, left, top, right, bottom, label));
        }

        const std::size_t height = line_tiles.front().lines.size();
        for (std::size_t index = 0; index < height; ++index)
        {
            std::string line;
            for (const auto &tile : line_tiles)
                line += tile.lines[index];
            on_line(line);
        }
    }
}

std::string draw(const Grid &grid, const TileSet &tiles)
{
    std::string out;
    draw(
        grid,
        [&](const std::string &line) {
            if (!out.empty())
                out += '\n';
            out += line;
        },
        tiles);
    return out;
}

} // namespace tabula
