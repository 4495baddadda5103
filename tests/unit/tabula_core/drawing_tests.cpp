#include "tabula/drawing.hpp"
#include "tabula/grid.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

using tabula::Cell;
using tabula::Coord;
using tabula::Grid;
using tabula::Size;

namespace
{
Cell make_cell(const char *text, int x, int y, int width = 1, int height = 1)
{
    return Cell(text, {}, tabula::kBodyNature, Coord(x, y), Size(width, height));
}
} // namespace

TEST(DrawingTests, DrawsRowAndColumnSpans)
{
    Grid grid({make_cell("red", 1, 1, 1, 2), make_cell("pink", 2, 1, 2, 1), make_cell("blue", 2, 2)});
    const std::string expected = "+-----------+-----------------------+\n"
                                 "|    red    |   pink                |\n"
                                 "|           +-----------+-----------+\n"
                                 "|           |   blue    |           |\n"
                                 "+-----------+-----------+-----------+";
    EXPECT_EQ(tabula::draw(grid), expected);
    EXPECT_EQ(grid.to_string(), expected);
}

TEST(DrawingTests, ClipsLongLabels)
{
    Grid grid({make_cell("aaa", 1, 1, 2), make_cell("bb", 3, 1), make_cell("cc", 1, 2),
               make_cell("dddddddddd", 2, 2, 2)});
    EXPECT_EQ(tabula::draw(grid), "+-----------------------+-----------+\n"
                                  "|    aaa                |    bb     |\n"
                                  "+-----------+-----------------------+\n"
                                  "|    cc     | ddddddddd             |\n"
                                  "+-----------+-----------------------+");
}

TEST(DrawingTests, DrawsVerticalSpanAcrossRowBorders)
{
    Grid grid({make_cell("aa", 1, 1, 1, 2), make_cell("bbb", 2, 1, 2), make_cell("ccc", 2, 2, 1, 2),
               make_cell("dd", 3, 2), make_cell("eeee", 1, 3), make_cell("ffffff", 3, 3)});
    EXPECT_EQ(tabula::draw(grid), "+-----------+-----------------------+\n"
                                  "|    aa     |    bbb                |\n"
                                  "|           +-----------+-----------+\n"
                                  "|           |    ccc    |    dd     |\n"
                                  "+-----------|           +-----------+\n"
                                  "|   eeee    |           |  ffffff   |\n"
                                  "+-----------+-----------+-----------+");
}

TEST(DrawingTests, StreamsLinesAndUsesTileSet)
{
    Grid grid({make_cell("a", 1, 1), make_cell("bb", 2, 1)});
    tabula::TileSet tiles;
    tiles.corner = "*";
    tiles.label_width = 3;

    std::vector<std::string> lines;
    tabula::draw(grid, [&](const std::string &line) { lines.push_back(line); }, tiles);
    EXPECT_EQ(lines, (std::vector<std::string>{"*-----*-----*", "|  a  | bb  |", "*-----*-----*"}));
}

TEST(DrawingTests, ReplacesNewlinesInLabels)
{
    Grid grid({make_cell("a\nb", 1, 1)});
    EXPECT_EQ(tabula::draw(grid), "+-----------+\n"
                                  "|    a b    |\n"
                                  "+-----------+");
}

TEST(DrawingTests, EmptyGridDrawsNothing)
{
    int calls = 0;
    tabula::draw(Grid(), [&](const std::string &) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(DrawingTests, MeasuresLabelsInCharacters)
{
    Grid grid({make_cell("\xC3\xA9t\xC3\xA9", 1, 1), make_cell("ab", 2, 1),
               make_cell("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9", 1, 2), make_cell("cd", 2, 2)});
    EXPECT_EQ(tabula::draw(grid), "+-----------+-----------+\n"
                                  "|    \xC3\xA9t\xC3\xA9    |    ab     |\n"
                                  "+-----------+-----------+\n"
                                  "|   \xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9   |    cd     |\n"
                                  "+-----------+-----------+");
}

TEST(DrawingTests, ClipsOnCharacterBoundaries)
{
    std::string ten;
    for (int i = 0; i < 10; ++i)
        ten += "\xC3\xA9";
    Grid grid({Cell(ten, {}, tabula::kBodyNature, Coord(1, 1))});

    std::string nine = ten.substr(0, 18);
    EXPECT_EQ(tabula::draw(grid), "+-----------+\n"
                                  "| " + nine + " |\n"
                                  "+-----------+");
}
