#include "tabula/coord.hpp"
#include "tabula/error.hpp"
#include "tabula/size.hpp"

#include <gtest/gtest.h>

using tabula::Coord;
using tabula::Size;

TEST(CoordTests, FormatsAsSpreadsheetReference)
{
    EXPECT_EQ(Coord(5, 6).to_string(), "E6");
    EXPECT_EQ(Coord(27, 1).to_string(), "AA1");
    EXPECT_EQ(Coord().to_string(), "A1");
}

TEST(CoordTests, ParseRecoversCoordinates)
{
    for (int y = 1; y <= 30; ++y)
    {
        for (int x = 1; x <= 60; ++x)
        {
            Coord coord(x, y);
            ASSERT_EQ(Coord::parse(coord.to_string()), coord) << coord.to_string();
        }
    }
}

TEST(CoordTests, ParseRejectsMalformedText)
{
    for (const char *text : {"", "E", "6", "E0", "e6", "E6x", "E-6", "6E"})
        EXPECT_THROW(Coord::parse(text), tabula::Error) << text;
}

TEST(CoordTests, OrdersRowFirst)
{
    EXPECT_LT(Coord(5, 1), Coord(1, 2));
    EXPECT_LT(Coord(1, 2), Coord(2, 2));
    EXPECT_EQ(Coord(3, 4), Coord(3, 4));
}

TEST(CoordTests, MovesBySize)
{
    EXPECT_EQ(Coord(2, 3) + Size(1, 2), Coord(3, 5));
    EXPECT_EQ(Coord(2, 3) - Size(1, 1), Coord(1, 2));
}

TEST(SizeTests, Arithmetic)
{
    EXPECT_EQ(Size(2, 3) + Size(1, 1), Size(3, 4));
    EXPECT_EQ(Size(2, 3) - Size(1, 1), Size(1, 2));
    EXPECT_EQ(Size(2, 3) * 2, Size(4, 6));
    EXPECT_EQ(-Size(2, 3), Size(-2, -3));
    EXPECT_EQ(+Size(2, 3), Size(2, 3));
    EXPECT_EQ(Size(2, 1).to_string(), "(2 x 1)");
}
