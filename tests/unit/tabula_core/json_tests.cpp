#include "tabula/error.hpp"
#include "tabula/json.hpp"

#include <gtest/gtest.h>

using nlohmann::json;
using tabula::Box;
using tabula::CellContent;
using tabula::Coord;
using tabula::Size;

TEST(JsonTests, ReadsCoordinatesInBothForms)
{
    EXPECT_EQ(json("E6").get<Coord>(), Coord(5, 6));
    EXPECT_EQ(json::array({5, 6}).get<Coord>(), Coord(5, 6));
    EXPECT_EQ(json(Coord(28, 3)), json("AB3"));
    EXPECT_THROW(json("6E").get<Coord>(), tabula::Error);
}

TEST(JsonTests, ReadsSizesAndBoxes)
{
    EXPECT_EQ(json::array({2, 3}).get<Size>(), Size(2, 3));
    EXPECT_EQ(json("A2:B3").get<Box>(), Box::from_bounds(1, 2, 2, 3));
    EXPECT_EQ(json("C4").get<Box>(), Box::unit_at(3, 4));
    EXPECT_EQ(json(Box::from_bounds(1, 2, 2, 3)), json("A2:B3"));
    EXPECT_THROW(json("B3:A2").get<Box>(), tabula::Error);
}

TEST(JsonTests, ReadsContentShapes)
{
    EXPECT_TRUE(json(nullptr).get<CellContent>().is_empty());
    EXPECT_EQ(json("text").get<CellContent>(), CellContent("text"));

    auto node = json::parse(R"({"tag": "p", "attrs": {"class": "note"}, "children": ["a", {"tag": "b", "children": ["c"]}]})")
                    .get<CellContent>();
    ASSERT_EQ(node.type(), tabula::ContentType::Node);
    EXPECT_EQ(node.node_if()->name, "p");
    EXPECT_EQ(node.node_if()->attributes.at("class"), "note");
    EXPECT_EQ(node.to_text(), "ac");

    auto list = json::parse(R"(["x", {"comment": "skip"}, {"pi": "tab", "data": "1"}])").get<CellContent>();
    ASSERT_EQ(list.type(), tabula::ContentType::NodeList);
    EXPECT_EQ(list.nodes_if()->size(), 3u);
    EXPECT_EQ(list.to_text(), "x");
}

TEST(JsonTests, ReadsCellsWithDefaults)
{
    tabula::Cell cell = tabula::cell_from_json(json::parse(R"({"content": "red", "at": "B2", "height": 2})"));
    EXPECT_EQ(cell.box(), Box::from_bounds(2, 2, 2, 3));
    EXPECT_EQ(cell.nature(), "body");
    EXPECT_TRUE(cell.styles().empty());

    tabula::Cell placed = tabula::cell_from_json(
        json::parse(R"({"x": 3, "y": 1, "width": 2, "styles": {"align": "left", "span": 2}, "nature": "header"})"));
    EXPECT_EQ(placed.box(), Box::from_bounds(3, 1, 4, 1));
    EXPECT_TRUE(placed.content().is_empty());
    EXPECT_EQ(placed.styles().at("align"), "left");
    EXPECT_EQ(placed.styles().at("span"), "2");
    EXPECT_EQ(placed.nature(), "header");
}

TEST(JsonTests, ReadsTableWithViewMetadata)
{
    auto table = tabula::table_from_json(json::parse(R"({
        "nature": "body",
        "styles": {"frame": "all"},
        "cells": [
            {"content": "Name", "at": "A1", "nature": "header"},
            {"content": "Value", "at": "B1", "nature": "header"},
            {"content": "x", "at": "A2"}
        ],
        "rows": [{"pos": 1, "nature": "header", "styles": {"height": "1em"}}],
        "cols": [{"pos": 2, "styles": {"width": "30mm"}}]
    })"));

    EXPECT_EQ(table.size(), 3u);
    EXPECT_EQ(table.styles().at("frame"), "all");
    EXPECT_EQ(table.row(1).nature(), "header");
    EXPECT_EQ(table.row(1).styles().at("height"), "1em");
    EXPECT_EQ(table.row(2).nature(), "body");
    EXPECT_EQ(table.col(2).styles().at("width"), "30mm");
    EXPECT_EQ(table.row(1).owned_cells().size(), 2u);
}

TEST(JsonTests, TableRoundTripKeepsCellsAndViews)
{
    tabula::Table table({tabula::Cell("a", {{"k", "v"}}, tabula::kBodyNature, Coord(1, 1), Size(2, 1)),
                         tabula::Cell(CellContent(), {}, tabula::kFooterNature, Coord(1, 2))});
    table.row(2).set_nature(tabula::kFooterNature);

    json written = table;
    EXPECT_EQ(written.at("cells").size(), 2u);
    EXPECT_EQ(written.at("cells").at(0).at("width"), 2);
    EXPECT_TRUE(written.at("cells").at(1).at("content").is_null());

    tabula::Table read = tabula::table_from_json(json::parse(written.dump()));
    EXPECT_EQ(read.size(), 2u);
    EXPECT_EQ(read.at(Coord(2, 1)).text(), "a");
    EXPECT_EQ(read.at(Coord(2, 1)).styles().at("k"), "v");
    EXPECT_EQ(read.at(Coord(1, 2)).nature(), "footer");
    EXPECT_EQ(read.row(2).nature(), "footer");
}

TEST(JsonTests, OverlappingCellsFailWithCollision)
{
    try
    {
        tabula::table_from_json(json::parse(R"({"cells": [{"at": "A1", "width": 2}, {"at": "B1"}]})"));
        FAIL() << "overlap accepted";
    }
    catch (const tabula::Error &error)
    {
        EXPECT_EQ(error.kind(), tabula::ErrorKind::Collision);
    }
}
