#pragma once

#include "tabula/box.hpp"
#include "tabula/cell.hpp"
#include "tabula/content.hpp"
#include "tabula/coord.hpp"
#include "tabula/size.hpp"
#include "tabula/table.hpp"

#include <nlohmann/json.hpp>

#include <string>

// JSON description of tables:
//   coord    "B2" or [x, y]
//   size     [width, height]
//   box      "A2:B3", "A2" or {"min": coord, "max": coord}
//   content  null, "text", node object, or an array of nodes/strings
//   node     {"tag": ..., "attrs": {...}, "children": [...]}, {"comment": ...},
//            {"pi": target, "data": ...}; a string is a text node
//   cell     {"content", "x", "y" | "at", "width", "height", "styles", "nature"}
//   table    {"styles", "nature", "cells": [...], "rows": [...], "cols": [...]}
//            with row/col entries {"pos", "nature", "styles"}
namespace tabula
{

void to_json(nlohmann::json &j, const Coord &coord);
void from_json(const nlohmann::json &j, Coord &coord);

void to_json(nlohmann::json &j, const Size &size);
void from_json(const nlohmann::json &j, Size &size);

void to_json(nlohmann::json &j, const Box &box);
void from_json(const nlohmann::json &j, Box &box);

void to_json(nlohmann::json &j, const MarkupNode &node);
void from_json(const nlohmann::json &j, MarkupNode &node);

void to_json(nlohmann::json &j, const CellContent &content);
void from_json(const nlohmann::json &j, CellContent &content);

void to_json(nlohmann::json &j, const Cell &cell);
// Cells are not assignable, so they are read by value. default_nature is
// used when the object has no "nature" key.
Cell cell_from_json(const nlohmann::json &j, const std::string &default_nature = kBodyNature);

void to_json(nlohmann::json &j, const Table &table);
// Throws tabula::Error (Collision, InvalidBounds...) or nlohmann::json::exception.
Table table_from_json(const nlohmann::json &j);

} // namespace tabula
