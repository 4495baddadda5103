#include "tabula/json.hpp"

#include "tabula/error.hpp"

#include <utility>
#include <vector>

namespace tabula
{
namespace
{
StyleMap styles_from_json(const nlohmann::json &j, const char *key)
{
    StyleMap styles;
    if (!j.contains(key) || j.at(key).is_null())
        return styles;
    for (const auto &item : j.at(key).items())
    {
        if (item.value().is_string())
            styles[item.key()] = item.value().get<std::string>();
        else
            styles[item.key()] = item.value().dump();
    }
    return styles;
}

template <typename View>
nlohmann::json view_to_json(const View &view)
{
    return nlohmann::json{{"pos", view.pos()}, {"nature", view.nature()}, {"styles", view.styles()}};
}

template <typename View>
void view_from_json(const nlohmann::json &j, View &view)
{
    if (j.contains("nature"))
        view.set_nature(j.at("nature").get<std::string>());
    if (j.contains("styles"))
        view.set_styles(styles_from_json(j, "styles"));
}
} // namespace

void to_json(nlohmann::json &j, const Coord &coord)
{
    j = coord.to_string();
}

void from_json(const nlohmann::json &j, Coord &coord)
{
    if (j.is_string())
    {
        coord = Coord::parse(j.get<std::string>());
        return;
    }
    coord = Coord(j.at(0).get<int>(), j.at(1).get<int>());
}

void to_json(nlohmann::json &j, const Size &size)
{
    j = nlohmann::json::array({size.width, size.height});
}

void from_json(const nlohmann::json &j, Size &size)
{
    if (j.is_object())
    {
        size = Size(j.value("width", 1), j.value("height", 1));
        return;
    }
    size = Size(j.at(0).get<int>(), j.at(1).get<int>());
}

void to_json(nlohmann::json &j, const Box &box)
{
    j = box.to_string();
}

void from_json(const nlohmann::json &j, Box &box)
{
    if (j.is_object())
    {
        box = Box::from_corners(j.at("min").get<Coord>(), j.at("max").get<Coord>());
        return;
    }
    const std::string text = j.get<std::string>();
    const auto colon = text.find(':');
    if (colon == std::string::npos)
    {
        box = Box::unit_at(Coord::parse(text));
        return;
    }
    box = Box::from_corners(Coord::parse(text.substr(0, colon)), Coord::parse(text.substr(colon + 1)));
}

void to_json(nlohmann::json &j, const MarkupNode &node)
{
    switch (node.kind)
    {
    case NodeKind::Text:
        j = node.text;
        return;
    case NodeKind::Comment:
        j = nlohmann::json{{"comment", node.text}};
        return;
    case NodeKind::ProcessingInstruction:
        j = nlohmann::json{{"pi", node.name}, {"data", node.text}};
        return;
    case NodeKind::Element:
        break;
    }
    j = nlohmann::json{{"tag", node.name}};
    if (!node.attributes.empty())
        j["attrs"] = node.attributes;
    if (!node.children.empty())
        j["children"] = node.children;
}

void from_json(const nlohmann::json &j, MarkupNode &node)
{
    if (j.is_string())
    {
        node = MarkupNode::text_node(j.get<std::string>());
        return;
    }
    if (j.contains("comment"))
    {
        node = MarkupNode::comment(j.at("comment").get<std::string>());
        return;
    }
    if (j.contains("pi"))
    {
        node = MarkupNode::processing_instruction(j.at("pi").get<std::string>(), j.value("data", std::string()));
        return;
    }
    node = MarkupNode::element(j.at("tag").get<std::string>());
    node.attributes = styles_from_json(j, "attrs");
    if (j.contains("children"))
        node.children = j.at("children").get<std::vector<MarkupNode>>();
}

void to_json(nlohmann::json &j, const CellContent &content)
{
    switch (content.type())
    {
    case ContentType::Empty:
        j = nullptr;
        break;
    case ContentType::Text:
        j = *content.text_if();
        break;
    case ContentType::Node:
        j = *content.node_if();
        break;
    case ContentType::NodeList:
        j = *content.nodes_if();
        break;
    }
}

void from_json(const nlohmann::json &j, CellContent &content)
{
    if (j.is_null())
        content = CellContent();
    else if (j.is_string())
        content = CellContent(j.get<std::string>());
    else if (j.is_array())
        content = CellContent(j.get<NodeList>());
    else if (j.is_object())
        content = CellContent(j.get<MarkupNode>());
    else
        content = CellContent(j.dump());
}

void to_json(nlohmann::json &j, const Cell &cell)
{
    j = nlohmann::json{{"content", cell.content()},
                       {"x", cell.min().x},
                       {"y", cell.min().y},
                       {"width", cell.width()},
                       {"height", cell.height()},
                       {"styles", cell.styles()},
                       {"nature", cell.nature()}};
}

Cell cell_from_json(const nlohmann::json &j, const std::string &default_nature)
{
    Coord min = j.contains("at") ? j.at("at").get<Coord>() : Coord(j.value("x", 1), j.value("y", 1));
    Size size(j.value("width", 1), j.value("height", 1));
    CellContent content = j.contains("content") ? j.at("content").get<CellContent>() : CellContent();
    return Cell(std::move(content), styles_from_json(j, "styles"), j.value("nature", default_nature), min, size);
}

void to_json(nlohmann::json &j, const Table &table)
{
    nlohmann::json cells = nlohmann::json::array();
    for (const auto &cell : table)
        cells.push_back(nlohmann::json(cell));

    nlohmann::json rows = nlohmann::json::array();
    for (const RowView *view : table.rows())
        rows.push_back(view_to_json(*view));

    nlohmann::json cols = nlohmann::json::array();
    for (const ColView *view : table.cols())
        cols.push_back(view_to_json(*view));

    j = nlohmann::json{{"styles", table.styles()},
                       {"nature", table.nature()},
                       {"cells", std::move(cells)},
                       {"rows", std::move(rows)},
                       {"cols", std::move(cols)}};
}

Table table_from_json(const nlohmann::json &j)
{
    const std::string nature = j.value("nature", std::string(kBodyNature));

    std::vector<Cell> cells;
    if (j.contains("cells"))
    {
        for (const auto &item : j.at("cells"))
            cells.push_back(cell_from_json(item));
    }

    Table table(cells, styles_from_json(j, "styles"), nature);
    if (j.contains("rows"))
    {
        for (const auto &item : j.at("rows"))
            view_from_json(item, table.row(item.at("pos").get<int>()));
    }
    if (j.contains("cols"))
    {
        for (const auto &item : j.at("cols"))
            view_from_json(item, table.col(item.at("pos").get<int>()));
    }
    return table;
}

} // namespace tabula
