#include "tabula/content.hpp"

#include <utility>

namespace tabula
{
namespace
{
void collect_text(const MarkupNode &node, std::string &out)
{
    switch (node.kind)
    {
    case NodeKind::Text:
        out += node.text;
        break;
    case NodeKind::Element:
        for (const auto &child : node.children)
            collect_text(child, out);
        break;
    case NodeKind::Comment:
    case NodeKind::ProcessingInstruction:
        break;
    }
}
} // namespace

MarkupNode MarkupNode::element(std::string name, std::vector<MarkupNode> children,
                               std::map<std::string, std::string> attributes)
{
    MarkupNode node;
    node.kind = NodeKind::Element;
    node.name = std::move(name);
    node.children = std::move(children);
    node.attributes = std::move(attributes);
    return node;
}

MarkupNode MarkupNode::text_node(std::string text)
{
    MarkupNode node;
    node.kind = NodeKind::Text;
    node.text = std::move(text);
    return node;
}

MarkupNode MarkupNode::comment(std::string text)
{
    MarkupNode node;
    node.kind = NodeKind::Comment;
    node.text = std::move(text);
    return node;
}

MarkupNode MarkupNode::processing_instruction(std::string target, std::string data)
{
    MarkupNode node;
    node.kind = NodeKind::ProcessingInstruction;
    node.name = std::move(target);
    node.text = std::move(data);
    return node;
}

std::string MarkupNode::string_value() const
{
    std::string out;
    collect_text(*this, out);
    return out;
}

CellContent::CellContent(std::string text)
    : value_(std::move(text))
{
}

CellContent::CellContent(const char *text)
    : value_(std::string(text ? text : ""))
{
}

CellContent::CellContent(MarkupNode node)
    : value_(std::move(node))
{
}

CellContent::CellContent(NodeList nodes)
    : value_(std::move(nodes))
{
}

ContentType CellContent::type() const noexcept
{
    switch (value_.index())
    {
    case 1:
        return ContentType::Text;
    case 2:
        return ContentType::Node;
    case 3:
        return ContentType::NodeList;
    default:
        return ContentType::Empty;
    }
}

std::string CellContent::to_text() const
{
    if (auto *text = text_if())
        return *text;
    if (auto *node = node_if())
        return node->string_value();
    std::string out;
    if (auto *nodes = nodes_if())
    {
        for (const auto &node : *nodes)
            collect_text(node, out);
    }
    return out;
}

NodeList CellContent::to_nodes() const
{
    if (auto *text = text_if())
        return {MarkupNode::text_node(*text)};
    if (auto *node = node_if())
        return {*node};
    if (auto *nodes = nodes_if())
        return *nodes;
    return {};
}

CellContent append_content(const CellContent &first, const CellContent &second)
{
    if (second.is_empty())
        return first;
    if (first.is_empty())
        return second;
    if (first.type() == ContentType::Text && second.type() == ContentType::Text)
        return CellContent(*first.text_if() + *second.text_if());

    NodeList nodes = first.to_nodes();
    NodeList tail = second.to_nodes();
    nodes.insert(nodes.end(), tail.begin(), tail.end());
    return CellContent(std::move(nodes));
}

ContentAppender joining_appender(std::string separator)
{
    return [separator = std::move(separator)](const CellContent &first, const CellContent &second) {
        if (first.type() == ContentType::Text && second.type() == ContentType::Text)
            return CellContent(*first.text_if() + separator + *second.text_if());
        return append_content(first, second);
    };
}

} // namespace tabula
