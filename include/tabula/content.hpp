#pragma once

#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace tabula
{

enum class NodeKind
{
    Element,
    Text,
    Comment,
    ProcessingInstruction
};

// Minimal markup tree used as cell content by format adapters.
struct MarkupNode
{
    NodeKind kind = NodeKind::Element;
    std::string name;                              // element tag or PI target
    std::map<std::string, std::string> attributes; // elements only
    std::string text;                              // character data of text, comment and PI nodes
    std::vector<MarkupNode> children;

    static MarkupNode element(std::string name, std::vector<MarkupNode> children = {},
                              std::map<std::string, std::string> attributes = {});
    static MarkupNode text_node(std::string text);
    static MarkupNode comment(std::string text);
    static MarkupNode processing_instruction(std::string target, std::string data);

    // Concatenated text of the node and its descendants, comments and
    // processing instructions excluded.
    std::string string_value() const;

    bool operator==(const MarkupNode &other) const = default;
};

using NodeList = std::vector<MarkupNode>;

enum class ContentType
{
    Empty,
    Text,
    Node,
    NodeList
};

class CellContent
{
public:
    CellContent() = default;
    CellContent(std::string text);
    CellContent(const char *text);
    CellContent(MarkupNode node);
    CellContent(NodeList nodes);

    ContentType type() const noexcept;
    bool is_empty() const noexcept { return type() == ContentType::Empty; }

    const std::string *text_if() const noexcept { return std::get_if<std::string>(&value_); }
    const MarkupNode *node_if() const noexcept { return std::get_if<MarkupNode>(&value_); }
    const NodeList *nodes_if() const noexcept { return std::get_if<NodeList>(&value_); }

    // Readable text of the content, used for drawing and debugging.
    std::string to_text() const;

    // Content as a list of nodes: text becomes a single text node,
    // empty content an empty list.
    NodeList to_nodes() const;

    bool operator==(const CellContent &other) const = default;

private:
    std::variant<std::monostate, std::string, MarkupNode, NodeList> value_;
};

// Combines the content of two merged cells, left operand first.
using ContentAppender = std::function<CellContent(const CellContent &, const CellContent &)>;

// Default combiner: empty is neutral, text + text concatenates, anything
// else is concatenated as node lists.
CellContent append_content(const CellContent &first, const CellContent &second);

// Combiner joining two non-empty text contents with a separator.
ContentAppender joining_appender(std::string separator);

} // namespace tabula
