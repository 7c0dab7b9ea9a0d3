#include <ast/transformer.hpp>
#include <type_traits>

namespace Polydoc {

namespace {
template <typename> inline constexpr bool always_false = false;
} // namespace

Document NodeTransformer::transform(Document doc) {
    doc.children = transform_list(std::move(doc.children));
    return doc;
}

NodeList NodeTransformer::transform_list(NodeList nodes) {
    NodeList out;
    out.reserve(nodes.size());
    for (auto& n : nodes) {
        if (auto replaced = transform_node(std::move(n)))
            out.push_back(std::move(*replaced));
    }
    return out;
}

std::optional<Node> NodeTransformer::transform_node(Node node) {
    return std::visit([this](auto&& v) -> std::optional<Node> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Heading>)                 return visit_heading(std::move(v));
        else if constexpr (std::is_same_v<T, Paragraph>)          return visit_paragraph(std::move(v));
        else if constexpr (std::is_same_v<T, CodeBlock>)          return visit_code_block(std::move(v));
        else if constexpr (std::is_same_v<T, BlockQuote>)         return visit_block_quote(std::move(v));
        else if constexpr (std::is_same_v<T, List>)               return visit_list(std::move(v));
        else if constexpr (std::is_same_v<T, Table>)              return visit_table(std::move(v));
        else if constexpr (std::is_same_v<T, ThematicBreak>)      return visit_thematic_break(std::move(v));
        else if constexpr (std::is_same_v<T, HTMLBlock>)          return visit_html_block(std::move(v));
        else if constexpr (std::is_same_v<T, MathBlock>)          return visit_math_block(std::move(v));
        else if constexpr (std::is_same_v<T, DefinitionList>)     return visit_definition_list(std::move(v));
        else if constexpr (std::is_same_v<T, FootnoteDefinition>) return visit_footnote_definition(std::move(v));
        else if constexpr (std::is_same_v<T, Text>)               return visit_text(std::move(v));
        else if constexpr (std::is_same_v<T, Emphasis>)           return visit_emphasis(std::move(v));
        else if constexpr (std::is_same_v<T, Strong>)             return visit_strong(std::move(v));
        else if constexpr (std::is_same_v<T, Code>)               return visit_code(std::move(v));
        else if constexpr (std::is_same_v<T, Link>)               return visit_link(std::move(v));
        else if constexpr (std::is_same_v<T, Image>)              return visit_image(std::move(v));
        else if constexpr (std::is_same_v<T, LineBreak>)          return visit_line_break(std::move(v));
        else if constexpr (std::is_same_v<T, Strikethrough>)      return visit_strikethrough(std::move(v));
        else if constexpr (std::is_same_v<T, Underline>)          return visit_underline(std::move(v));
        else if constexpr (std::is_same_v<T, Superscript>)        return visit_superscript(std::move(v));
        else if constexpr (std::is_same_v<T, Subscript>)          return visit_subscript(std::move(v));
        else if constexpr (std::is_same_v<T, HTMLInline>)         return visit_html_inline(std::move(v));
        else if constexpr (std::is_same_v<T, MathInline>)         return visit_math_inline(std::move(v));
        else if constexpr (std::is_same_v<T, FootnoteReference>)  return visit_footnote_reference(std::move(v));
        else static_assert(always_false<T>, "unhandled node type");
    }, std::move(node.value));
}

// =============================================================================
//  Default hooks: rebuild with transformed children
// =============================================================================

std::optional<Node> NodeTransformer::visit_heading(Heading node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_paragraph(Paragraph node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_code_block(CodeBlock node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_block_quote(BlockQuote node) {
    node.children = transform_list(std::move(node.children));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_list(List node) {
    std::vector<ListItem> items;
    items.reserve(node.items.size());
    for (auto& item : node.items) {
        if (auto replaced = visit_list_item(std::move(item)))
            items.push_back(std::move(*replaced));
    }
    node.items = std::move(items);
    return Node(std::move(node));
}

std::optional<ListItem> NodeTransformer::visit_list_item(ListItem node) {
    node.children = transform_list(std::move(node.children));
    return node;
}

std::optional<Node> NodeTransformer::visit_table(Table node) {
    if (node.header) {
        node.header = visit_table_row(std::move(*node.header));
    }
    std::vector<TableRow> rows;
    rows.reserve(node.rows.size());
    for (auto& row : node.rows) {
        if (auto replaced = visit_table_row(std::move(row)))
            rows.push_back(std::move(*replaced));
    }
    node.rows = std::move(rows);
    return Node(std::move(node));
}

std::optional<TableRow> NodeTransformer::visit_table_row(TableRow node) {
    std::vector<TableCell> cells;
    cells.reserve(node.cells.size());
    for (auto& cell : node.cells) {
        if (auto replaced = visit_table_cell(std::move(cell)))
            cells.push_back(std::move(*replaced));
    }
    node.cells = std::move(cells);
    return node;
}

std::optional<TableCell> NodeTransformer::visit_table_cell(TableCell node) {
    node.content = transform_list(std::move(node.content));
    return node;
}

std::optional<Node> NodeTransformer::visit_thematic_break(ThematicBreak node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_html_block(HTMLBlock node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_math_block(MathBlock node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_definition_list(DefinitionList node) {
    for (auto& item : node.items) {
        item.term.content = transform_list(std::move(item.term.content));
        for (auto& desc : item.descriptions)
            desc.content = transform_list(std::move(desc.content));
    }
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_footnote_definition(FootnoteDefinition node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_text(Text node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_emphasis(Emphasis node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_strong(Strong node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_code(Code node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_link(Link node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_image(Image node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_line_break(LineBreak node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_strikethrough(Strikethrough node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_underline(Underline node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_superscript(Superscript node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_subscript(Subscript node) {
    node.content = transform_list(std::move(node.content));
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_html_inline(HTMLInline node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_math_inline(MathInline node) {
    return Node(std::move(node));
}

std::optional<Node> NodeTransformer::visit_footnote_reference(FootnoteReference node) {
    return Node(std::move(node));
}

} // namespace Polydoc
