#pragma once

/**
 * @file transformer.hpp
 * @brief Base class for AST-to-AST rewriting.
 *
 * Each hook receives a node by value and returns its replacement, or nullopt
 * to drop it. The defaults rebuild the node with transformed children, so a
 * subclass overriding visit_image() alone still reaches images nested in
 * links, tables and lists.
 */

#include <ast/nodes.hpp>
#include <export.hpp>
#include <optional>

namespace Polydoc {

class POLYDOC_API NodeTransformer {
public:
    virtual ~NodeTransformer() = default;

    /// Entry point used by the pipeline.
    virtual Document transform(Document doc);

    /// Dispatches to the matching visit_* hook.
    virtual std::optional<Node> transform_node(Node node);
    NodeList transform_list(NodeList nodes);

protected:
    // Block
    virtual std::optional<Node> visit_heading(Heading node);
    virtual std::optional<Node> visit_paragraph(Paragraph node);
    virtual std::optional<Node> visit_code_block(CodeBlock node);
    virtual std::optional<Node> visit_block_quote(BlockQuote node);
    virtual std::optional<Node> visit_list(List node);
    virtual std::optional<ListItem> visit_list_item(ListItem node);
    virtual std::optional<Node> visit_table(Table node);
    virtual std::optional<TableRow> visit_table_row(TableRow node);
    virtual std::optional<TableCell> visit_table_cell(TableCell node);
    virtual std::optional<Node> visit_thematic_break(ThematicBreak node);
    virtual std::optional<Node> visit_html_block(HTMLBlock node);
    virtual std::optional<Node> visit_math_block(MathBlock node);
    virtual std::optional<Node> visit_definition_list(DefinitionList node);
    virtual std::optional<Node> visit_footnote_definition(FootnoteDefinition node);

    // Inline
    virtual std::optional<Node> visit_text(Text node);
    virtual std::optional<Node> visit_emphasis(Emphasis node);
    virtual std::optional<Node> visit_strong(Strong node);
    virtual std::optional<Node> visit_code(Code node);
    virtual std::optional<Node> visit_link(Link node);
    virtual std::optional<Node> visit_image(Image node);
    virtual std::optional<Node> visit_line_break(LineBreak node);
    virtual std::optional<Node> visit_strikethrough(Strikethrough node);
    virtual std::optional<Node> visit_underline(Underline node);
    virtual std::optional<Node> visit_superscript(Superscript node);
    virtual std::optional<Node> visit_subscript(Subscript node);
    virtual std::optional<Node> visit_html_inline(HTMLInline node);
    virtual std::optional<Node> visit_math_inline(MathInline node);
    virtual std::optional<Node> visit_footnote_reference(FootnoteReference node);
};

} // namespace Polydoc
