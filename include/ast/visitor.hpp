#pragma once

/**
 * @file visitor.hpp
 * @brief Read-only depth-first traversal of a Document.
 *
 * walk() visits every element pre-order, including the typed structural
 * children (ListItem, TableRow, TableCell, DefinitionTerm,
 * DefinitionDescription). The callback is invoked with the concrete type, so a
 * generic lambda or an overload set can pick the cases it cares about.
 */

#include <ast/nodes.hpp>
#include <export.hpp>
#include <variant>

namespace Polydoc {

namespace detail {

template <typename F> void walk_node(const Node& node, F& fn);

template <typename F> void walk_list(const NodeList& nodes, F& fn) {
    for (const auto& n : nodes) walk_node(n, fn);
}

template <typename F> void walk_row(const TableRow& row, F& fn) {
    fn(row);
    for (const auto& cell : row.cells) {
        fn(cell);
        walk_list(cell.content, fn);
    }
}

// Leaf types have no children.
template <typename T, typename F> void walk_children(const T&, F&) {}

template <typename F> void walk_children(const Heading& n, F& fn)       { walk_list(n.content, fn); }
template <typename F> void walk_children(const Paragraph& n, F& fn)     { walk_list(n.content, fn); }
template <typename F> void walk_children(const BlockQuote& n, F& fn)    { walk_list(n.children, fn); }
template <typename F> void walk_children(const Emphasis& n, F& fn)      { walk_list(n.content, fn); }
template <typename F> void walk_children(const Strong& n, F& fn)        { walk_list(n.content, fn); }
template <typename F> void walk_children(const Strikethrough& n, F& fn) { walk_list(n.content, fn); }
template <typename F> void walk_children(const Underline& n, F& fn)     { walk_list(n.content, fn); }
template <typename F> void walk_children(const Superscript& n, F& fn)   { walk_list(n.content, fn); }
template <typename F> void walk_children(const Subscript& n, F& fn)     { walk_list(n.content, fn); }
template <typename F> void walk_children(const Link& n, F& fn)          { walk_list(n.content, fn); }
template <typename F> void walk_children(const FootnoteDefinition& n, F& fn) { walk_list(n.content, fn); }

template <typename F> void walk_children(const List& n, F& fn) {
    for (const auto& item : n.items) {
        fn(item);
        walk_list(item.children, fn);
    }
}

template <typename F> void walk_children(const Table& n, F& fn) {
    if (n.header) walk_row(*n.header, fn);
    for (const auto& row : n.rows) walk_row(row, fn);
}

template <typename F> void walk_children(const DefinitionList& n, F& fn) {
    for (const auto& item : n.items) {
        fn(item.term);
        walk_list(item.term.content, fn);
        for (const auto& desc : item.descriptions) {
            fn(desc);
            walk_list(desc.content, fn);
        }
    }
}

template <typename F> void walk_node(const Node& node, F& fn) {
    std::visit([&fn](const auto& v) {
        fn(v);
        walk_children(v, fn);
    }, node.value);
}

} // namespace detail

/// Pre-order traversal; the Document itself is not passed to @p fn.
template <typename F> void walk(const Document& doc, F&& fn) {
    detail::walk_list(doc.children, fn);
}

template <typename F> void walk(const Node& node, F&& fn) {
    detail::walk_node(node, fn);
}

/**
 * @brief Class-based visitor. Every hook defaults to visit_default(), so a
 * subclass only overrides the node types it handles.
 */
class POLYDOC_API NodeVisitor {
public:
    virtual ~NodeVisitor() = default;

    void visit_document(const Document& doc);

    virtual void visit_default(std::string_view /*type_name*/) {}

    virtual void visit(const Heading&)               { visit_default(NodeTraits<Heading>::name); }
    virtual void visit(const Paragraph&)             { visit_default(NodeTraits<Paragraph>::name); }
    virtual void visit(const CodeBlock&)             { visit_default(NodeTraits<CodeBlock>::name); }
    virtual void visit(const BlockQuote&)            { visit_default(NodeTraits<BlockQuote>::name); }
    virtual void visit(const List&)                  { visit_default(NodeTraits<List>::name); }
    virtual void visit(const ListItem&)              { visit_default(NodeTraits<ListItem>::name); }
    virtual void visit(const Table&)                 { visit_default(NodeTraits<Table>::name); }
    virtual void visit(const TableRow&)              { visit_default(NodeTraits<TableRow>::name); }
    virtual void visit(const TableCell&)             { visit_default(NodeTraits<TableCell>::name); }
    virtual void visit(const ThematicBreak&)         { visit_default(NodeTraits<ThematicBreak>::name); }
    virtual void visit(const HTMLBlock&)             { visit_default(NodeTraits<HTMLBlock>::name); }
    virtual void visit(const MathBlock&)             { visit_default(NodeTraits<MathBlock>::name); }
    virtual void visit(const DefinitionList&)        { visit_default(NodeTraits<DefinitionList>::name); }
    virtual void visit(const DefinitionTerm&)        { visit_default(NodeTraits<DefinitionTerm>::name); }
    virtual void visit(const DefinitionDescription&) { visit_default(NodeTraits<DefinitionDescription>::name); }
    virtual void visit(const FootnoteDefinition&)    { visit_default(NodeTraits<FootnoteDefinition>::name); }
    virtual void visit(const Text&)                  { visit_default(NodeTraits<Text>::name); }
    virtual void visit(const Emphasis&)              { visit_default(NodeTraits<Emphasis>::name); }
    virtual void visit(const Strong&)                { visit_default(NodeTraits<Strong>::name); }
    virtual void visit(const Code&)                  { visit_default(NodeTraits<Code>::name); }
    virtual void visit(const Link&)                  { visit_default(NodeTraits<Link>::name); }
    virtual void visit(const Image&)                 { visit_default(NodeTraits<Image>::name); }
    virtual void visit(const LineBreak&)             { visit_default(NodeTraits<LineBreak>::name); }
    virtual void visit(const Strikethrough&)         { visit_default(NodeTraits<Strikethrough>::name); }
    virtual void visit(const Underline&)             { visit_default(NodeTraits<Underline>::name); }
    virtual void visit(const Superscript&)           { visit_default(NodeTraits<Superscript>::name); }
    virtual void visit(const Subscript&)             { visit_default(NodeTraits<Subscript>::name); }
    virtual void visit(const HTMLInline&)            { visit_default(NodeTraits<HTMLInline>::name); }
    virtual void visit(const MathInline&)            { visit_default(NodeTraits<MathInline>::name); }
    virtual void visit(const FootnoteReference&)     { visit_default(NodeTraits<FootnoteReference>::name); }
};

} // namespace Polydoc
