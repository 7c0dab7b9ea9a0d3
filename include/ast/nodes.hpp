#pragma once

/**
 * @file nodes.hpp
 * @brief Format-agnostic document tree shared by every parser and renderer.
 *
 * A Document exclusively owns an ordered list of Node values. Node is a closed
 * std::variant over the block and inline node types; structural children
 * (list items, table rows/cells, definition terms) are strongly typed members
 * of their parent rather than free-standing Node alternatives, so a TableCell
 * can only ever live inside a TableRow.
 *
 * Every type carries a JSON metadata object and an optional SourceLocation.
 */

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace Polydoc {

using json = nlohmann::json;

struct SourceLocation {
    std::string format;
    std::optional<int> page;
    std::optional<int> line;
    std::optional<int> column;
    std::optional<std::string> element_id;
    json metadata = json::object();
};

struct Node;
using NodeList = std::vector<Node>;

// =============================================================================
//  Inline nodes
// =============================================================================

struct Text {
    std::string content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Emphasis {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Strong {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Strikethrough {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Underline {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Superscript {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Subscript {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Code {
    std::string content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Link {
    std::string url;
    NodeList content;
    std::optional<std::string> title;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Image {
    std::string url;
    std::string alt_text;
    std::optional<std::string> title;
    std::optional<int> width;
    std::optional<int> height;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct LineBreak {
    bool soft = false;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct HTMLInline {
    std::string content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct MathInline {
    std::string content;
    std::string notation = "latex";
    std::map<std::string, std::string> representations;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct FootnoteReference {
    std::string identifier;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

// =============================================================================
//  Block nodes
// =============================================================================

/// Level must be within 1..6; see make_heading() and validate_document().
struct Heading {
    int level = 1;
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Paragraph {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct CodeBlock {
    std::string content;
    std::optional<std::string> language;
    std::string fence_char = "`";
    int fence_length = 3;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct BlockQuote {
    NodeList children;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct ListItem {
    NodeList children;
    std::optional<std::string> task_status;   // "checked" | "unchecked"
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct List {
    bool ordered = false;
    std::vector<ListItem> items;
    int start = 1;
    bool tight = true;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct TableCell {
    NodeList content;
    int colspan = 1;
    int rowspan = 1;
    std::optional<std::string> alignment;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct TableRow {
    std::vector<TableCell> cells;
    bool is_header = false;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct Table {
    std::optional<TableRow> header;
    std::vector<TableRow> rows;
    std::vector<std::string> alignments;      // "left" | "center" | "right" | ""
    std::optional<std::string> caption;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct ThematicBreak {
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct HTMLBlock {
    std::string content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct MathBlock {
    std::string content;
    std::string notation = "latex";
    std::map<std::string, std::string> representations;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct DefinitionTerm {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct DefinitionDescription {
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct DefinitionItem {
    DefinitionTerm term;
    std::vector<DefinitionDescription> descriptions;
};

struct DefinitionList {
    std::vector<DefinitionItem> items;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

struct FootnoteDefinition {
    std::string identifier;
    NodeList content;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

// =============================================================================
//  Node
// =============================================================================

using NodeVariant = std::variant<
    // block
    Heading, Paragraph, CodeBlock, BlockQuote, List, Table, ThematicBreak,
    HTMLBlock, MathBlock, DefinitionList, FootnoteDefinition,
    // inline
    Text, Emphasis, Strong, Code, Link, Image, LineBreak, Strikethrough,
    Underline, Superscript, Subscript, HTMLInline, MathInline, FootnoteReference>;

template <typename T, typename Variant>
struct is_variant_member;

template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename T>
inline constexpr bool is_node_alternative_v = is_variant_member<T, NodeVariant>::value;

struct Node {
    NodeVariant value;

    Node() = default;

    template <typename T,
              typename = std::enable_if_t<is_node_alternative_v<std::decay_t<T>>>>
    Node(T&& v) : value(std::forward<T>(v)) {}

    template <typename T> bool is() const { return std::holds_alternative<T>(value); }
    template <typename T> T& as() { return std::get<T>(value); }
    template <typename T> const T& as() const { return std::get<T>(value); }
    template <typename T> T* get_if() { return std::get_if<T>(&value); }
    template <typename T> const T* get_if() const { return std::get_if<T>(&value); }

    json& metadata();
    const json& metadata() const;
    std::optional<SourceLocation>& source_location();
    const std::optional<SourceLocation>& source_location() const;

    /// Discriminator used in serialized form, e.g. "CodeBlock".
    std::string_view type_name() const;
    /// snake_case form, e.g. "code_block".
    std::string_view type_key() const;
    bool is_block() const;
};

struct Document {
    NodeList children;
    json metadata = json::object();
    std::optional<SourceLocation> source_location;
};

// =============================================================================
//  Type names
// =============================================================================

template <typename T> struct NodeTraits;

#define POLYDOC_NODE_TRAITS(Type, Key, Block)                          \
    template <> struct NodeTraits<Type> {                              \
        static constexpr std::string_view name = #Type;                \
        static constexpr std::string_view key = Key;                   \
        static constexpr bool block = Block;                           \
    };

POLYDOC_NODE_TRAITS(Document, "document", true)
POLYDOC_NODE_TRAITS(Heading, "heading", true)
POLYDOC_NODE_TRAITS(Paragraph, "paragraph", true)
POLYDOC_NODE_TRAITS(CodeBlock, "code_block", true)
POLYDOC_NODE_TRAITS(BlockQuote, "block_quote", true)
POLYDOC_NODE_TRAITS(List, "list", true)
POLYDOC_NODE_TRAITS(ListItem, "list_item", true)
POLYDOC_NODE_TRAITS(Table, "table", true)
POLYDOC_NODE_TRAITS(TableRow, "table_row", true)
POLYDOC_NODE_TRAITS(TableCell, "table_cell", true)
POLYDOC_NODE_TRAITS(ThematicBreak, "thematic_break", true)
POLYDOC_NODE_TRAITS(HTMLBlock, "html_block", true)
POLYDOC_NODE_TRAITS(MathBlock, "math_block", true)
POLYDOC_NODE_TRAITS(DefinitionList, "definition_list", true)
POLYDOC_NODE_TRAITS(DefinitionTerm, "definition_term", true)
POLYDOC_NODE_TRAITS(DefinitionDescription, "definition_description", true)
POLYDOC_NODE_TRAITS(FootnoteDefinition, "footnote_definition", true)
POLYDOC_NODE_TRAITS(Text, "text", false)
POLYDOC_NODE_TRAITS(Emphasis, "emphasis", false)
POLYDOC_NODE_TRAITS(Strong, "strong", false)
POLYDOC_NODE_TRAITS(Code, "code", false)
POLYDOC_NODE_TRAITS(Link, "link", false)
POLYDOC_NODE_TRAITS(Image, "image", false)
POLYDOC_NODE_TRAITS(LineBreak, "line_break", false)
POLYDOC_NODE_TRAITS(Strikethrough, "strikethrough", false)
POLYDOC_NODE_TRAITS(Underline, "underline", false)
POLYDOC_NODE_TRAITS(Superscript, "superscript", false)
POLYDOC_NODE_TRAITS(Subscript, "subscript", false)
POLYDOC_NODE_TRAITS(HTMLInline, "html_inline", false)
POLYDOC_NODE_TRAITS(MathInline, "math_inline", false)
POLYDOC_NODE_TRAITS(FootnoteReference, "footnote_reference", false)

#undef POLYDOC_NODE_TRAITS

/// Every snake_case key accepted by type-filtering transforms.
POLYDOC_API const std::vector<std::string_view>& all_node_type_keys();

// =============================================================================
//  Construction and checks
// =============================================================================

/// @throws ValidationError if level is outside 1..6.
POLYDOC_API Heading make_heading(int level, NodeList content);

/**
 * @brief Checks structural invariants of a whole tree: heading levels,
 * positive fence lengths and cell spans, known task status and alignments.
 * @throws ValidationError naming the first offending node type.
 */
POLYDOC_API void validate_document(const Document& doc);

/// Concatenated Text/Code content of a subtree, in document order.
POLYDOC_API std::string extract_text(const Node& node);
POLYDOC_API std::string extract_text(const NodeList& nodes);

/// Same as extract_text but separates block-level children with @p block_sep.
POLYDOC_API std::string extract_document_text(const Document& doc, std::string_view block_sep = "\n\n");

} // namespace Polydoc
