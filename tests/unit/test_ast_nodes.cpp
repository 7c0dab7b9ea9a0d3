/**
 * @file test_ast_nodes.cpp
 * @brief Unit tests for the document tree: construction, validation,
 * traversal and rewriting.
 */

#include <gtest/gtest.h>
#include <ast/nodes.hpp>
#include <ast/transformer.hpp>
#include <ast/visitor.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace Polydoc;

static Document sample_document() {
    Document doc;
    doc.children.push_back(make_heading(1, {Text{"Intro"}}));

    Paragraph p;
    p.content.push_back(Text{"Hello "});
    p.content.push_back(Strong{{Text{"bold"}}});
    Link link;
    link.url = "https://example.com";
    link.content.push_back(Image{"logo.png", "logo"});
    p.content.push_back(std::move(link));
    doc.children.push_back(std::move(p));

    List list;
    ListItem item;
    item.children.push_back(Paragraph{{Text{"one"}}});
    list.items.push_back(std::move(item));
    doc.children.push_back(std::move(list));

    Table table;
    TableRow row;
    TableCell cell;
    cell.content.push_back(Image{"cell.png", "cell"});
    row.cells.push_back(std::move(cell));
    table.rows.push_back(std::move(row));
    doc.children.push_back(std::move(table));
    return doc;
}

// ============================================================================
// Construction
// ============================================================================

TEST(AstNodesTest, NodeReportsTypeNames) {
    Node n = CodeBlock{"int x;", "cpp"};
    EXPECT_TRUE(n.is<CodeBlock>());
    EXPECT_EQ(n.type_name(), "CodeBlock");
    EXPECT_EQ(n.type_key(), "code_block");
    EXPECT_TRUE(n.is_block());

    Node t = Text{"x"};
    EXPECT_EQ(t.type_key(), "text");
    EXPECT_FALSE(t.is_block());
}

TEST(AstNodesTest, MetadataIsSharedThroughNode) {
    Node n = Paragraph{};
    n.metadata()["id"] = "p1";
    EXPECT_EQ(n.as<Paragraph>().metadata["id"], "p1");
}

TEST(AstNodesTest, MakeHeadingRejectsOutOfRangeLevels) {
    EXPECT_NO_THROW(make_heading(1, {}));
    EXPECT_NO_THROW(make_heading(6, {}));
    EXPECT_THROW(make_heading(0, {}), ValidationError);
    EXPECT_THROW(make_heading(7, {}), ValidationError);
}

TEST(AstNodesTest, TypeKeysCoverStructuralChildren) {
    const auto& keys = all_node_type_keys();
    for (std::string_view k : {"heading", "image", "list_item", "table_cell", "definition_term"})
        EXPECT_NE(std::find(keys.begin(), keys.end(), k), keys.end()) << k;
}

// ============================================================================
// Validation
// ============================================================================

TEST(AstNodesTest, ValidateDocumentAcceptsWellFormedTree) {
    EXPECT_NO_THROW(validate_document(sample_document()));
}

TEST(AstNodesTest, ValidateDocumentFindsNestedBadHeading) {
    Document doc;
    BlockQuote quote;
    Heading h;
    h.level = 9;
    quote.children.push_back(h);
    doc.children.push_back(std::move(quote));
    EXPECT_THROW(validate_document(doc), ValidationError);
}

TEST(AstNodesTest, ValidateDocumentRejectsBadSpansAndTaskStatus) {
    Document spans;
    Table table;
    TableRow row;
    TableCell cell;
    cell.colspan = 0;
    row.cells.push_back(cell);
    table.rows.push_back(row);
    spans.children.push_back(table);
    EXPECT_THROW(validate_document(spans), ValidationError);

    Document tasks;
    List list;
    ListItem item;
    item.task_status = "maybe";
    list.items.push_back(item);
    tasks.children.push_back(list);
    EXPECT_THROW(validate_document(tasks), ValidationError);
}

// ============================================================================
// Text extraction
// ============================================================================

TEST(AstNodesTest, ExtractTextConcatenatesInlineContent) {
    Paragraph p;
    p.content.push_back(Text{"a "});
    p.content.push_back(Emphasis{{Text{"b"}}});
    p.content.push_back(Code{" c"});
    EXPECT_EQ(extract_text(Node(p)), "a b c");
}

TEST(AstNodesTest, ExtractDocumentTextSeparatesBlocks) {
    Document doc;
    doc.children.push_back(Paragraph{{Text{"first"}}});
    doc.children.push_back(Paragraph{{Text{"second"}}});
    EXPECT_EQ(extract_document_text(doc, "|"), "first|second");
}

// ============================================================================
// Traversal
// ============================================================================

TEST(AstNodesTest, WalkVisitsNestedImages) {
    int images = 0;
    int cells = 0;
    walk(sample_document(), [&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Image>) ++images;
        if constexpr (std::is_same_v<T, TableCell>) ++cells;
    });
    EXPECT_EQ(images, 2);
    EXPECT_EQ(cells, 1);
}

class CountingVisitor : public NodeVisitor {
public:
    void visit(const Heading&) override { ++headings; }
    void visit_default(std::string_view) override { ++others; }

    int headings = 0;
    int others = 0;
};

TEST(AstNodesTest, VisitorDispatchesByType) {
    CountingVisitor v;
    v.visit_document(sample_document());
    EXPECT_EQ(v.headings, 1);
    EXPECT_GT(v.others, 5);
}

// ============================================================================
// Rewriting
// ============================================================================

class DropImages : public NodeTransformer {
protected:
    std::optional<Node> visit_image(Image) override { return std::nullopt; }
};

TEST(AstNodesTest, TransformerReachesImagesInLinksAndCells) {
    DropImages t;
    Document out = t.transform(sample_document());

    int images = 0;
    walk(out, [&](const auto& n) {
        if constexpr (std::is_same_v<std::decay_t<decltype(n)>, Image>) ++images;
    });
    EXPECT_EQ(images, 0);
    ASSERT_EQ(out.children.size(), 4u);
    EXPECT_TRUE(out.children[1].as<Paragraph>().content[2].is<Link>());
}

class Uppercase : public NodeTransformer {
protected:
    std::optional<Node> visit_text(Text t) override {
        std::transform(t.content.begin(), t.content.end(), t.content.begin(), ::toupper);
        return Node(std::move(t));
    }
};

TEST(AstNodesTest, TransformerPreservesStructure) {
    Uppercase t;
    Document out = t.transform(sample_document());
    EXPECT_EQ(extract_text(out.children[0]), "INTRO");
    EXPECT_EQ(extract_text(out.children[2]), "ONE");
}
