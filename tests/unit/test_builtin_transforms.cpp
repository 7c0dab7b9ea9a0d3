/**
 * @file test_builtin_transforms.cpp
 * @brief Unit tests for the transforms registered by TransformRegistry::initialize().
 */

#include <gtest/gtest.h>
#include <transforms/builtin_transforms.hpp>
#include <transforms/transform_registry.hpp>
#include <ast/visitor.hpp>
#include <core/errors.hpp>
#include <cstdint>
#include <string>

using namespace Polydoc;

static Paragraph para(const std::string& text) {
    return Paragraph{{Text{text}}};
}

static Heading heading(int level, const std::string& text) {
    return make_heading(level, {Text{text}});
}

static std::string id_of(const Node& node) {
    return node.as<Heading>().metadata.at("id").get<std::string>();
}

// ============================================================================
// remove-nodes / remove-images
// ============================================================================

TEST(RemoveNodesTest, DropsListedTypesEverywhere) {
    Document doc;
    doc.children.push_back(para("keep"));
    doc.children.push_back(CodeBlock{"int x;"});
    doc.children.push_back(BlockQuote{{CodeBlock{"nested"}, para("quoted")}});

    Document out = RemoveNodesTransform({"code_block"}).transform(std::move(doc));
    ASSERT_EQ(out.children.size(), 2u);
    EXPECT_TRUE(out.children[0].is<Paragraph>());
    EXPECT_EQ(out.children[1].as<BlockQuote>().children.size(), 1u);
}

TEST(RemoveNodesTest, StructuralKeysDropChildrenOfTheirParent) {
    List list;
    list.items.push_back(ListItem{{para("one")}});
    list.items.push_back(ListItem{{para("two")}});
    Table table;
    table.rows.push_back(TableRow{{TableCell{{Text{"a"}}}, TableCell{{Text{"b"}}}}});

    Document doc;
    doc.children.push_back(std::move(list));
    doc.children.push_back(std::move(table));

    Document out = RemoveNodesTransform({"list_item", "table_cell"}).transform(std::move(doc));
    EXPECT_TRUE(out.children[0].as<List>().items.empty());
    EXPECT_TRUE(out.children[1].as<Table>().rows.at(0).cells.empty());
}

TEST(RemoveNodesTest, DefinitionTermsTakeTheirItem) {
    DefinitionList dl;
    dl.items.push_back(DefinitionItem{DefinitionTerm{{Text{"term"}}},
                                      {DefinitionDescription{{Text{"desc"}}}}});
    Document doc;
    doc.children.push_back(dl);

    Document no_desc = RemoveNodesTransform({"definition_description"}).transform(doc);
    ASSERT_EQ(no_desc.children[0].as<DefinitionList>().items.size(), 1u);
    EXPECT_TRUE(no_desc.children[0].as<DefinitionList>().items[0].descriptions.empty());

    Document no_terms = RemoveNodesTransform({"definition_term"}).transform(doc);
    EXPECT_TRUE(no_terms.children[0].as<DefinitionList>().items.empty());
}

TEST(RemoveNodesTest, RejectsRootAndUnknownTypes) {
    EXPECT_THROW(RemoveNodesTransform({"document"}), ValidationError);
    EXPECT_THROW(RemoveNodesTransform({"blink"}), ValidationError);
}

TEST(RemoveImagesTest, ReachesImagesInsideLinks) {
    Link link;
    link.url = "https://example.com";
    link.content = {Image{"logo.png", "logo"}, Text{"home"}};
    Document doc;
    doc.children.push_back(Paragraph{{std::move(link)}});

    Document out = RemoveImagesTransform().transform(std::move(doc));
    const auto& content = out.children[0].as<Paragraph>().content[0].as<Link>().content;
    ASSERT_EQ(content.size(), 1u);
    EXPECT_TRUE(content[0].is<Text>());
}

// ============================================================================
// heading-offset / link-rewriter / text-replacer
// ============================================================================

TEST(HeadingOffsetTest, ShiftsAndClamps) {
    Document doc;
    doc.children = {heading(1, "a"), heading(5, "b")};

    Document down = HeadingOffsetTransform(2).transform(doc);
    EXPECT_EQ(down.children[0].as<Heading>().level, 3);
    EXPECT_EQ(down.children[1].as<Heading>().level, 6);

    Document up = HeadingOffsetTransform(-3).transform(doc);
    EXPECT_EQ(up.children[0].as<Heading>().level, 1);
    EXPECT_EQ(up.children[1].as<Heading>().level, 2);
}

TEST(HeadingOffsetTest, HugeOffsetsSaturate) {
    Document doc;
    doc.children = {heading(2, "a")};

    TransformRegistry registry;
    registry.initialize();
    auto shift = registry.get_transform("heading-offset", {{"offset", int64_t{4294967296}}});
    EXPECT_EQ(shift->transform(doc).children[0].as<Heading>().level, 6);

    EXPECT_EQ(HeadingOffsetTransform(2147483647).transform(doc).children[0].as<Heading>().level, 6);
    EXPECT_EQ(HeadingOffsetTransform(INT64_MIN).transform(doc).children[0].as<Heading>().level, 1);
}

TEST(LinkRewriterTest, RewritesUrlsWithGroups) {
    Link link;
    link.url = "http://old.example.com/docs/intro";
    link.content = {Text{"intro"}};
    Document doc;
    doc.children.push_back(Paragraph{{link}});

    Document out = LinkRewriterTransform(R"(^http://old\.example\.com/(.*)$)", "https://new.example.com/$1")
                       .transform(std::move(doc));
    EXPECT_EQ(out.children[0].as<Paragraph>().content[0].as<Link>().url, "https://new.example.com/docs/intro");

    EXPECT_THROW(LinkRewriterTransform("(unclosed", "x"), ValidationError);
}

TEST(TextReplacerTest, ReplacesEveryOccurrence) {
    Document doc;
    doc.children.push_back(Paragraph{{Text{"aaa"}, Strong{{Text{"a-b"}}}}});

    Document out = TextReplacerTransform("a", "aa").transform(std::move(doc));
    const auto& content = out.children[0].as<Paragraph>().content;
    EXPECT_EQ(content[0].as<Text>().content, "aaaaaa");
    EXPECT_EQ(extract_text(content[1]), "aa-b");

    EXPECT_THROW(TextReplacerTransform("", "x"), ValidationError);
}

// ============================================================================
// add-heading-ids / generate-toc
// ============================================================================

TEST(AddHeadingIdsTest, SlugsWithDuplicateCounters) {
    Document doc;
    doc.children = {heading(1, "Getting Started"), heading(2, "Getting  Started!"),
                    heading(2, "Getting Started"), heading(3, "***")};

    Document out = AddHeadingIdsTransform().transform(std::move(doc));
    EXPECT_EQ(id_of(out.children[0]), "getting-started");
    EXPECT_EQ(id_of(out.children[1]), "getting-started-2");
    EXPECT_EQ(id_of(out.children[2]), "getting-started-3");
    EXPECT_EQ(id_of(out.children[3]), "heading");
}

TEST(AddHeadingIdsTest, PrefixAndSeparator) {
    Document doc;
    doc.children = {heading(1, "Intro Part"), heading(1, "Intro Part")};

    AddHeadingIdsTransform ids("doc_", "_");
    Document out = ids.transform(doc);
    EXPECT_EQ(id_of(out.children[0]), "doc_intro_part");
    EXPECT_EQ(id_of(out.children[1]), "doc_intro_part_2");

    // Counters reset per document.
    Document again = ids.transform(doc);
    EXPECT_EQ(id_of(again.children[0]), "doc_intro_part");
}

TEST(GenerateTocTest, NestedListAfterHeadingIds) {
    TransformRegistry registry;
    registry.initialize();

    Document doc;
    doc.children = {heading(1, "Intro"), para("text"), heading(2, "Setup"),
                    heading(3, "Deep"), heading(4, "Too deep"), heading(1, "Usage")};

    for (const auto& name : registry.resolve_dependencies({"generate-toc"}))
        doc = registry.get_transform(name)->transform(std::move(doc));

    ASSERT_GE(doc.children.size(), 2u);
    const auto& title = doc.children[0].as<Heading>();
    EXPECT_EQ(title.level, 1);
    EXPECT_EQ(extract_text(title.content), "Table of Contents");

    const auto& toc = doc.children[1].as<List>();
    EXPECT_TRUE(toc.metadata.value("toc", false));
    ASSERT_EQ(toc.items.size(), 2u);

    const auto& intro = toc.items[0];
    const auto& intro_link = intro.children[0].as<Paragraph>().content[0].as<Link>();
    EXPECT_EQ(intro_link.url, "#intro");

    ASSERT_EQ(intro.children.size(), 2u);
    const auto& nested = intro.children[1].as<List>();
    ASSERT_EQ(nested.items.size(), 1u);
    const auto& deeper = nested.items[0].children[1].as<List>();
    EXPECT_EQ(deeper.items[0].children[0].as<Paragraph>().content[0].as<Link>().url, "#deep");

    EXPECT_EQ(toc.items[1].children[0].as<Paragraph>().content[0].as<Link>().url, "#usage");
    EXPECT_NO_THROW(validate_document(doc));
}

TEST(GenerateTocTest, NoHeadingsLeavesDocumentAlone) {
    Document doc;
    doc.children = {para("only text")};
    Document out = GenerateTocTransform().transform(doc);
    EXPECT_EQ(out.children.size(), 1u);
}

TEST(GenerateTocTest, EmptyTitleOmitsHeading) {
    Document doc;
    doc.children = {heading(2, "Only")};
    Document out = GenerateTocTransform(3, "").transform(std::move(doc));
    ASSERT_EQ(out.children.size(), 2u);
    EXPECT_TRUE(out.children[0].is<List>());
    EXPECT_THROW(GenerateTocTransform(0), ValidationError);
}

// ============================================================================
// remove-boilerplate
// ============================================================================

TEST(RemoveBoilerplateTest, DefaultPatterns) {
    Document doc;
    doc.children = {para("Confidential"), para("  Page 3 of 10 "), para("Copyright 2024 Acme"),
                    para("[DRAFT]"), para("Real content about page 3 of 10."),
                    para("printed on 2024-01-31")};

    Document out = RemoveBoilerplateTransform().transform(std::move(doc));
    ASSERT_EQ(out.children.size(), 1u);
    EXPECT_EQ(extract_text(out.children[0]), "Real content about page 3 of 10.");
}

TEST(RemoveBoilerplateTest, CustomPatterns) {
    Document doc;
    doc.children = {para("CONFIDENTIAL"), para("DO NOT SHIP")};
    Document out = RemoveBoilerplateTransform({"^do not ship$"}).transform(std::move(doc));
    ASSERT_EQ(out.children.size(), 1u);
    EXPECT_EQ(extract_text(out.children[0]), "CONFIDENTIAL");

    EXPECT_THROW(RemoveBoilerplateTransform({"[unterminated"}), ValidationError);
}

// ============================================================================
// Metadata transforms
// ============================================================================

TEST(AddConversionTimestampTest, FormatsIsoAndUnix) {
    Document iso = AddConversionTimestampTransform().transform(Document{});
    std::string stamp = iso.metadata.at("conversion_timestamp").get<std::string>();
    ASSERT_EQ(stamp.size(), 19u);
    EXPECT_EQ(stamp[4], '-');
    EXPECT_EQ(stamp[10], 'T');

    Document unix_doc = AddConversionTimestampTransform("converted_at", "unix").transform(Document{});
    std::string seconds = unix_doc.metadata.at("converted_at").get<std::string>();
    EXPECT_GT(std::stoll(seconds), 1600000000LL);

    Document custom = AddConversionTimestampTransform("year", "%Y").transform(Document{});
    EXPECT_EQ(custom.metadata.at("year").get<std::string>().size(), 4u);
}

TEST(CalculateWordCountTest, CountsWordsAndCodepoints) {
    Document doc;
    doc.children = {heading(1, "Title"), para("two words"), para("caf\xC3\xA9")};

    Document out = CalculateWordCountTransform().transform(std::move(doc));
    EXPECT_EQ(out.metadata.at("word_count").get<int>(), 4);
    // "Title two words café" joined with single spaces.
    EXPECT_EQ(out.metadata.at("char_count").get<int>(), 20);

    Document renamed = CalculateWordCountTransform("w", "c").transform(Document{});
    EXPECT_EQ(renamed.metadata.at("w").get<int>(), 0);
    EXPECT_EQ(renamed.metadata.at("c").get<int>(), 0);
}
