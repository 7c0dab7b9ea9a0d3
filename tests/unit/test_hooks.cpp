/**
 * @file test_hooks.cpp
 * @brief Unit tests for HookManager ordering, node hooks and validation.
 */

#include <gtest/gtest.h>
#include <pipeline/hooks.hpp>
#include <core/errors.hpp>
#include <string>
#include <vector>

using namespace Polydoc;

TEST(HookManagerTest, DocumentHooksRunByPriorityThenRegistration) {
    HookManager hooks;
    std::vector<std::string> calls;
    hooks.add_document_hook(HookPoint::PreRender, [&calls](Document&, HookContext&) { calls.push_back("b"); });
    hooks.add_document_hook(HookPoint::PreRender, [&calls](Document&, HookContext&) { calls.push_back("a"); }, 10);
    hooks.add_document_hook(HookPoint::PreRender, [&calls](Document&, HookContext&) { calls.push_back("c"); });

    Document doc;
    HookContext ctx;
    EXPECT_TRUE(hooks.has_hooks(HookPoint::PreRender));
    EXPECT_FALSE(hooks.has_hooks(HookPoint::PostParse));
    hooks.run(HookPoint::PreRender, doc, ctx);
    EXPECT_EQ(calls, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(HookManagerTest, HooksShareContextAndSeePreviousResult) {
    HookManager hooks;
    hooks.add_document_hook(HookPoint::PostParse, [](Document& doc, HookContext& ctx) {
        doc.metadata["stage"] = 1;
        ctx.shared["seen"] = true;
    });
    hooks.add_document_hook(HookPoint::PostParse, [](Document& doc, HookContext& ctx) {
        doc.metadata["stage"] = doc.metadata["stage"].get<int>() + 1;
        doc.metadata["seen"] = ctx.shared.value("seen", false);
    });

    Document doc;
    HookContext ctx;
    hooks.run(HookPoint::PostParse, doc, ctx);
    EXPECT_EQ(doc.metadata["stage"], 2);
    EXPECT_EQ(doc.metadata["seen"], true);
}

TEST(HookManagerTest, NodeHooksRewriteAndRemove) {
    HookManager hooks;
    hooks.add_node_hook("image", [](Node, HookContext&) -> std::optional<Node> { return std::nullopt; });
    hooks.add_node_hook("text", [](Node node, HookContext&) -> std::optional<Node> {
        node.as<Text>().content += "!";
        return node;
    });
    hooks.add_node_hook("paragraph", [](Node node, HookContext& ctx) -> std::optional<Node> {
        // Children are already hooked when the parent is visited.
        ctx.shared["last"] = extract_text(node);
        return node;
    });

    Document doc;
    doc.children.push_back(Paragraph{{Text{"hi"}, Image{"x.png", "x"}}});

    HookContext ctx;
    Document out = hooks.apply_node_hooks(std::move(doc), ctx);
    const auto& content = out.children[0].as<Paragraph>().content;
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(content[0].as<Text>().content, "hi!");
    EXPECT_EQ(ctx.shared["last"], "hi!");
}

TEST(HookManagerTest, NodeHooksChainInPriorityOrder) {
    HookManager hooks;
    auto append = [](std::string suffix) {
        return [suffix](Node node, HookContext&) -> std::optional<Node> {
            node.as<Text>().content += suffix;
            return node;
        };
    };
    hooks.add_node_hook("text", append("2"), 200);
    hooks.add_node_hook("text", append("1"), 50);

    Document doc;
    doc.children.push_back(Paragraph{{Text{"x"}}});
    HookContext ctx;
    Document out = hooks.apply_node_hooks(std::move(doc), ctx);
    EXPECT_EQ(extract_text(out.children[0]), "x12");
}

TEST(HookManagerTest, OutputHooksEditRenderedText) {
    HookManager hooks;
    hooks.add_output_hook([](std::string& out, HookContext& ctx) { out += "-- " + ctx.target_format; });

    HookContext ctx;
    ctx.target_format = "plaintext";
    std::string rendered = "body\n";
    hooks.run_output(rendered, ctx);
    EXPECT_EQ(rendered, "body\n-- plaintext");
    EXPECT_TRUE(hooks.has_hooks(HookPoint::PostRender));
}

TEST(HookManagerTest, RegistrationValidation) {
    HookManager hooks;
    auto noop_doc = [](Document&, HookContext&) {};
    auto noop_node = [](Node n, HookContext&) -> std::optional<Node> { return n; };

    EXPECT_THROW(hooks.add_document_hook(HookPoint::PostRender, noop_doc), ValidationError);
    EXPECT_THROW(hooks.add_document_hook(HookPoint::PreRender, DocumentHook{}), ValidationError);
    EXPECT_THROW(hooks.add_node_hook("blink", noop_node), ValidationError);
    EXPECT_THROW(hooks.add_node_hook("document", noop_node), ValidationError);
    EXPECT_THROW(hooks.add_node_hook("table_cell", noop_node), ValidationError);
    EXPECT_NO_THROW(hooks.add_node_hook("code_block", noop_node));
    EXPECT_TRUE(hooks.has_node_hooks());

    hooks.clear();
    EXPECT_FALSE(hooks.has_node_hooks());
}

TEST(HookManagerTest, HookExceptionsPropagate) {
    HookManager hooks;
    hooks.add_document_hook(HookPoint::PreTransform, [](Document&, HookContext& ctx) {
        throw ValidationError("refusing " + ctx.transform_name, ctx.transform_name);
    });

    Document doc;
    HookContext ctx;
    ctx.transform_name = "generate-toc";
    EXPECT_THROW(hooks.run(HookPoint::PreTransform, doc, ctx), ValidationError);
    EXPECT_STREQ(hook_point_name(HookPoint::PreTransform), "pre_transform");
}
