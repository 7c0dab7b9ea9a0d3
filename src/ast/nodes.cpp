#include <ast/nodes.hpp>
#include <ast/visitor.hpp>
#include <core/errors.hpp>

namespace Polydoc {

json& Node::metadata() {
    return std::visit([](auto& v) -> json& { return v.metadata; }, value);
}

const json& Node::metadata() const {
    return std::visit([](const auto& v) -> const json& { return v.metadata; }, value);
}

std::optional<SourceLocation>& Node::source_location() {
    return std::visit([](auto& v) -> std::optional<SourceLocation>& { return v.source_location; }, value);
}

const std::optional<SourceLocation>& Node::source_location() const {
    return std::visit([](const auto& v) -> const std::optional<SourceLocation>& {
        return v.source_location;
    }, value);
}

std::string_view Node::type_name() const {
    return std::visit([](const auto& v) {
        return NodeTraits<std::decay_t<decltype(v)>>::name;
    }, value);
}

std::string_view Node::type_key() const {
    return std::visit([](const auto& v) {
        return NodeTraits<std::decay_t<decltype(v)>>::key;
    }, value);
}

bool Node::is_block() const {
    return std::visit([](const auto& v) {
        return NodeTraits<std::decay_t<decltype(v)>>::block;
    }, value);
}

namespace {

template <typename... Ts>
std::vector<std::string_view> keys_of(std::variant<Ts...>*) {
    return { NodeTraits<Ts>::key... };
}

} // namespace

const std::vector<std::string_view>& all_node_type_keys() {
    static const std::vector<std::string_view> keys = [] {
        auto k = keys_of(static_cast<NodeVariant*>(nullptr));
        k.push_back(NodeTraits<ListItem>::key);
        k.push_back(NodeTraits<TableRow>::key);
        k.push_back(NodeTraits<TableCell>::key);
        k.push_back(NodeTraits<DefinitionTerm>::key);
        k.push_back(NodeTraits<DefinitionDescription>::key);
        return k;
    }();
    return keys;
}

Heading make_heading(int level, NodeList content) {
    if (level < 1 || level > 6)
        throw ValidationError("Heading level must be between 1 and 6, got " + std::to_string(level), "level");
    Heading h;
    h.level = level;
    h.content = std::move(content);
    return h;
}

// =============================================================================
//  Validation
// =============================================================================

namespace {

bool valid_alignment(const std::string& a) {
    return a.empty() || a == "left" || a == "center" || a == "right";
}

struct TreeValidator {
    void operator()(const Heading& h) const {
        if (h.level < 1 || h.level > 6)
            fail<Heading>("level " + std::to_string(h.level) + " outside 1..6");
    }
    void operator()(const CodeBlock& c) const {
        if (c.fence_length < 1) fail<CodeBlock>("fence_length must be positive");
    }
    void operator()(const ListItem& i) const {
        if (i.task_status && *i.task_status != "checked" && *i.task_status != "unchecked")
            fail<ListItem>("unknown task_status '" + *i.task_status + "'");
    }
    void operator()(const Table& t) const {
        for (const auto& a : t.alignments)
            if (!valid_alignment(a)) fail<Table>("unknown alignment '" + a + "'");
    }
    void operator()(const TableCell& c) const {
        if (c.colspan < 1 || c.rowspan < 1) fail<TableCell>("spans must be positive");
        if (c.alignment && !valid_alignment(*c.alignment))
            fail<TableCell>("unknown alignment '" + *c.alignment + "'");
    }
    template <typename T> void operator()(const T&) const {}

    template <typename T> [[noreturn]] static void fail(const std::string& what) {
        throw ValidationError("Invalid " + std::string(NodeTraits<T>::name) + ": " + what,
                              std::string(NodeTraits<T>::name));
    }
};

} // namespace

void validate_document(const Document& doc) {
    walk(doc, TreeValidator{});
}

// =============================================================================
//  Text extraction
// =============================================================================

namespace {

struct TextCollector {
    std::string* out;

    void operator()(const Text& t) const { *out += t.content; }
    void operator()(const Code& c) const { *out += c.content; }
    void operator()(const CodeBlock& c) const { *out += c.content; }
    void operator()(const MathInline& m) const { *out += m.content; }
    void operator()(const MathBlock& m) const { *out += m.content; }
    void operator()(const LineBreak&) const { *out += '\n'; }
    void operator()(const Image& i) const { *out += i.alt_text; }
    template <typename T> void operator()(const T&) const {}
};

} // namespace

std::string extract_text(const Node& node) {
    std::string out;
    walk(node, TextCollector{&out});
    return out;
}

std::string extract_text(const NodeList& nodes) {
    std::string out;
    for (const auto& n : nodes) walk(n, TextCollector{&out});
    return out;
}

std::string extract_document_text(const Document& doc, std::string_view block_sep) {
    std::string out;
    for (const auto& child : doc.children) {
        std::string part = extract_text(child);
        if (part.empty()) continue;
        if (!out.empty()) out += block_sep;
        out += part;
    }
    return out;
}

} // namespace Polydoc
