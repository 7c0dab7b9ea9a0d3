#include <ast/serialization.hpp>
#include <core/errors.hpp>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace Polydoc {

namespace {

template <typename> inline constexpr bool always_false = false;

// =============================================================================
//  Encoding
// =============================================================================

json location_to_json(const SourceLocation& loc) {
    json j = {{"node_type", "SourceLocation"}, {"format", loc.format}};
    if (loc.page) j["page"] = *loc.page;
    if (loc.line) j["line"] = *loc.line;
    if (loc.column) j["column"] = *loc.column;
    if (loc.element_id) j["element_id"] = *loc.element_id;
    if (!loc.metadata.empty()) j["metadata"] = loc.metadata;
    return j;
}

json list_to_json(const NodeList& nodes) {
    json arr = json::array();
    for (const auto& n : nodes) arr.push_back(node_to_json(n));
    return arr;
}

template <typename T>
json base_object(const T&) {
    return json{{"node_type", std::string(NodeTraits<T>::name)}};
}

template <typename T>
void finish(json& j, const T& node) {
    j["metadata"] = node.metadata.is_null() ? json::object() : node.metadata;
    if (node.source_location) j["source_location"] = location_to_json(*node.source_location);
}

json list_item_to_json(const ListItem& item) {
    json j = base_object(item);
    j["children"] = list_to_json(item.children);
    if (item.task_status) j["task_status"] = *item.task_status;
    finish(j, item);
    return j;
}

json cell_to_json(const TableCell& cell) {
    json j = base_object(cell);
    j["content"] = list_to_json(cell.content);
    j["colspan"] = cell.colspan;
    j["rowspan"] = cell.rowspan;
    if (cell.alignment) j["alignment"] = *cell.alignment;
    finish(j, cell);
    return j;
}

json row_to_json(const TableRow& row) {
    json j = base_object(row);
    json cells = json::array();
    for (const auto& c : row.cells) cells.push_back(cell_to_json(c));
    j["cells"] = std::move(cells);
    j["is_header"] = row.is_header;
    finish(j, row);
    return j;
}

template <typename T>
json content_holder_to_json(const T& node) {
    json j = base_object(node);
    j["content"] = list_to_json(node.content);
    finish(j, node);
    return j;
}

template <typename T>
json math_to_json(const T& node) {
    json j = base_object(node);
    j["content"] = node.content;
    j["notation"] = node.notation;
    if (!node.representations.empty()) j["representations"] = node.representations;
    finish(j, node);
    return j;
}

// =============================================================================
//  Decoding helpers
// =============================================================================

[[noreturn]] void fail(const std::string& node_type, const std::string& field, const std::string& what) {
    throw ParsingError("Invalid AST structure: " + node_type + "." + field + " " + what, field);
}

const json& require(const json& obj, const std::string& node_type, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end()) fail(node_type, field, "is required");
    return *it;
}

std::string get_string(const json& obj, const std::string& node_type, const char* field) {
    const json& v = require(obj, node_type, field);
    if (!v.is_string()) fail(node_type, field, "must be a string");
    return v.get<std::string>();
}

std::optional<std::string> get_opt_string(const json& obj, const std::string& node_type, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) fail(node_type, field, "must be a string");
    return it->get<std::string>();
}

std::string get_string_or(const json& obj, const std::string& node_type, const char* field,
                          const std::string& fallback) {
    auto v = get_opt_string(obj, node_type, field);
    return v ? *v : fallback;
}

int checked_int(const json& v, const std::string& node_type, const char* field) {
    if (!v.is_number_integer()) fail(node_type, field, "must be an integer");
    constexpr int64_t lo = std::numeric_limits<int>::min();
    constexpr int64_t hi = std::numeric_limits<int>::max();
    if (v.is_number_unsigned()) {
        if (v.get<uint64_t>() > static_cast<uint64_t>(hi)) fail(node_type, field, "is out of range");
        return static_cast<int>(v.get<uint64_t>());
    }
    int64_t n = v.get<int64_t>();
    if (n < lo || n > hi) fail(node_type, field, "is out of range");
    return static_cast<int>(n);
}

std::optional<int> get_opt_int(const json& obj, const std::string& node_type, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    return checked_int(*it, node_type, field);
}

int get_int_or(const json& obj, const std::string& node_type, const char* field, int fallback) {
    auto v = get_opt_int(obj, node_type, field);
    return v ? *v : fallback;
}

bool get_bool_or(const json& obj, const std::string& node_type, const char* field, bool fallback) {
    auto it = obj.find(field);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) fail(node_type, field, "must be a boolean");
    return it->get<bool>();
}

const json& get_array(const json& obj, const std::string& node_type, const char* field) {
    const json& v = require(obj, node_type, field);
    if (!v.is_array()) fail(node_type, field, "must be an array");
    return v;
}

std::string node_type_of(const json& data) {
    if (!data.is_object())
        throw ParsingError("Invalid AST structure: node must be a JSON object", "node_type");
    auto it = data.find("node_type");
    if (it == data.end() || !it->is_string())
        throw ParsingError("Invalid AST structure: missing 'node_type' field", "node_type");
    return it->get<std::string>();
}

void expect_type(const json& data, std::string_view expected) {
    std::string type = node_type_of(data);
    if (type != expected)
        throw ParsingError("Invalid AST structure: expected " + std::string(expected) + ", got " + type,
                           type);
}

SourceLocation location_from_json(const json& data) {
    expect_type(data, "SourceLocation");
    const std::string t = "SourceLocation";
    SourceLocation loc;
    loc.format = get_string(data, t, "format");
    loc.page = get_opt_int(data, t, "page");
    loc.line = get_opt_int(data, t, "line");
    loc.column = get_opt_int(data, t, "column");
    loc.element_id = get_opt_string(data, t, "element_id");
    if (auto it = data.find("metadata"); it != data.end() && !it->is_null()) {
        if (!it->is_object()) fail(t, "metadata", "must be an object");
        loc.metadata = *it;
    }
    return loc;
}

template <typename T>
void read_common(const json& data, T& node) {
    const std::string t(NodeTraits<T>::name);
    if (auto it = data.find("metadata"); it != data.end() && !it->is_null()) {
        if (!it->is_object()) fail(t, "metadata", "must be an object");
        node.metadata = *it;
    }
    if (auto it = data.find("source_location"); it != data.end() && !it->is_null())
        node.source_location = location_from_json(*it);
}

// Nodes nested deeper than this are rejected rather than recursed into.
constexpr int kMaxDepth = 512;

Node decode_node(const json& data, int depth);

NodeList list_from_json(const json& data, const std::string& node_type, const char* field, int depth) {
    NodeList out;
    const json& arr = get_array(data, node_type, field);
    out.reserve(arr.size());
    for (const auto& child : arr) out.push_back(decode_node(child, depth + 1));
    return out;
}

template <typename T>
T content_holder_from_json(const json& data, int depth) {
    T node;
    node.content = list_from_json(data, std::string(NodeTraits<T>::name), "content", depth);
    read_common(data, node);
    return node;
}

template <typename T>
T math_from_json(const json& data) {
    const std::string t(NodeTraits<T>::name);
    T node;
    node.content = get_string(data, t, "content");
    node.notation = get_string_or(data, t, "notation", "latex");
    if (auto it = data.find("representations"); it != data.end() && !it->is_null()) {
        if (!it->is_object()) fail(t, "representations", "must be an object");
        for (auto r = it->begin(); r != it->end(); ++r) {
            if (!r->is_string()) fail(t, "representations", "values must be strings");
            node.representations[r.key()] = r->template get<std::string>();
        }
    }
    read_common(data, node);
    return node;
}

ListItem list_item_from_json(const json& data, int depth) {
    expect_type(data, NodeTraits<ListItem>::name);
    const std::string t = "ListItem";
    ListItem item;
    item.children = list_from_json(data, t, "children", depth);
    item.task_status = get_opt_string(data, t, "task_status");
    read_common(data, item);
    return item;
}

TableCell cell_from_json(const json& data, int depth) {
    expect_type(data, NodeTraits<TableCell>::name);
    const std::string t = "TableCell";
    TableCell cell;
    cell.content = list_from_json(data, t, "content", depth);
    cell.colspan = get_int_or(data, t, "colspan", 1);
    cell.rowspan = get_int_or(data, t, "rowspan", 1);
    cell.alignment = get_opt_string(data, t, "alignment");
    read_common(data, cell);
    return cell;
}

TableRow row_from_json(const json& data, int depth) {
    expect_type(data, NodeTraits<TableRow>::name);
    const std::string t = "TableRow";
    TableRow row;
    for (const auto& c : get_array(data, t, "cells")) row.cells.push_back(cell_from_json(c, depth));
    row.is_header = get_bool_or(data, t, "is_header", false);
    read_common(data, row);
    return row;
}

template <typename T>
T definition_part_from_json(const json& data, int depth) {
    expect_type(data, NodeTraits<T>::name);
    return content_holder_from_json<T>(data, depth);
}

} // namespace

// =============================================================================
//  Public encoding
// =============================================================================

json node_to_json(const Node& node) {
    return std::visit([](const auto& n) -> json {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Heading>) {
            json j = base_object(n);
            j["level"] = n.level;
            j["content"] = list_to_json(n.content);
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, Paragraph> || std::is_same_v<T, Emphasis> ||
                             std::is_same_v<T, Strong> || std::is_same_v<T, Strikethrough> ||
                             std::is_same_v<T, Underline> || std::is_same_v<T, Superscript> ||
                             std::is_same_v<T, Subscript>) {
            return content_holder_to_json(n);
        } else if constexpr (std::is_same_v<T, CodeBlock>) {
            json j = base_object(n);
            j["content"] = n.content;
            if (n.language) j["language"] = *n.language;
            j["fence_char"] = n.fence_char;
            j["fence_length"] = n.fence_length;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, BlockQuote>) {
            json j = base_object(n);
            j["children"] = list_to_json(n.children);
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, List>) {
            json j = base_object(n);
            j["ordered"] = n.ordered;
            json items = json::array();
            for (const auto& item : n.items) items.push_back(list_item_to_json(item));
            j["items"] = std::move(items);
            j["start"] = n.start;
            j["tight"] = n.tight;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, Table>) {
            json j = base_object(n);
            json rows = json::array();
            for (const auto& r : n.rows) rows.push_back(row_to_json(r));
            j["rows"] = std::move(rows);
            if (n.header) j["header"] = row_to_json(*n.header);
            if (!n.alignments.empty()) j["alignments"] = n.alignments;
            if (n.caption) j["caption"] = *n.caption;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, ThematicBreak>) {
            json j = base_object(n);
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, HTMLBlock> || std::is_same_v<T, HTMLInline> ||
                             std::is_same_v<T, Text> || std::is_same_v<T, Code>) {
            json j = base_object(n);
            j["content"] = n.content;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, MathBlock> || std::is_same_v<T, MathInline>) {
            return math_to_json(n);
        } else if constexpr (std::is_same_v<T, DefinitionList>) {
            json j = base_object(n);
            json items = json::array();
            for (const auto& item : n.items) {
                json descs = json::array();
                for (const auto& d : item.descriptions) descs.push_back(content_holder_to_json(d));
                items.push_back(json{{"term", content_holder_to_json(item.term)},
                                     {"descriptions", std::move(descs)}});
            }
            j["items"] = std::move(items);
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, FootnoteDefinition>) {
            json j = base_object(n);
            j["identifier"] = n.identifier;
            j["content"] = list_to_json(n.content);
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, FootnoteReference>) {
            json j = base_object(n);
            j["identifier"] = n.identifier;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, Link>) {
            json j = base_object(n);
            j["url"] = n.url;
            j["content"] = list_to_json(n.content);
            if (n.title) j["title"] = *n.title;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, Image>) {
            json j = base_object(n);
            j["url"] = n.url;
            j["alt_text"] = n.alt_text;
            if (n.title) j["title"] = *n.title;
            if (n.width) j["width"] = *n.width;
            if (n.height) j["height"] = *n.height;
            finish(j, n);
            return j;
        } else if constexpr (std::is_same_v<T, LineBreak>) {
            json j = base_object(n);
            j["soft"] = n.soft;
            finish(j, n);
            return j;
        } else {
            static_assert(always_false<T>, "unhandled node type");
        }
    }, node.value);
}

json document_to_json(const Document& doc) {
    json j = base_object(doc);
    j["schema_version"] = kSchemaVersion;
    j["children"] = list_to_json(doc.children);
    finish(j, doc);
    return j;
}

std::string to_json_string(const Document& doc, int indent) {
    return document_to_json(doc).dump(indent < 0 ? -1 : indent);
}

// =============================================================================
//  Public decoding
// =============================================================================

namespace {

Node decode_node(const json& data, int depth) {
    if (depth > kMaxDepth)
        throw ParsingError("Invalid AST structure: nesting exceeds " + std::to_string(kMaxDepth) + " levels",
                           "content");
    const std::string t = node_type_of(data);

    if (t == "Heading") {
        Heading h;
        h.level = get_int_or(data, t, "level", 1);
        if (h.level < 1 || h.level > 6) fail(t, "level", "must be between 1 and 6");
        h.content = list_from_json(data, t, "content", depth);
        read_common(data, h);
        return h;
    }
    if (t == "Paragraph")     return content_holder_from_json<Paragraph>(data, depth);
    if (t == "Emphasis")      return content_holder_from_json<Emphasis>(data, depth);
    if (t == "Strong")        return content_holder_from_json<Strong>(data, depth);
    if (t == "Strikethrough") return content_holder_from_json<Strikethrough>(data, depth);
    if (t == "Underline")     return content_holder_from_json<Underline>(data, depth);
    if (t == "Superscript")   return content_holder_from_json<Superscript>(data, depth);
    if (t == "Subscript")     return content_holder_from_json<Subscript>(data, depth);
    if (t == "CodeBlock") {
        CodeBlock c;
        c.content = get_string(data, t, "content");
        c.language = get_opt_string(data, t, "language");
        c.fence_char = get_string_or(data, t, "fence_char", "`");
        c.fence_length = get_int_or(data, t, "fence_length", 3);
        read_common(data, c);
        return c;
    }
    if (t == "BlockQuote") {
        BlockQuote q;
        q.children = list_from_json(data, t, "children", depth);
        read_common(data, q);
        return q;
    }
    if (t == "List") {
        List l;
        l.ordered = get_bool_or(data, t, "ordered", false);
        for (const auto& item : get_array(data, t, "items")) l.items.push_back(list_item_from_json(item, depth));
        l.start = get_int_or(data, t, "start", 1);
        l.tight = get_bool_or(data, t, "tight", true);
        read_common(data, l);
        return l;
    }
    if (t == "Table") {
        Table tb;
        for (const auto& r : get_array(data, t, "rows")) tb.rows.push_back(row_from_json(r, depth));
        if (auto it = data.find("header"); it != data.end() && !it->is_null())
            tb.header = row_from_json(*it, depth);
        if (auto it = data.find("alignments"); it != data.end() && !it->is_null()) {
            if (!it->is_array()) fail(t, "alignments", "must be an array");
            for (const auto& a : *it) {
                if (a.is_null()) tb.alignments.emplace_back();
                else if (a.is_string()) tb.alignments.push_back(a.get<std::string>());
                else fail(t, "alignments", "entries must be strings");
            }
        }
        tb.caption = get_opt_string(data, t, "caption");
        read_common(data, tb);
        return tb;
    }
    if (t == "ThematicBreak") {
        ThematicBreak b;
        read_common(data, b);
        return b;
    }
    if (t == "HTMLBlock") {
        HTMLBlock b;
        b.content = get_string(data, t, "content");
        read_common(data, b);
        return b;
    }
    if (t == "HTMLInline") {
        HTMLInline h;
        h.content = get_string(data, t, "content");
        read_common(data, h);
        return h;
    }
    if (t == "Text") {
        Text x;
        x.content = get_string(data, t, "content");
        read_common(data, x);
        return x;
    }
    if (t == "Code") {
        Code c;
        c.content = get_string(data, t, "content");
        read_common(data, c);
        return c;
    }
    if (t == "MathBlock")  return math_from_json<MathBlock>(data);
    if (t == "MathInline") return math_from_json<MathInline>(data);
    if (t == "DefinitionList") {
        DefinitionList dl;
        for (const auto& item : get_array(data, t, "items")) {
            if (!item.is_object()) fail(t, "items", "entries must be objects");
            DefinitionItem di;
            di.term = definition_part_from_json<DefinitionTerm>(require(item, t, "term"), depth);
            for (const auto& d : get_array(item, t, "descriptions"))
                di.descriptions.push_back(definition_part_from_json<DefinitionDescription>(d, depth));
            dl.items.push_back(std::move(di));
        }
        read_common(data, dl);
        return dl;
    }
    if (t == "FootnoteDefinition") {
        FootnoteDefinition f;
        f.identifier = get_string(data, t, "identifier");
        f.content = list_from_json(data, t, "content", depth);
        read_common(data, f);
        return f;
    }
    if (t == "FootnoteReference") {
        FootnoteReference f;
        f.identifier = get_string(data, t, "identifier");
        read_common(data, f);
        return f;
    }
    if (t == "Link") {
        Link l;
        l.url = get_string(data, t, "url");
        l.content = list_from_json(data, t, "content", depth);
        l.title = get_opt_string(data, t, "title");
        read_common(data, l);
        return l;
    }
    if (t == "Image") {
        Image i;
        i.url = get_string(data, t, "url");
        i.alt_text = get_string_or(data, t, "alt_text", "");
        i.title = get_opt_string(data, t, "title");
        i.width = get_opt_int(data, t, "width");
        i.height = get_opt_int(data, t, "height");
        read_common(data, i);
        return i;
    }
    if (t == "LineBreak") {
        LineBreak b;
        b.soft = get_bool_or(data, t, "soft", false);
        read_common(data, b);
        return b;
    }
    if (t == "Document")
        throw ParsingError("Invalid AST structure: Document may only appear as the root", t);

    throw ParsingError("Invalid AST structure: unknown node type '" + t + "'", t);
}

} // namespace

Node node_from_json(const json& data) {
    return decode_node(data, 0);
}

Document document_from_json(const json& data) {
    if (!data.is_object())
        throw ParsingError("AST root must be a Document node", "node_type");

    const std::string t = node_type_of(data);
    if (t != "Document")
        throw ParsingError("AST root must be a Document node, got " + t, t);

    if (auto it = data.find("schema_version"); it != data.end()) {
        int version = checked_int(*it, t, "schema_version");
        if (version != kSchemaVersion)
            throw ParsingError("Invalid AST structure: unsupported schema_version " + std::to_string(version) +
                               " (supported: " + std::to_string(kSchemaVersion) + ")", "schema_version");
    }

    Document doc;
    doc.children = list_from_json(data, t, "children", 0);
    read_common(data, doc);
    return doc;
}

Document parse_ast_json(std::string_view text) {
    json data;
    try {
        data = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw ParsingError(std::string("Invalid JSON: ") + e.what(), "json");
    }
    return document_from_json(data);
}

} // namespace Polydoc
