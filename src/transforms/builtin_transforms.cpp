#include <transforms/builtin_transforms.hpp>
#include <ast/visitor.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <algorithm>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace Polydoc {

namespace {

std::regex compile(const std::string& pattern, std::regex::flag_type flags, const std::string& owner) {
    try {
        return std::regex(pattern, flags);
    } catch (const std::regex_error& e) {
        throw ValidationError("Invalid regex '" + pattern + "' for " + owner + ": " + e.what(), pattern);
    }
}

size_t utf8_length(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

size_t count_words(const std::string& s) {
    size_t words = 0;
    bool in_word = false;
    for (char c : s) {
        bool space = std::isspace(static_cast<unsigned char>(c));
        if (!space && !in_word) ++words;
        in_word = !space;
    }
    return words;
}

} // namespace

// =============================================================================
//  remove-nodes
// =============================================================================

RemoveNodesTransform::RemoveNodesTransform(std::vector<std::string> node_types) {
    const auto& known = all_node_type_keys();
    for (auto& t : node_types) {
        if (t == NodeTraits<Document>::key)
            throw ValidationError("Cannot remove the document root", t);
        if (std::find(known.begin(), known.end(), t) == known.end())
            throw ValidationError("Unknown node type '" + t + "'", t);
        types_.insert(std::move(t));
    }
}

std::optional<Node> RemoveNodesTransform::transform_node(Node node) {
    if (types_.count(std::string(node.type_key()))) return std::nullopt;
    return NodeTransformer::transform_node(std::move(node));
}

std::optional<ListItem> RemoveNodesTransform::visit_list_item(ListItem node) {
    if (types_.count(std::string(NodeTraits<ListItem>::key))) return std::nullopt;
    return NodeTransformer::visit_list_item(std::move(node));
}

std::optional<TableRow> RemoveNodesTransform::visit_table_row(TableRow node) {
    if (types_.count(std::string(NodeTraits<TableRow>::key))) return std::nullopt;
    return NodeTransformer::visit_table_row(std::move(node));
}

std::optional<TableCell> RemoveNodesTransform::visit_table_cell(TableCell node) {
    if (types_.count(std::string(NodeTraits<TableCell>::key))) return std::nullopt;
    return NodeTransformer::visit_table_cell(std::move(node));
}

std::optional<Node> RemoveNodesTransform::visit_definition_list(DefinitionList node) {
    bool drop_terms = types_.count(std::string(NodeTraits<DefinitionTerm>::key)) > 0;
    bool drop_descs = types_.count(std::string(NodeTraits<DefinitionDescription>::key)) > 0;

    std::vector<DefinitionItem> items;
    for (auto& item : node.items) {
        if (drop_terms) continue;
        item.term.content = transform_list(std::move(item.term.content));
        if (drop_descs) {
            item.descriptions.clear();
        } else {
            for (auto& d : item.descriptions) d.content = transform_list(std::move(d.content));
        }
        items.push_back(std::move(item));
    }
    node.items = std::move(items);
    return Node(std::move(node));
}

// =============================================================================
//  heading-offset
// =============================================================================

std::optional<Node> HeadingOffsetTransform::visit_heading(Heading node) {
    // Any shift beyond 6 saturates, so clamp it first to keep the sum in range.
    int64_t shift = std::clamp<int64_t>(offset_, -6, 6);
    node.level = static_cast<int>(std::clamp<int64_t>(node.level + shift, 1, 6));
    return NodeTransformer::visit_heading(std::move(node));
}

// =============================================================================
//  link-rewriter
// =============================================================================

LinkRewriterTransform::LinkRewriterTransform(const std::string& pattern, std::string replacement)
    : pattern_(compile(pattern, std::regex::ECMAScript, "link-rewriter")),
      replacement_(std::move(replacement)) {}

std::optional<Node> LinkRewriterTransform::visit_link(Link node) {
    node.url = std::regex_replace(node.url, pattern_, replacement_);
    return NodeTransformer::visit_link(std::move(node));
}

// =============================================================================
//  text-replacer
// =============================================================================

TextReplacerTransform::TextReplacerTransform(std::string find, std::string replace)
    : find_(std::move(find)), replace_(std::move(replace)) {
    if (find_.empty()) throw ValidationError("text-replacer: 'find' must not be empty", "find");
}

std::optional<Node> TextReplacerTransform::visit_text(Text node) {
    std::string& s = node.content;
    size_t pos = 0;
    while ((pos = s.find(find_, pos)) != std::string::npos) {
        s.replace(pos, find_.size(), replace_);
        pos += replace_.size();
    }
    return Node(std::move(node));
}

// =============================================================================
//  add-heading-ids
// =============================================================================

AddHeadingIdsTransform::AddHeadingIdsTransform(std::string id_prefix, std::string separator)
    : id_prefix_(std::move(id_prefix)), separator_(std::move(separator)) {}

Document AddHeadingIdsTransform::transform(Document doc) {
    counts_.clear();
    return NodeTransformer::transform(std::move(doc));
}

std::optional<Node> AddHeadingIdsTransform::visit_heading(Heading node) {
    std::string slug = slugify(extract_text(node.content), separator_);
    if (slug.empty()) slug = "heading";

    int& seen = counts_[slug];
    ++seen;
    if (seen > 1) slug += separator_ + std::to_string(seen);

    if (!node.metadata.is_object()) node.metadata = json::object();
    node.metadata["id"] = id_prefix_ + slug;
    return NodeTransformer::visit_heading(std::move(node));
}

// =============================================================================
//  remove-boilerplate
// =============================================================================

const std::vector<std::string>& RemoveBoilerplateTransform::default_patterns() {
    static const std::vector<std::string> patterns = {
        R"(^CONFIDENTIAL$)",
        R"(^Page \d+ of \d+$)",
        R"(^Internal Use Only$)",
        R"(^\[DRAFT\]$)",
        R"(^Copyright \d{4})",
        R"(^Printed on \d{4}-\d{2}-\d{2}$)",
    };
    return patterns;
}

RemoveBoilerplateTransform::RemoveBoilerplateTransform(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns)
        patterns_.push_back(compile(p, std::regex::ECMAScript | std::regex::icase, "remove-boilerplate"));
}

std::optional<Node> RemoveBoilerplateTransform::visit_paragraph(Paragraph node) {
    std::string text = trim(extract_text(node.content));
    for (const auto& re : patterns_) {
        if (std::regex_search(text, re)) return std::nullopt;
    }
    return NodeTransformer::visit_paragraph(std::move(node));
}

// =============================================================================
//  add-conversion-timestamp
// =============================================================================

AddConversionTimestampTransform::AddConversionTimestampTransform(std::string field_name, std::string format)
    : field_name_(std::move(field_name)), format_(std::move(format)) {
    if (field_name_.empty())
        throw ValidationError("add-conversion-timestamp: 'field_name' must not be empty", "field_name");
}

Document AddConversionTimestampTransform::transform(Document doc) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::string stamp;
    if (format_ == "unix") {
        stamp = std::to_string(static_cast<long long>(t));
    } else {
        std::tm local{};
        localtime_r(&t, &local);
        std::ostringstream ss;
        ss << std::put_time(&local, format_ == "iso" ? "%Y-%m-%dT%H:%M:%S" : format_.c_str());
        stamp = ss.str();
    }

    if (!doc.metadata.is_object()) doc.metadata = json::object();
    doc.metadata[field_name_] = stamp;
    return NodeTransformer::transform(std::move(doc));
}

// =============================================================================
//  calculate-word-count
// =============================================================================

CalculateWordCountTransform::CalculateWordCountTransform(std::string word_field, std::string char_field)
    : word_field_(std::move(word_field)), char_field_(std::move(char_field)) {}

Document CalculateWordCountTransform::transform(Document doc) {
    std::string text = extract_document_text(doc, " ");
    if (!doc.metadata.is_object()) doc.metadata = json::object();
    doc.metadata[word_field_] = count_words(text);
    doc.metadata[char_field_] = utf8_length(text);
    return doc;
}

// =============================================================================
//  generate-toc
// =============================================================================

namespace {

struct TocEntry {
    int level;
    std::string text;
    std::string id;
};

ListItem toc_item(const TocEntry& e) {
    Link link;
    link.url = "#" + e.id;
    link.content.push_back(Text{e.text});
    ListItem item;
    item.children.push_back(Paragraph{{std::move(link)}});
    return item;
}

List build_toc(const std::vector<TocEntry>& entries, size_t& i, int level) {
    List list;
    while (i < entries.size() && entries[i].level >= level) {
        if (entries[i].level == level) {
            list.items.push_back(toc_item(entries[i]));
            ++i;
        } else {
            List nested = build_toc(entries, i, entries[i].level);
            if (list.items.empty()) list.items.emplace_back();
            list.items.back().children.push_back(std::move(nested));
        }
    }
    return list;
}

} // namespace

GenerateTocTransform::GenerateTocTransform(int max_level, std::string title)
    : max_level_(max_level), title_(std::move(title)) {
    if (max_level_ < 1 || max_level_ > 6)
        throw ValidationError("generate-toc: 'max_level' must be between 1 and 6", "max_level");
}

Document GenerateTocTransform::transform(Document doc) {
    std::vector<TocEntry> entries;
    for (const auto& child : doc.children) {
        const auto* h = child.get_if<Heading>();
        if (!h || h->level > max_level_) continue;
        std::string text = extract_text(h->content);
        std::string id;
        if (h->metadata.is_object() && h->metadata.contains("id") && h->metadata["id"].is_string())
            id = h->metadata["id"].get<std::string>();
        else
            id = slugify(text);
        entries.push_back({h->level, std::move(text), std::move(id)});
    }
    if (entries.empty()) return doc;

    int top = std::min_element(entries.begin(), entries.end(),
                               [](const TocEntry& a, const TocEntry& b) { return a.level < b.level; })->level;
    size_t i = 0;
    List toc = build_toc(entries, i, top);
    toc.metadata["toc"] = true;

    NodeList children;
    children.reserve(doc.children.size() + 2);
    if (!title_.empty()) children.push_back(make_heading(top, {Text{title_}}));
    children.push_back(std::move(toc));
    for (auto& c : doc.children) children.push_back(std::move(c));
    doc.children = std::move(children);
    return doc;
}

// =============================================================================
//  Registration metadata
// =============================================================================

namespace {

ParameterSpec string_param(std::string help, std::optional<std::string> def = std::nullopt) {
    ParameterSpec spec;
    spec.type = ParamType::String;
    spec.help = std::move(help);
    if (def) spec.default_value = *def;
    else spec.required = true;
    return spec;
}

ParameterSpec int_param(std::string help, int64_t def) {
    ParameterSpec spec;
    spec.type = ParamType::Int;
    spec.help = std::move(help);
    spec.default_value = def;
    return spec;
}

} // namespace

std::vector<TransformMetadata> builtin_transform_metadata() {
    std::vector<TransformMetadata> all;

    {
        TransformMetadata m;
        m.name = "remove-images";
        m.description = "Remove all image nodes";
        m.factory = [](const TransformParams&) -> TransformPtr { return std::make_unique<RemoveImagesTransform>(); };
        m.tags = {"images", "cleanup"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "remove-nodes";
        m.description = "Remove nodes of the listed types";
        ParameterSpec types;
        types.type = ParamType::StringList;
        types.required = true;
        types.help = "Node type keys to remove, e.g. image,table,code_block";
        m.parameters["node_types"] = std::move(types);
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<RemoveNodesTransform>(p.get<std::vector<std::string>>("node_types"));
        };
        m.tags = {"cleanup"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "heading-offset";
        m.description = "Shift heading levels";
        m.parameters["offset"] = int_param("Levels to shift (negative to promote)", 1);
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<HeadingOffsetTransform>(p.get<int64_t>("offset"));
        };
        m.tags = {"headings"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "link-rewriter";
        m.description = "Rewrite link URLs with a regular expression";
        m.parameters["pattern"] = string_param("Regex matched against each URL");
        m.parameters["replacement"] = string_param("Replacement; $1, $2 refer to groups");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<LinkRewriterTransform>(p.get<std::string>("pattern"),
                                                           p.get<std::string>("replacement"));
        };
        m.tags = {"links"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "text-replacer";
        m.description = "Replace literal text in text nodes";
        m.parameters["find"] = string_param("Text to find");
        m.parameters["replace"] = string_param("Replacement text");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<TextReplacerTransform>(p.get<std::string>("find"),
                                                           p.get<std::string>("replace"));
        };
        m.tags = {"text"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "add-heading-ids";
        m.description = "Add slug ids to headings";
        m.parameters["id_prefix"] = string_param("Prefix for every id", "");
        m.parameters["separator"] = string_param("Word and duplicate separator", "-");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<AddHeadingIdsTransform>(p.get<std::string>("id_prefix"),
                                                            p.get<std::string>("separator"));
        };
        m.priority = 50;
        m.tags = {"headings", "ids"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "remove-boilerplate";
        m.description = "Remove paragraphs matching boilerplate patterns";
        ParameterSpec patterns;
        patterns.type = ParamType::StringList;
        patterns.default_value = RemoveBoilerplateTransform::default_patterns();
        patterns.help = "Case-insensitive regex patterns";
        m.parameters["patterns"] = std::move(patterns);
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<RemoveBoilerplateTransform>(p.get<std::vector<std::string>>("patterns"));
        };
        m.tags = {"cleanup", "text"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "add-conversion-timestamp";
        m.description = "Record the conversion time in document metadata";
        m.parameters["field_name"] = string_param("Metadata key", "conversion_timestamp");
        m.parameters["format"] = string_param("\"iso\", \"unix\" or a strftime format", "iso");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<AddConversionTimestampTransform>(p.get<std::string>("field_name"),
                                                                     p.get<std::string>("format"));
        };
        m.tags = {"metadata"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "calculate-word-count";
        m.description = "Record word and character counts in document metadata";
        m.parameters["word_field"] = string_param("Metadata key for the word count", "word_count");
        m.parameters["char_field"] = string_param("Metadata key for the character count", "char_count");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<CalculateWordCountTransform>(p.get<std::string>("word_field"),
                                                                 p.get<std::string>("char_field"));
        };
        m.tags = {"metadata", "analysis"};
        all.push_back(std::move(m));
    }
    {
        TransformMetadata m;
        m.name = "generate-toc";
        m.description = "Insert a table of contents built from headings";
        ParameterSpec level = int_param("Deepest heading level listed", 3);
        level.validator = [](const ParamValue& v) {
            auto l = std::get<int64_t>(v);
            return l >= 1 && l <= 6;
        };
        m.parameters["max_level"] = std::move(level);
        m.parameters["title"] = string_param("Heading above the list; empty for none", "Table of Contents");
        m.factory = [](const TransformParams& p) -> TransformPtr {
            return std::make_unique<GenerateTocTransform>(static_cast<int>(p.get<int64_t>("max_level")),
                                                          p.get<std::string>("title"));
        };
        m.dependencies = {"add-heading-ids"};
        m.priority = 150;
        m.tags = {"headings", "navigation"};
        all.push_back(std::move(m));
    }

    return all;
}

} // namespace Polydoc
