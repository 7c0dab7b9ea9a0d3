#pragma once

/**
 * @file builtin_transforms.hpp
 * @brief Transforms shipped with the core and registered by
 * TransformRegistry::initialize().
 */

#include <ast/transformer.hpp>
#include <transforms/transform_metadata.hpp>
#include <export.hpp>
#include <cstdint>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace Polydoc {

class POLYDOC_API RemoveImagesTransform : public NodeTransformer {
protected:
    std::optional<Node> visit_image(Image) override { return std::nullopt; }
};

/// Removes nodes whose snake_case type key (e.g. "code_block") is listed.
class POLYDOC_API RemoveNodesTransform : public NodeTransformer {
public:
    /// @throws ValidationError for "document" or an unknown key.
    explicit RemoveNodesTransform(std::vector<std::string> node_types);

    std::optional<Node> transform_node(Node node) override;

protected:
    std::optional<ListItem> visit_list_item(ListItem node) override;
    std::optional<TableRow> visit_table_row(TableRow node) override;
    std::optional<TableCell> visit_table_cell(TableCell node) override;
    std::optional<Node> visit_definition_list(DefinitionList node) override;

private:
    std::set<std::string> types_;
};

/// Shifts heading levels by @p offset, clamped to 1..6.
class POLYDOC_API HeadingOffsetTransform : public NodeTransformer {
public:
    explicit HeadingOffsetTransform(int64_t offset = 1) : offset_(offset) {}

protected:
    std::optional<Node> visit_heading(Heading node) override;

private:
    int64_t offset_;
};

/// ECMAScript regex substitution on link URLs.
class POLYDOC_API LinkRewriterTransform : public NodeTransformer {
public:
    /// @throws ValidationError if @p pattern is not a valid regex.
    LinkRewriterTransform(const std::string& pattern, std::string replacement);

protected:
    std::optional<Node> visit_link(Link node) override;

private:
    std::regex pattern_;
    std::string replacement_;
};

/// Literal find/replace in every Text node.
class POLYDOC_API TextReplacerTransform : public NodeTransformer {
public:
    /// @throws ValidationError if @p find is empty.
    TextReplacerTransform(std::string find, std::string replace);

protected:
    std::optional<Node> visit_text(Text node) override;

private:
    std::string find_;
    std::string replace_;
};

/**
 * @brief Stores a slug of each heading's text in its metadata "id".
 * Repeated slugs get the separator and an occurrence number appended.
 */
class POLYDOC_API AddHeadingIdsTransform : public NodeTransformer {
public:
    explicit AddHeadingIdsTransform(std::string id_prefix = "", std::string separator = "-");

    Document transform(Document doc) override;

protected:
    std::optional<Node> visit_heading(Heading node) override;

private:
    std::string id_prefix_;
    std::string separator_;
    std::map<std::string, int> counts_;
};

/// Drops paragraphs whose trimmed text matches any pattern (case-insensitive).
class POLYDOC_API RemoveBoilerplateTransform : public NodeTransformer {
public:
    static const std::vector<std::string>& default_patterns();

    /// @throws ValidationError if a pattern is not a valid regex.
    explicit RemoveBoilerplateTransform(const std::vector<std::string>& patterns = default_patterns());

protected:
    std::optional<Node> visit_paragraph(Paragraph node) override;

private:
    std::vector<std::regex> patterns_;
};

/// Writes the conversion time into document metadata ("iso", "unix" or a strftime format).
class POLYDOC_API AddConversionTimestampTransform : public NodeTransformer {
public:
    explicit AddConversionTimestampTransform(std::string field_name = "conversion_timestamp",
                                             std::string format = "iso");

    Document transform(Document doc) override;

private:
    std::string field_name_;
    std::string format_;
};

class POLYDOC_API CalculateWordCountTransform : public NodeTransformer {
public:
    explicit CalculateWordCountTransform(std::string word_field = "word_count",
                                         std::string char_field = "char_count");

    Document transform(Document doc) override;

private:
    std::string word_field_;
    std::string char_field_;
};

/**
 * @brief Inserts a nested list of links to headings up to @p max_level at the
 * top of the document. Relies on heading ids from add-heading-ids.
 */
class POLYDOC_API GenerateTocTransform : public NodeTransformer {
public:
    explicit GenerateTocTransform(int max_level = 3, std::string title = "Table of Contents");

    Document transform(Document doc) override;

private:
    int max_level_;
    std::string title_;
};

/// Metadata for every built-in transform, in registration order.
POLYDOC_API std::vector<TransformMetadata> builtin_transform_metadata();

} // namespace Polydoc
