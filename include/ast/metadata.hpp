#pragma once

/**
 * @file metadata.hpp
 * @brief Typed view of the well-known Document metadata keys.
 */

#include <ast/nodes.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Polydoc {

struct POLYDOC_API DocumentMetadata {
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::optional<std::string> subject;
    std::vector<std::string> keywords;
    std::optional<std::string> creation_date;
    std::optional<std::string> modification_date;
    std::optional<std::string> creator;
    std::optional<std::string> producer;
    std::optional<std::string> category;
    std::optional<std::string> language;
    json custom = json::object();

    /// Unknown keys land in custom; a comma separated "keywords" string is split.
    static DocumentMetadata from_json(const json& metadata);

    /// Only set fields are emitted; custom keys are merged at top level.
    json to_json() const;

    bool empty() const;

    /// Writes every set field into @p doc, leaving unrelated keys untouched.
    void apply_to(Document& doc) const;
};

} // namespace Polydoc
