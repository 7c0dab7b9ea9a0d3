#pragma once

/**
 * @file serialization.hpp
 * @brief JSON interchange form of the AST.
 *
 * The root object is a Document carrying "schema_version"; every node object
 * carries a "node_type" discriminator matching NodeTraits<T>::name.
 */

#include <ast/nodes.hpp>
#include <export.hpp>
#include <string>
#include <string_view>

namespace Polydoc {

inline constexpr int kSchemaVersion = 1;

POLYDOC_API json node_to_json(const Node& node);
POLYDOC_API json document_to_json(const Document& doc);

/// @param indent negative for compact output.
POLYDOC_API std::string to_json_string(const Document& doc, int indent = 2);

/// @throws ParsingError naming the offending field or discriminator.
POLYDOC_API Node node_from_json(const json& data);

/**
 * @brief Rebuilds a Document from its JSON form.
 * @throws ParsingError if the root is not a Document, the schema version is
 *         unsupported, or any nested node is malformed.
 */
POLYDOC_API Document document_from_json(const json& data);

/// Parses text first; invalid JSON is reported as a ParsingError.
POLYDOC_API Document parse_ast_json(std::string_view text);

} // namespace Polydoc
