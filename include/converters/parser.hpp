#pragma once

/**
 * @file parser.hpp
 * @brief Contract every input-format converter implements.
 */

#include <ast/metadata.hpp>
#include <ast/nodes.hpp>
#include <io/input_source.hpp>
#include <export.hpp>
#include <functional>
#include <memory>

namespace Polydoc {

class POLYDOC_API Parser {
public:
    virtual ~Parser() = default;

    /// @throws ParsingError on malformed input.
    virtual Document parse(InputSource& input) = 0;

    virtual DocumentMetadata extract_metadata(const Document& doc) const {
        return DocumentMetadata::from_json(doc.metadata);
    }
};

using ParserPtr = std::unique_ptr<Parser>;

/// Receives the caller's parser options; rejects malformed ones with ValidationError.
using ParserFactory = std::function<ParserPtr(const json& options)>;

} // namespace Polydoc
