#pragma once

/**
 * @file builtin_converters.hpp
 * @brief Converters that need nothing beyond the core: the JSON AST
 * interchange format ("ast") and plain text ("plaintext").
 */

#include <converters/converter_registry.hpp>
#include <converters/parser.hpp>
#include <converters/renderer.hpp>
#include <export.hpp>

namespace Polydoc {

inline constexpr const char* kAstMimeType = "application/vnd.polydoc.ast+json";

class POLYDOC_API AstParser : public Parser {
public:
    Document parse(InputSource& input) override;
};

class POLYDOC_API AstRenderer : public Renderer {
public:
    /// Negative indent renders compact JSON.
    explicit AstRenderer(int indent = 2) : indent_(indent) {}

    void render(const Document& doc, OutputTarget& out) override;
    std::string render_to_string(const Document& doc) override;

private:
    int indent_;
};

/// Blank-line separated blocks become paragraphs of text.
class POLYDOC_API PlainTextParser : public Parser {
public:
    Document parse(InputSource& input) override;
};

class POLYDOC_API PlainTextRenderer : public Renderer {
public:
    void render(const Document& doc, OutputTarget& out) override;
};

POLYDOC_API ConverterMetadata ast_converter_metadata();
POLYDOC_API ConverterMetadata plaintext_converter_metadata();

/// Registers both converters plus the named factories they reference.
POLYDOC_API void register_builtin_converters(ConverterRegistry& registry);

} // namespace Polydoc
