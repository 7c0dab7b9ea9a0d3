#include <converters/builtin_converters.hpp>
#include <ast/serialization.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <sstream>
#include <vector>

namespace Polydoc {

namespace {

void reject_unknown_options(const json& options, const std::string& owner,
                            std::initializer_list<const char*> allowed) {
    if (options.is_null()) return;
    if (!options.is_object())
        throw ValidationError("Options for " + owner + " must be an object", owner);
    for (auto& [key, _] : options.items()) {
        bool known = false;
        for (const char* a : allowed) known = known || key == a;
        if (!known) throw ValidationError("Unknown option '" + key + "' for " + owner, key);
    }
}

// =============================================================================
//  Plain text rendering
// =============================================================================

class PlainTextWriter {
public:
    std::string write(const Document& doc) {
        for (const auto& child : doc.children) block(child, "");
        std::string result = trim(out_);
        if (!result.empty()) result += '\n';
        return result;
    }

private:
    void emit(const std::string& text, const std::string& indent) {
        if (text.empty()) return;
        if (!out_.empty()) out_ += "\n\n";
        bool line_start = true;
        for (char c : text) {
            if (line_start) out_ += indent;
            out_ += c;
            line_start = c == '\n';
        }
    }

    /// One line per item; nested lists are indented under their item.
    static void list_lines(const List& list, const std::string& pad, std::string& text) {
        int number = list.start;
        for (const auto& item : list.items) {
            std::string marker = list.ordered ? std::to_string(number++) + ". " : "- ";
            if (item.task_status) marker += *item.task_status == "checked" ? "[x] " : "[ ] ";

            std::string body;
            std::vector<const List*> nested;
            for (const auto& child : item.children) {
                if (const auto* sub = child.get_if<List>()) {
                    nested.push_back(sub);
                    continue;
                }
                std::string part = extract_text(child);
                if (part.empty()) continue;
                if (!body.empty()) body += ' ';
                body += part;
            }

            if (!text.empty()) text += '\n';
            text += pad + marker + body;
            for (const auto* sub : nested) list_lines(*sub, pad + "  ", text);
        }
    }

    void blocks(const NodeList& nodes, const std::string& indent) {
        for (const auto& n : nodes) block(n, indent);
    }

    void block(const Node& node, const std::string& indent) {
        if (const auto* list = node.get_if<List>()) {
            std::string text;
            list_lines(*list, "", text);
            emit(text, indent);
        } else if (const auto* quote = node.get_if<BlockQuote>()) {
            blocks(quote->children, indent + "> ");
        } else if (const auto* table = node.get_if<Table>()) {
            std::vector<const TableRow*> rows;
            if (table->header) rows.push_back(&*table->header);
            for (const auto& r : table->rows) rows.push_back(&r);
            std::string text;
            for (const auto* row : rows) {
                std::vector<std::string> cells;
                for (const auto& c : row->cells) cells.push_back(extract_text(c.content));
                if (!text.empty()) text += '\n';
                text += join(cells, " | ");
            }
            if (table->caption) text = *table->caption + "\n" + text;
            emit(text, indent);
        } else if (node.is<ThematicBreak>()) {
            emit("---", indent);
        } else if (const auto* dl = node.get_if<DefinitionList>()) {
            for (const auto& item : dl->items) {
                std::string text = extract_text(item.term.content);
                for (const auto& d : item.descriptions) text += "\n  " + extract_text(d.content);
                emit(text, indent);
            }
        } else if (const auto* fn = node.get_if<FootnoteDefinition>()) {
            emit("[" + fn->identifier + "] " + extract_text(fn->content), indent);
        } else if (node.is<HTMLBlock>()) {
            // Markup has no plain-text form.
        } else {
            emit(extract_text(node), indent);
        }
    }

    std::string out_;
};

} // namespace

// =============================================================================
//  AST
// =============================================================================

Document AstParser::parse(InputSource& input) {
    return parse_ast_json(input.read_all());
}

void AstRenderer::render(const Document& doc, OutputTarget& out) {
    out.write(render_to_string(doc));
    out.flush();
}

std::string AstRenderer::render_to_string(const Document& doc) {
    return to_json_string(doc, indent_);
}

// =============================================================================
//  Plain text
// =============================================================================

Document PlainTextParser::parse(InputSource& input) {
    std::string text = input.read_all();
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) text.erase(0, 3);

    Document doc;
    std::string block;
    auto flush_block = [&doc, &block] {
        std::string content = trim(block);
        if (!content.empty()) doc.children.push_back(Paragraph{{Text{content}}});
        block.clear();
    };

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) {
            flush_block();
        } else {
            if (!block.empty()) block += '\n';
            block += line;
        }
    }
    flush_block();

    if (const auto& name = input.filename()) {
        SourceLocation loc;
        loc.format = "plaintext";
        loc.element_id = *name;
        doc.source_location = loc;
    }
    return doc;
}

void PlainTextRenderer::render(const Document& doc, OutputTarget& out) {
    out.write(PlainTextWriter{}.write(doc));
    out.flush();
}

// =============================================================================
//  Registration
// =============================================================================

ConverterMetadata ast_converter_metadata() {
    ConverterMetadata meta;
    meta.format_name = "ast";
    meta.extensions = {".ast"};
    meta.mime_types = {kAstMimeType};
    meta.content_detector = make_detector<AstJsonDetector>();
    meta.parser = std::string("AstParser");
    meta.renderer = RendererFactory([](const json& options) -> RendererPtr {
        reject_unknown_options(options, "ast renderer", {"indent"});
        int indent = 2;
        if (options.is_object() && options.contains("indent")) {
            const auto& v = options.at("indent");
            if (!v.is_number_integer()) throw ValidationError("Option 'indent' must be an integer", "indent");
            indent = v.get<int>();
        }
        return std::make_unique<AstRenderer>(indent);
    });
    meta.parser_required_packages = {{"nlohmann-json", "nlohmann_json", ">=3.0"}};
    meta.renderer_required_packages = {{"nlohmann-json", "nlohmann_json", ">=3.0"}};
    meta.priority = 10;
    meta.description = "Serialized document tree (JSON)";
    return meta;
}

ConverterMetadata plaintext_converter_metadata() {
    ConverterMetadata meta;
    meta.format_name = "plaintext";
    meta.extensions = {".txt", ".text"};
    meta.mime_types = {"text/plain"};
    meta.parser = ParserFactory([](const json& options) -> ParserPtr {
        reject_unknown_options(options, "plaintext parser", {});
        return std::make_unique<PlainTextParser>();
    });
    meta.renderer = std::string("PlainTextRenderer");
    meta.priority = 0;
    meta.description = "Plain text";
    return meta;
}

void register_builtin_converters(ConverterRegistry& registry) {
    registry.register_parser_factory("ast::AstParser", [](const json& options) -> ParserPtr {
        reject_unknown_options(options, "ast parser", {});
        return std::make_unique<AstParser>();
    });
    registry.register_renderer_factory("plaintext::PlainTextRenderer", [](const json& options) -> RendererPtr {
        reject_unknown_options(options, "plaintext renderer", {});
        return std::make_unique<PlainTextRenderer>();
    });
    registry.register_converter(ast_converter_metadata());
    registry.register_converter(plaintext_converter_metadata());
}

} // namespace Polydoc
