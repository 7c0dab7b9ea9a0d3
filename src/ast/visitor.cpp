#include <ast/visitor.hpp>

namespace Polydoc {

void NodeVisitor::visit_document(const Document& doc) {
    walk(doc, [this](const auto& n) { visit(n); });
}

} // namespace Polydoc
