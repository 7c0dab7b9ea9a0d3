#include <pipeline/hooks.hpp>
#include <ast/transformer.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <set>

namespace Polydoc {

const char* hook_point_name(HookPoint point) {
    switch (point) {
        case HookPoint::PostParse: return "post_parse";
        case HookPoint::PreTransform: return "pre_transform";
        case HookPoint::PostTransform: return "post_transform";
        case HookPoint::PreRender: return "pre_render";
        case HookPoint::PostRender: return "post_render";
    }
    return "unknown";
}

template <typename Fn>
void HookManager::insert(std::vector<Slot<Fn>>& slots, Fn fn, int priority) {
    Slot<Fn> slot{priority, next_sequence_++, std::move(fn)};
    auto pos = std::upper_bound(slots.begin(), slots.end(), priority,
                                [](int p, const Slot<Fn>& s) { return p < s.priority; });
    slots.insert(pos, std::move(slot));
}

void HookManager::add_document_hook(HookPoint point, DocumentHook hook, int priority) {
    if (point == HookPoint::PostRender)
        throw ValidationError("post_render hooks receive the rendered output; use add_output_hook", "post_render");
    if (!hook) throw ValidationError("Empty hook for stage " + std::string(hook_point_name(point)));
    insert(document_hooks_[point], std::move(hook), priority);
    Logger::debug(std::string("Registered hook for '") + hook_point_name(point) + "'");
}

void HookManager::add_node_hook(const std::string& node_type, NodeHook hook, int priority) {
    static const std::set<std::string_view> structural = {
        NodeTraits<Document>::key, NodeTraits<ListItem>::key, NodeTraits<TableRow>::key,
        NodeTraits<TableCell>::key, NodeTraits<DefinitionTerm>::key, NodeTraits<DefinitionDescription>::key,
    };
    const auto& known = all_node_type_keys();
    if (std::find(known.begin(), known.end(), node_type) == known.end())
        throw ValidationError("Unknown node type '" + node_type + "'", node_type);
    if (structural.count(node_type))
        throw ValidationError("Node hooks cannot target '" + node_type + "'", node_type);
    if (!hook) throw ValidationError("Empty hook for node type '" + node_type + "'", node_type);

    insert(node_hooks_[node_type], std::move(hook), priority);
    Logger::debug("Registered hook for '" + node_type + "'");
}

void HookManager::add_output_hook(OutputHook hook, int priority) {
    if (!hook) throw ValidationError("Empty output hook", "post_render");
    insert(output_hooks_, std::move(hook), priority);
}

bool HookManager::has_hooks(HookPoint point) const {
    if (point == HookPoint::PostRender) return !output_hooks_.empty();
    auto it = document_hooks_.find(point);
    return it != document_hooks_.end() && !it->second.empty();
}

void HookManager::clear() {
    document_hooks_.clear();
    node_hooks_.clear();
    output_hooks_.clear();
}

void HookManager::run(HookPoint point, Document& doc, HookContext& ctx) const {
    auto it = document_hooks_.find(point);
    if (it == document_hooks_.end()) return;
    for (const auto& slot : it->second) slot.fn(doc, ctx);
}

void HookManager::run_output(std::string& output, HookContext& ctx) const {
    for (const auto& slot : output_hooks_) slot.fn(output, ctx);
}

namespace {

class NodeHookTransformer : public NodeTransformer {
public:
    using HookTable = std::map<std::string, std::vector<NodeHook>>;

    NodeHookTransformer(const HookTable& hooks, HookContext& ctx) : hooks_(hooks), ctx_(ctx) {}

    std::optional<Node> transform_node(Node node) override {
        auto rebuilt = NodeTransformer::transform_node(std::move(node));
        if (!rebuilt) return std::nullopt;

        auto it = hooks_.find(std::string(rebuilt->type_key()));
        if (it == hooks_.end()) return rebuilt;

        std::optional<Node> current = std::move(rebuilt);
        for (const auto& hook : it->second) {
            current = hook(std::move(*current), ctx_);
            if (!current) {
                Logger::debug("Hook removed a '" + it->first + "' node");
                return std::nullopt;
            }
        }
        return current;
    }

private:
    const HookTable& hooks_;
    HookContext& ctx_;
};

} // namespace

Document HookManager::apply_node_hooks(Document doc, HookContext& ctx) const {
    if (node_hooks_.empty()) return doc;

    NodeHookTransformer::HookTable table;
    for (const auto& [key, slots] : node_hooks_) {
        auto& fns = table[key];
        for (const auto& s : slots) fns.push_back(s.fn);
    }
    NodeHookTransformer walker(table, ctx);
    return walker.transform(std::move(doc));
}

} // namespace Polydoc
