#pragma once

/**
 * @file hooks.hpp
 * @brief Callbacks run by the conversion pipeline at fixed stages and on
 * nodes of a given type.
 *
 * Hooks for one target run in ascending priority, then registration order,
 * each receiving the previous hook's result. A node hook returning nullopt
 * removes the node. Exceptions thrown by a hook propagate to the caller.
 */

#include <ast/nodes.hpp>
#include <export.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Polydoc {

enum class HookPoint {
    PostParse,      ///< Document straight from the parser.
    PreTransform,   ///< Before each transform.
    PostTransform,  ///< After each transform.
    PreRender,      ///< Before node hooks and rendering.
    PostRender      ///< On the rendered output, before it is written.
};

POLYDOC_API const char* hook_point_name(HookPoint point);

struct HookContext {
    std::string source_format;
    std::string target_format;
    /// Set while PreTransform/PostTransform hooks run.
    std::string transform_name;
    /// Scratch space shared by every hook of one conversion.
    json shared = json::object();
};

using DocumentHook = std::function<void(Document&, HookContext&)>;
using NodeHook = std::function<std::optional<Node>(Node, HookContext&)>;
using OutputHook = std::function<void(std::string&, HookContext&)>;

class POLYDOC_API HookManager {
public:
    /// @throws ValidationError for HookPoint::PostRender (use add_output_hook).
    void add_document_hook(HookPoint point, DocumentHook hook, int priority = 100);

    /**
     * @brief Hook on every node whose type key matches, e.g. "image".
     * @throws ValidationError for unknown keys and for keys that never appear
     *         as a standalone node ("document", "list_item", "table_row", ...).
     */
    void add_node_hook(const std::string& node_type, NodeHook hook, int priority = 100);

    void add_output_hook(OutputHook hook, int priority = 100);

    bool has_hooks(HookPoint point) const;
    bool has_node_hooks() const { return !node_hooks_.empty(); }
    void clear();

    void run(HookPoint point, Document& doc, HookContext& ctx) const;
    void run_output(std::string& output, HookContext& ctx) const;

    /// Applies node hooks bottom-up over the whole tree.
    Document apply_node_hooks(Document doc, HookContext& ctx) const;

private:
    template <typename Fn>
    struct Slot {
        int priority;
        uint64_t sequence;
        Fn fn;
    };

    template <typename Fn>
    void insert(std::vector<Slot<Fn>>& slots, Fn fn, int priority);

    std::map<HookPoint, std::vector<Slot<DocumentHook>>> document_hooks_;
    std::map<std::string, std::vector<Slot<NodeHook>>> node_hooks_;
    std::vector<Slot<OutputHook>> output_hooks_;
    uint64_t next_sequence_ = 0;
};

} // namespace Polydoc
