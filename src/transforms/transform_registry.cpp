#include <transforms/transform_registry.hpp>
#include <transforms/builtin_transforms.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/strings.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <tuple>

namespace Polydoc {

TransformRegistry& TransformRegistry::global() {
    static TransformRegistry instance;
    instance.initialize();
    return instance;
}

void TransformRegistry::initialize() {
    {
        std::shared_lock lock(mutex_);
        if (initialized_) return;
    }

    std::vector<TransformMetadata> builtins = builtin_transform_metadata();

    std::unique_lock lock(mutex_);
    if (initialized_) return;
    for (auto& meta : builtins) {
        meta.validate();
        if (entries_.count(meta.name)) continue;
        std::string name = meta.name;
        entries_[name] = Entry{std::make_shared<const TransformMetadata>(std::move(meta)), next_sequence_++};
    }
    initialized_ = true;
    Logger::debug("Transform registry initialized with " + std::to_string(entries_.size()) + " transforms");
}

bool TransformRegistry::initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

void TransformRegistry::register_transform(TransformMetadata meta) {
    meta.validate();
    std::string name = meta.name;
    auto shared = std::make_shared<const TransformMetadata>(std::move(meta));

    std::unique_lock lock(mutex_);
    if (entries_.count(name))
        Logger::warn("Transform '" + name + "' is already registered; overwriting");
    else
        Logger::debug("Registered transform '" + name + "'");
    entries_[name] = Entry{std::move(shared), next_sequence_++};
}

bool TransformRegistry::unregister(const std::string& name) {
    std::unique_lock lock(mutex_);
    return entries_.erase(name) > 0;
}

void TransformRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    initialized_ = false;
}

bool TransformRegistry::has_transform(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return entries_.count(name) > 0;
}

std::shared_ptr<const TransformMetadata> TransformRegistry::get_metadata(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) throw ValidationError("Transform '" + name + "' not found", name);
    return it->second.meta;
}

TransformPtr TransformRegistry::get_transform(const std::string& name,
                                              const std::map<std::string, ParamValue>& params) const {
    return get_metadata(name)->create_instance(params);
}

std::vector<std::string> TransformRegistry::list_transforms(const std::set<std::string>& tags) const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, entry] : entries_) {
        if (!tags.empty()) {
            const auto& own = entry.meta->tags;
            bool hit = std::any_of(tags.begin(), tags.end(), [&own](const std::string& t) { return own.count(t) > 0; });
            if (!hit) continue;
        }
        names.push_back(name);
    }
    return names;
}

// =============================================================================
//  Dependency resolution
// =============================================================================

namespace {

struct GraphNode {
    int priority = 100;
    uint64_t sequence = 0;
    std::vector<std::string> dependencies;
    std::vector<std::string> dependents;
    size_t indegree = 0;
};

/// Follows dependency edges among unresolved nodes until one repeats.
std::vector<std::string> find_cycle(const std::map<std::string, GraphNode>& graph,
                                    const std::set<std::string>& unresolved) {
    for (const auto& start : unresolved) {
        std::vector<std::string> path;
        std::map<std::string, size_t> on_path;
        std::string current = start;
        while (true) {
            if (auto seen = on_path.find(current); seen != on_path.end()) {
                std::vector<std::string> cycle(path.begin() + static_cast<std::ptrdiff_t>(seen->second), path.end());
                cycle.push_back(current);
                return cycle;
            }
            on_path[current] = path.size();
            path.push_back(current);

            const auto& deps = graph.at(current).dependencies;
            auto next = std::find_if(deps.begin(), deps.end(),
                                     [&unresolved](const std::string& d) { return unresolved.count(d) > 0; });
            if (next == deps.end()) break;
            current = *next;
        }
    }
    return {};
}

} // namespace

std::vector<std::string> TransformRegistry::resolve_dependencies(const std::vector<std::string>& names) const {
    std::map<std::string, GraphNode> graph;

    {
        std::shared_lock lock(mutex_);

        // Transitive closure; every name must exist before any ordering work.
        std::vector<std::pair<std::string, std::string>> pending;  // (name, required_by)
        for (const auto& n : names) pending.emplace_back(n, std::string());

        while (!pending.empty()) {
            auto [name, required_by] = pending.back();
            pending.pop_back();
            if (graph.count(name)) continue;

            auto it = entries_.find(name);
            if (it == entries_.end()) {
                if (required_by.empty())
                    throw DependencyResolutionError("Transform '" + name + "' not found", name);
                throw DependencyResolutionError("Dependency '" + name + "' not found (required by '" +
                                                required_by + "')", name);
            }

            GraphNode node;
            node.priority = it->second.meta->priority;
            node.sequence = it->second.sequence;
            node.dependencies = it->second.meta->dependencies;
            for (const auto& dep : node.dependencies) pending.emplace_back(dep, name);
            graph.emplace(name, std::move(node));
        }
    }

    for (auto& [name, node] : graph) {
        std::set<std::string> unique(node.dependencies.begin(), node.dependencies.end());
        node.indegree = unique.size();
        for (const auto& dep : unique) graph.at(dep).dependents.push_back(name);
    }

    using Key = std::tuple<int, uint64_t, std::string>;
    std::priority_queue<Key, std::vector<Key>, std::greater<Key>> ready;
    for (const auto& [name, node] : graph)
        if (node.indegree == 0) ready.emplace(node.priority, node.sequence, name);

    std::vector<std::string> order;
    order.reserve(graph.size());
    while (!ready.empty()) {
        std::string name = std::get<2>(ready.top());
        ready.pop();
        order.push_back(name);
        for (const auto& dependent : graph.at(name).dependents) {
            auto& node = graph.at(dependent);
            if (--node.indegree == 0) ready.emplace(node.priority, node.sequence, dependent);
        }
    }

    if (order.size() != graph.size()) {
        std::set<std::string> unresolved;
        for (const auto& [name, node] : graph)
            if (node.indegree > 0) unresolved.insert(name);
        std::vector<std::string> cycle = find_cycle(graph, unresolved);
        std::string description = cycle.empty() ? join({unresolved.begin(), unresolved.end()}, ", ")
                                                : join(cycle, " -> ");
        throw DependencyResolutionError("Circular dependency detected: " + description,
                                        cycle.empty() ? *unresolved.begin() : cycle.front(), cycle);
    }

    return order;
}

} // namespace Polydoc
