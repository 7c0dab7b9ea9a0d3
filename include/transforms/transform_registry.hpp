#pragma once

/**
 * @file transform_registry.hpp
 * @brief Registry of named AST transforms with dependency-ordered resolution.
 *
 * A registry starts uninitialized; initialize() registers the built-in
 * transforms exactly once and clear() returns it to the uninitialized state.
 * global() hands out an already initialized process-wide instance.
 */

#include <transforms/transform_metadata.hpp>
#include <export.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Polydoc {

class POLYDOC_API TransformRegistry {
public:
    TransformRegistry() = default;

    static TransformRegistry& global();

    /// Registers the built-in transforms; idempotent.
    void initialize();
    bool initialized() const;

    /// Overwrites (with a warning) a transform of the same name.
    /// @throws ValidationError if the metadata is malformed.
    void register_transform(TransformMetadata meta);
    bool unregister(const std::string& name);
    void clear();

    bool has_transform(const std::string& name) const;

    /// @throws ValidationError if the transform is not registered.
    std::shared_ptr<const TransformMetadata> get_metadata(const std::string& name) const;

    /// Builds an instance with validated parameters.
    TransformPtr get_transform(const std::string& name,
                               const std::map<std::string, ParamValue>& params = {}) const;

    /// Sorted names; with @p tags, only transforms carrying at least one of them.
    std::vector<std::string> list_transforms(const std::set<std::string>& tags = {}) const;

    /**
     * @brief Execution order for @p names and everything they depend on.
     *
     * Dependencies always precede their dependents. Among transforms that are
     * ready at the same time, lower priority runs first, then earlier
     * registration.
     *
     * @throws DependencyResolutionError if a name or dependency is unknown
     *         (checked before ordering) or the graph contains a cycle.
     */
    std::vector<std::string> resolve_dependencies(const std::vector<std::string>& names) const;

private:
    struct Entry {
        std::shared_ptr<const TransformMetadata> meta;
        uint64_t sequence = 0;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
    uint64_t next_sequence_ = 0;
    bool initialized_ = false;
};

} // namespace Polydoc
