#pragma once

/**
 * @file plugin_loader.hpp
 * @brief Discovery of converter/transform plugins.
 *
 * A plugin is a registration function receiving a PluginContext. Plugins come
 * from two places: a process-wide static table (filled by
 * POLYDOC_REGISTER_PLUGIN at static-initialization time) and shared libraries
 * exporting
 *
 *     extern "C" void polydoc_register_plugin(Polydoc::PluginContext&);
 *
 * Discovery is best-effort: a plugin that fails to load or throws while
 * registering is logged and recorded in the report, and the rest still load.
 * Loaded libraries stay mapped for the lifetime of the process since the
 * registries keep factories that live in them.
 */

#include <converters/converter_registry.hpp>
#include <converters/dependency_checker.hpp>
#include <transforms/transform_registry.hpp>
#include <export.hpp>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Polydoc {

struct PluginContext {
    ConverterRegistry& converters;
    TransformRegistry& transforms;
    FeatureRegistry& features;
};

using PluginRegistrar = std::function<void(PluginContext&)>;

struct PluginEntry {
    std::string name;
    PluginRegistrar registrar;
};

struct PluginFailure {
    std::string plugin;
    std::string message;
};

struct DiscoveryReport {
    std::vector<std::string> loaded;
    std::vector<PluginFailure> failures;

    bool ok() const { return failures.empty(); }
    void merge(DiscoveryReport other);
};

inline constexpr const char* kPluginEntrySymbol = "polydoc_register_plugin";

class POLYDOC_API PluginLoader {
public:
    explicit PluginLoader(PluginContext context);

    /// Adds to the process-wide static table. Later entries with the same name replace earlier ones.
    static void register_static(PluginEntry entry);
    static std::vector<std::string> static_plugins();

    /// Runs every static-table plugin not yet loaded by this loader.
    DiscoveryReport load_static();

    /// Loads one shared library by path.
    DiscoveryReport load_library(const std::string& path);

    /// Static plugins, then every shared library found in @p paths. A path may
    /// name a library directly or a directory scanned (non-recursively) for *.so.
    DiscoveryReport discover(const std::vector<std::string>& paths);

    /// Names of plugins this loader has run successfully.
    std::vector<std::string> loaded() const;

private:
    bool run(const std::string& name, const PluginRegistrar& registrar, DiscoveryReport& report);

    PluginContext context_;
    mutable std::mutex mutex_;
    std::set<std::string> loaded_;
};

namespace detail {
struct StaticPluginRegistrar {
    StaticPluginRegistrar(const char* name, void (*fn)(PluginContext&)) {
        PluginLoader::register_static(PluginEntry{name, fn});
    }
};
} // namespace detail

#define POLYDOC_REGISTER_PLUGIN(Name, Function)                                       \
    namespace {                                                                       \
    const ::Polydoc::detail::StaticPluginRegistrar polydoc_plugin_registrar_##Name{   \
        #Name, Function};                                                             \
    }

} // namespace Polydoc
