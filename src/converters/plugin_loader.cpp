#include <converters/plugin_loader.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <dlfcn.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace Polydoc {

namespace {

struct StaticTable {
    std::mutex mutex;
    std::vector<PluginEntry> entries;
};

StaticTable& static_table() {
    static StaticTable table;
    return table;
}

using EntryPoint = void (*)(PluginContext&);

} // namespace

void DiscoveryReport::merge(DiscoveryReport other) {
    for (auto& n : other.loaded) loaded.push_back(std::move(n));
    for (auto& f : other.failures) failures.push_back(std::move(f));
}

PluginLoader::PluginLoader(PluginContext context) : context_(context) {}

void PluginLoader::register_static(PluginEntry entry) {
    auto& table = static_table();
    std::lock_guard<std::mutex> lock(table.mutex);
    auto it = std::find_if(table.entries.begin(), table.entries.end(),
                           [&entry](const PluginEntry& e) { return e.name == entry.name; });
    if (it != table.entries.end())
        *it = std::move(entry);
    else
        table.entries.push_back(std::move(entry));
}

std::vector<std::string> PluginLoader::static_plugins() {
    auto& table = static_table();
    std::lock_guard<std::mutex> lock(table.mutex);
    std::vector<std::string> names;
    for (const auto& e : table.entries) names.push_back(e.name);
    return names;
}

bool PluginLoader::run(const std::string& name, const PluginRegistrar& registrar, DiscoveryReport& report) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loaded_.count(name)) {
            Logger::debug("Plugin '" + name + "' already loaded; skipping");
            return false;
        }
    }

    try {
        registrar(context_);
    } catch (const std::exception& e) {
        Logger::warn("Plugin '" + name + "' failed to register: " + e.what());
        report.failures.push_back({name, e.what()});
        return false;
    } catch (...) {
        Logger::warn("Plugin '" + name + "' failed to register: unknown exception");
        report.failures.push_back({name, "unknown exception"});
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loaded_.insert(name);
    }
    report.loaded.push_back(name);
    Logger::info("Loaded plugin '" + name + "'");
    return true;
}

DiscoveryReport PluginLoader::load_static() {
    std::vector<PluginEntry> entries;
    {
        auto& table = static_table();
        std::lock_guard<std::mutex> lock(table.mutex);
        entries = table.entries;
    }

    DiscoveryReport report;
    for (const auto& e : entries) {
        if (!e.registrar) {
            report.failures.push_back({e.name, "no registration function"});
            Logger::warn("Plugin '" + e.name + "' has no registration function");
            continue;
        }
        run(e.name, e.registrar, report);
    }
    return report;
}

DiscoveryReport PluginLoader::load_library(const std::string& path) {
    DiscoveryReport report;
    std::string name = fs::path(path).stem().string();

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* err = dlerror();
        std::string message = err ? err : "dlopen failed";
        Logger::warn("Plugin '" + path + "' could not be loaded: " + message);
        report.failures.push_back({name, message});
        return report;
    }

    dlerror();
    void* symbol = dlsym(handle, kPluginEntrySymbol);
    if (const char* err = dlerror(); err || !symbol) {
        std::string message = std::string("missing entry point ") + kPluginEntrySymbol;
        Logger::warn("Plugin '" + path + "': " + message);
        report.failures.push_back({name, message});
        dlclose(handle);
        return report;
    }

    auto entry = reinterpret_cast<EntryPoint>(symbol);
    bool registered = run(name, [entry](PluginContext& ctx) { entry(ctx); }, report);
    // Only a skipped duplicate leaves nothing behind in the registries.
    if (!registered && report.failures.empty()) dlclose(handle);
    return report;
}

DiscoveryReport PluginLoader::discover(const std::vector<std::string>& paths) {
    DiscoveryReport report = load_static();

    for (const auto& p : paths) {
        std::error_code ec;
        fs::path path(p);
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> libraries;
            for (const auto& entry : fs::directory_iterator(path, ec)) {
                if (entry.is_regular_file() && entry.path().extension() == ".so")
                    libraries.push_back(entry.path());
            }
            if (ec) {
                Logger::warn("Plugin directory '" + p + "' could not be scanned: " + ec.message());
                report.failures.push_back({p, ec.message()});
                continue;
            }
            std::sort(libraries.begin(), libraries.end());
            for (const auto& lib : libraries) report.merge(load_library(lib.string()));
        } else if (fs::exists(path, ec)) {
            report.merge(load_library(p));
        } else {
            Logger::warn("Plugin path '" + p + "' does not exist");
            report.failures.push_back({p, "path does not exist"});
        }
    }

    Logger::debug("Plugin discovery: " + std::to_string(report.loaded.size()) + " loaded, " +
                  std::to_string(report.failures.size()) + " failed");
    return report;
}

std::vector<std::string> PluginLoader::loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {loaded_.begin(), loaded_.end()};
}

} // namespace Polydoc
