#include <core/config.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace Polydoc {

namespace {

size_t parse_size(const std::string& key, const std::string& value) {
    // stoull accepts a sign and wraps "-1" around.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front())))
        throw ConfigurationError("Invalid value for " + key + ": " + value, key);

    size_t pos = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value, &pos);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + key + ": " + value, key);
    }
    if (pos != value.size() || parsed == 0)
        throw ConfigurationError("Invalid value for " + key + ": " + value, key);
    return static_cast<size_t>(parsed);
}

size_t size_from_json(const json& doc, const char* key) {
    const json& v = doc.at(key);
    if (!v.is_number_unsigned() || v.get<uint64_t>() == 0)
        throw ConfigurationError(std::string(key) + " must be a positive integer, got " + v.dump(), key);
    return static_cast<size_t>(v.get<uint64_t>());
}

Logger::Level parse_log_level(const std::string& key, const std::string& value) {
    Logger::Level level;
    if (!Logger::parse_level(to_lower(value), level))
        throw ConfigurationError("Unknown log level for " + key + ": " + value, key);
    return level;
}

} // namespace

RuntimeConfig RuntimeConfig::load_from_env() {
    RuntimeConfig config;

    if (const char* v = std::getenv("POLYDOC_DETECTION_PREFIX"))
        config.detection_prefix_bytes = parse_size("POLYDOC_DETECTION_PREFIX", v);
    if (const char* v = std::getenv("POLYDOC_DETECTOR_BUDGET"))
        config.detector_budget_bytes = parse_size("POLYDOC_DETECTOR_BUDGET", v);
    if (const char* v = std::getenv("POLYDOC_LOG_LEVEL"))
        config.log_level = parse_log_level("POLYDOC_LOG_LEVEL", v);
    if (const char* v = std::getenv("POLYDOC_PLUGIN_PATH")) {
        for (auto& part : split(v, ':'))
            if (!part.empty()) config.plugin_paths.push_back(part);
    }

    return config;
}

RuntimeConfig RuntimeConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw ConfigurationError("Cannot open config file: " + path, path);

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what(), path);
    }
    if (!doc.is_object()) throw ConfigurationError("Config root must be an object: " + path, path);

    RuntimeConfig config;
    try {
        if (doc.contains("detection_prefix_bytes"))
            config.detection_prefix_bytes = size_from_json(doc, "detection_prefix_bytes");
        if (doc.contains("detector_budget_bytes"))
            config.detector_budget_bytes = size_from_json(doc, "detector_budget_bytes");
        if (doc.contains("log_level"))
            config.log_level = parse_log_level("log_level", doc.at("log_level").get<std::string>());
        if (doc.contains("plugin_paths"))
            config.plugin_paths = doc.at("plugin_paths").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what(), path);
    }

    return config;
}

void RuntimeConfig::apply() const {
    Logger::set_level(log_level);
}

} // namespace Polydoc
