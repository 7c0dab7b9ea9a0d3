#pragma once

/**
 * @file config.hpp
 * @brief Process-level tunables for detection budgets, logging and plugins.
 */

#include <export.hpp>
#include <utils/logger.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Polydoc {

struct POLYDOC_API RuntimeConfig {
    /// Bytes read from the head of an input for magic-byte matching.
    size_t detection_prefix_bytes = 8192;
    /// Upper bound on bytes a content detector may inspect.
    size_t detector_budget_bytes = 256 * 1024;
    Logger::Level log_level = Logger::Level::Info;
    std::vector<std::string> plugin_paths;

    /**
     * @brief Reads POLYDOC_DETECTION_PREFIX, POLYDOC_DETECTOR_BUDGET,
     * POLYDOC_LOG_LEVEL and POLYDOC_PLUGIN_PATH (colon separated).
     * Unset variables keep their defaults.
     * @throws ConfigurationError on malformed values.
     */
    static RuntimeConfig load_from_env();

    /**
     * @brief Loads a JSON object with the keys detection_prefix_bytes,
     * detector_budget_bytes, log_level and plugin_paths.
     * @throws ConfigurationError if the file is unreadable or malformed.
     */
    static RuntimeConfig load_from_file(const std::string& path);

    /// Pushes log_level into the Logger.
    void apply() const;
};

} // namespace Polydoc
