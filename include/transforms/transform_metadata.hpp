#pragma once

/**
 * @file transform_metadata.hpp
 * @brief Describes a registered transform: how to build it, which parameters
 * it accepts, and where it sits in the execution order.
 */

#include <ast/transformer.hpp>
#include <export.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Polydoc {

using ParamValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

enum class ParamType { Bool, Int, Float, String, StringList };

POLYDOC_API std::string_view param_type_name(ParamType type);
POLYDOC_API std::string param_value_to_string(const ParamValue& value);

/// Converts a JSON scalar/array into the declared type.
POLYDOC_API ParamValue param_value_from_json(const nlohmann::json& value, ParamType type);

struct POLYDOC_API ParameterSpec {
    ParamType type = ParamType::String;
    std::optional<ParamValue> default_value;
    bool required = false;
    std::vector<ParamValue> choices;
    std::string help;
    /// Extra check run after type and choice validation; return false to reject.
    std::function<bool(const ParamValue&)> validator;

    /// Returns the value coerced to the declared type (int accepted for float).
    /// @throws ValidationError naming @p name.
    ParamValue validate(const std::string& name, const ParamValue& value) const;
};

class POLYDOC_API TransformParams {
public:
    TransformParams() = default;
    explicit TransformParams(std::map<std::string, ParamValue> values) : values_(std::move(values)) {}

    bool has(const std::string& name) const { return values_.count(name) > 0; }

    template <typename T>
    T get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) throw_missing(name);
        if (const T* v = std::get_if<T>(&it->second)) return *v;
        throw_wrong_type(name);
    }

    template <typename T>
    T get_or(const std::string& name, T fallback) const {
        auto it = values_.find(name);
        if (it == values_.end()) return fallback;
        if (const T* v = std::get_if<T>(&it->second)) return *v;
        throw_wrong_type(name);
    }

    const std::map<std::string, ParamValue>& values() const { return values_; }

private:
    [[noreturn]] static void throw_missing(const std::string& name);
    [[noreturn]] static void throw_wrong_type(const std::string& name);

    std::map<std::string, ParamValue> values_;
};

using TransformPtr = std::unique_ptr<NodeTransformer>;
using TransformFactory = std::function<TransformPtr(const TransformParams&)>;

struct POLYDOC_API TransformMetadata {
    std::string name;
    std::string description;
    TransformFactory factory;
    std::map<std::string, ParameterSpec> parameters;
    /// Lower runs earlier among transforms whose dependencies are satisfied.
    int priority = 100;
    std::vector<std::string> dependencies;
    std::string version = "1.0.0";
    std::string author;
    std::set<std::string> tags;

    /// @throws ValidationError for an empty name, missing factory or negative priority.
    void validate() const;

    /**
     * @brief Validates supplied values against the parameter specs and fills
     * defaults.
     * @throws ValidationError for unknown, missing-required or ill-typed values.
     */
    TransformParams bind(const std::map<std::string, ParamValue>& supplied) const;

    TransformPtr create_instance(const std::map<std::string, ParamValue>& supplied = {}) const;

    bool has_parameter(const std::string& param) const { return parameters.count(param) > 0; }
};

} // namespace Polydoc
