#include <transforms/transform_metadata.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <algorithm>
#include <sstream>

namespace Polydoc {

std::string_view param_type_name(ParamType type) {
    switch (type) {
        case ParamType::Bool:       return "bool";
        case ParamType::Int:        return "int";
        case ParamType::Float:      return "float";
        case ParamType::String:     return "string";
        case ParamType::StringList: return "list[string]";
    }
    return "unknown";
}

std::string param_value_to_string(const ParamValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) return v ? "true" : "false";
        else if constexpr (std::is_same_v<T, int64_t>) return std::to_string(v);
        else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        }
        else if constexpr (std::is_same_v<T, std::string>) return v;
        else return "[" + join(v, ", ") + "]";
    }, value);
}

ParamValue param_value_from_json(const nlohmann::json& value, ParamType type) {
    auto bad = [&]() -> ValidationError {
        return ValidationError("Expected " + std::string(param_type_name(type)) + ", got " + value.dump(),
                               value.dump());
    };
    switch (type) {
        case ParamType::Bool:
            if (value.is_boolean()) return value.get<bool>();
            break;
        case ParamType::Int:
            if (value.is_number_integer()) return value.get<int64_t>();
            break;
        case ParamType::Float:
            if (value.is_number()) return value.get<double>();
            break;
        case ParamType::String:
            if (value.is_string()) return value.get<std::string>();
            break;
        case ParamType::StringList:
            if (value.is_array()) {
                std::vector<std::string> items;
                for (const auto& v : value) {
                    if (!v.is_string()) throw bad();
                    items.push_back(v.get<std::string>());
                }
                return items;
            }
            break;
    }
    throw bad();
}

// =============================================================================
//  ParameterSpec
// =============================================================================

ParamValue ParameterSpec::validate(const std::string& name, const ParamValue& value) const {
    ParamValue coerced = value;

    bool type_ok = false;
    switch (type) {
        case ParamType::Bool:       type_ok = std::holds_alternative<bool>(value); break;
        case ParamType::Int:        type_ok = std::holds_alternative<int64_t>(value); break;
        case ParamType::String:     type_ok = std::holds_alternative<std::string>(value); break;
        case ParamType::StringList: type_ok = std::holds_alternative<std::vector<std::string>>(value); break;
        case ParamType::Float:
            if (const auto* i = std::get_if<int64_t>(&value)) {
                coerced = static_cast<double>(*i);
                type_ok = true;
            } else {
                type_ok = std::holds_alternative<double>(value);
            }
            break;
    }
    if (!type_ok)
        throw ValidationError("Parameter '" + name + "' expects " + std::string(param_type_name(type)) +
                              ", got '" + param_value_to_string(value) + "'", name);

    if (!choices.empty() && std::find(choices.begin(), choices.end(), coerced) == choices.end()) {
        std::vector<std::string> allowed;
        for (const auto& c : choices) allowed.push_back(param_value_to_string(c));
        throw ValidationError("Parameter '" + name + "' must be one of [" + join(allowed, ", ") +
                              "], got '" + param_value_to_string(coerced) + "'", name);
    }

    if (validator && !validator(coerced))
        throw ValidationError("Validation failed for parameter '" + name + "': " +
                              param_value_to_string(coerced), name);

    return coerced;
}

// =============================================================================
//  TransformParams
// =============================================================================

void TransformParams::throw_missing(const std::string& name) {
    throw ValidationError("Parameter '" + name + "' not provided", name);
}

void TransformParams::throw_wrong_type(const std::string& name) {
    throw ValidationError("Parameter '" + name + "' has an unexpected type", name);
}

// =============================================================================
//  TransformMetadata
// =============================================================================

void TransformMetadata::validate() const {
    if (name.empty()) throw ValidationError("Transform name cannot be empty", "name");
    if (!factory) throw ValidationError("Transform '" + name + "' has no factory", name);
    if (priority < 0)
        throw ValidationError("Priority must be non-negative, got " + std::to_string(priority), name);
    for (const auto& [param, spec] : parameters) {
        if (spec.default_value) spec.validate(param, *spec.default_value);
    }
}

TransformParams TransformMetadata::bind(const std::map<std::string, ParamValue>& supplied) const {
    for (const auto& [param, _] : supplied) {
        if (!parameters.count(param))
            throw ValidationError("Unknown parameter '" + param + "' for transform '" + name + "'", param);
    }

    std::map<std::string, ParamValue> bound;
    for (const auto& [param, spec] : parameters) {
        auto it = supplied.find(param);
        if (it != supplied.end()) {
            bound[param] = spec.validate(param, it->second);
        } else if (spec.required) {
            throw ValidationError("Required parameter '" + param + "' not provided for transform '" +
                                  name + "'", param);
        } else if (spec.default_value) {
            bound[param] = *spec.default_value;
        }
    }
    return TransformParams(std::move(bound));
}

TransformPtr TransformMetadata::create_instance(const std::map<std::string, ParamValue>& supplied) const {
    TransformParams params = bind(supplied);
    TransformPtr instance = factory(params);
    if (!instance) throw ValidationError("Factory for transform '" + name + "' returned null", name);
    return instance;
}

} // namespace Polydoc
