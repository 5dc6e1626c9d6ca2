#include "effect_registry.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace roto {

namespace {

struct RequiredParam {
    const char* name;
    ParamType type;
};

// Everything the rotoscope pipeline reads from ValidatedParams.
const RequiredParam kRotoscopeParams[] = {
    {"edge_strength", ParamType::Float},
    {"edge_thickness", ParamType::Float},
    {"edge_threshold", ParamType::Float},
    {"edge_scale", ParamType::Float},
    {"num_colors", ParamType::Int},
    {"color_method", ParamType::Enum},
    {"smoothing", ParamType::Float},
    {"saturation", ParamType::Float},
    {"temporal_smoothing", ParamType::Float},
    {"preserve_black", ParamType::Bool},
};

const char* const kColorMethods[] = {"kmeans", "bilateral", "posterize"};

const char* to_string(ParamType type) {
    switch (type) {
        case ParamType::Int: return "int";
        case ParamType::Float: return "float";
        case ParamType::Bool: return "bool";
        case ParamType::Enum: return "enum";
    }
    return "unknown";
}

ParamType parse_param_type(const std::string& effect_id, const std::string& name,
                           const std::string& type) {
    if (type == "int") return ParamType::Int;
    if (type == "float") return ParamType::Float;
    if (type == "bool") return ParamType::Bool;
    if (type == "enum") return ParamType::Enum;
    throw ConfigError("Effect '" + effect_id + "' parameter '" + name +
                      "' has unknown type '" + type + "'");
}

ParamSpec parse_param_spec(const std::string& effect_id, const std::string& name, const json& j) {
    auto fail = [&](const std::string& why) {
        return ConfigError("Effect '" + effect_id + "' parameter '" + name + "': " + why);
    };

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw fail("missing 'type'");
    }
    if (!j.contains("default")) {
        throw fail("missing 'default'");
    }

    ParamSpec spec;
    spec.type = parse_param_type(effect_id, name, j["type"].get<std::string>());
    const json& def = j["default"];

    if (j.contains("min")) {
        if (!j["min"].is_number()) throw fail("'min' must be a number");
        spec.min = j["min"].get<double>();
    }
    if (j.contains("max")) {
        if (!j["max"].is_number()) throw fail("'max' must be a number");
        spec.max = j["max"].get<double>();
    }
    if (spec.min && spec.max && *spec.min > *spec.max) {
        throw fail("'min' is greater than 'max'");
    }

    switch (spec.type) {
        case ParamType::Int: {
            if (!def.is_number_integer()) throw fail("default must be an integer");
            int64_t value = def.get<int64_t>();
            if ((spec.min && value < *spec.min) || (spec.max && value > *spec.max)) {
                throw fail("default is outside [min, max]");
            }
            spec.default_value = value;
            break;
        }
        case ParamType::Float: {
            if (!def.is_number()) throw fail("default must be a number");
            double value = def.get<double>();
            if ((spec.min && value < *spec.min) || (spec.max && value > *spec.max)) {
                throw fail("default is outside [min, max]");
            }
            spec.default_value = value;
            break;
        }
        case ParamType::Bool:
            if (!def.is_boolean()) throw fail("default must be a boolean");
            spec.default_value = def.get<bool>();
            break;
        case ParamType::Enum: {
            if (!j.contains("values") || !j["values"].is_array() || j["values"].empty()) {
                throw fail("enum needs a non-empty 'values' array");
            }
            for (const auto& v : j["values"]) {
                if (!v.is_string()) throw fail("enum values must be strings");
                spec.allowed.push_back(v.get<std::string>());
            }
            if (!def.is_string()) throw fail("default must be a string");
            std::string value = def.get<std::string>();
            if (std::find(spec.allowed.begin(), spec.allowed.end(), value) == spec.allowed.end()) {
                throw fail("default '" + value + "' is not one of the allowed values");
            }
            spec.default_value = value;
            break;
        }
    }
    return spec;
}

void check_rotoscope_schema(const EffectDescriptor& effect) {
    for (const auto& required : kRotoscopeParams) {
        auto it = effect.schema.find(required.name);
        if (it == effect.schema.end()) {
            throw ConfigError("Effect '" + effect.id + "' uses pipeline 'rotoscope' but does not declare '" +
                              required.name + "'");
        }
        if (it->second.type != required.type) {
            throw ConfigError("Effect '" + effect.id + "' parameter '" + required.name + "' must be of type " +
                              to_string(required.type));
        }
    }

    for (const auto& method : effect.schema.at("color_method").allowed) {
        bool known = std::any_of(std::begin(kColorMethods), std::end(kColorMethods),
                                 [&](const char* m) { return method == m; });
        if (!known) {
            throw ConfigError("Effect '" + effect.id + "' lists unsupported color_method '" + method + "'");
        }
    }

    const auto& colors = effect.schema.at("num_colors");
    if (!colors.min || !colors.max || *colors.min < 2) {
        throw ConfigError("Effect '" + effect.id + "' must bound num_colors with min >= 2 and a max");
    }
}

EffectDescriptor parse_effect(const std::string& raw_id, const json& j) {
    std::string id = normalize_effect_id(raw_id);
    if (id.empty()) {
        throw ConfigError("Manifest contains an effect with an empty id");
    }
    if (!j.is_object()) {
        throw ConfigError("Effect '" + id + "' must be a JSON object");
    }

    EffectDescriptor effect;
    effect.id = id;
    effect.version = j.value("version", "1.0.0");
    effect.description = j.value("description", "");

    std::string kind = j.value("kind", "");
    if (kind == "filter-graph") {
        FilterGraphEffect impl;
        impl.filter_graph = j.value("filter_graph", "");
        impl.preserve_audio = j.value("preserve_audio", false);
        if (impl.filter_graph.empty()) {
            throw ConfigError("Effect '" + id + "' is a filter-graph effect without a 'filter_graph'");
        }
        effect.implementation = impl;
    } else if (kind == "frame-pipeline") {
        FramePipelineEffect impl;
        impl.pipeline = j.value("pipeline", "");
        if (impl.pipeline != kRotoscopePipeline) {
            throw ConfigError("Effect '" + id + "' references unknown pipeline '" + impl.pipeline + "'");
        }
        effect.implementation = impl;
    } else {
        throw ConfigError("Effect '" + id + "' has unknown kind '" + kind + "'");
    }

    if (j.contains("params")) {
        if (!j["params"].is_object()) {
            throw ConfigError("Effect '" + id + "' params must be an object");
        }
        for (const auto& item : j["params"].items()) {
            effect.schema.emplace(item.key(), parse_param_spec(id, item.key(), item.value()));
        }
    }

    if (effect.kind() == EffectKind::FramePipeline) {
        check_rotoscope_schema(effect);
    } else {
        for (const auto& name : filter_graph_placeholders(std::get<FilterGraphEffect>(effect.implementation).filter_graph)) {
            if (!effect.schema.count(name)) {
                throw ConfigError("Effect '" + id + "' filter graph uses undeclared parameter '{" + name + "}'");
            }
        }
    }
    return effect;
}

// 2^63; every double below it and at or above its negation fits int64_t.
constexpr double kInt64Bound = 9223372036854775808.0;

double clamp_to(const ParamSpec& spec, double value) {
    if (spec.min) value = std::max(value, *spec.min);
    if (spec.max) value = std::min(value, *spec.max);
    return value;
}

ParamValue coerce(const std::string& effect_id, const std::string& name, const ParamSpec& spec,
                  const json& value) {
    auto reject = [&](const std::string& why) {
        return ValidationError("Parameter '" + name + "' for effect '" + effect_id + "' " + why);
    };

    switch (spec.type) {
        case ParamType::Int: {
            if (!value.is_number()) throw reject("must be an integer");
            double raw = value.get<double>();
            if (!std::isfinite(raw)) throw reject("must be finite");
            double clamped = clamp_to(spec, raw);
            if (clamped < -kInt64Bound || clamped >= kInt64Bound) throw reject("is out of range");
            return static_cast<int64_t>(std::llround(clamped));
        }
        case ParamType::Float: {
            if (!value.is_number()) throw reject("must be a number");
            double raw = value.get<double>();
            if (!std::isfinite(raw)) throw reject("must be finite");
            return clamp_to(spec, raw);
        }
        case ParamType::Bool:
            if (!value.is_boolean()) throw reject("must be a boolean");
            return value.get<bool>();
        case ParamType::Enum: {
            if (!value.is_string()) throw reject("must be a string");
            std::string s = value.get<std::string>();
            if (std::find(spec.allowed.begin(), spec.allowed.end(), s) == spec.allowed.end()) {
                throw reject("has unsupported value '" + s + "'");
            }
            return s;
        }
    }
    throw reject("has an unsupported type");
}

} // namespace

const char* to_string(EffectKind kind) {
    return kind == EffectKind::FilterGraph ? "filter-graph" : "frame-pipeline";
}

std::vector<std::string> filter_graph_placeholders(const std::string& filter_graph) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = filter_graph.find('{', pos)) != std::string::npos) {
        size_t close = filter_graph.find('}', pos + 1);
        if (close == std::string::npos) {
            break;
        }
        names.push_back(filter_graph.substr(pos + 1, close - pos - 1));
        pos = close + 1;
    }
    return names;
}

std::string normalize_effect_id(const std::string& effect_id) {
    std::string id;
    id.reserve(effect_id.size());
    for (char c : effect_id) {
        if (c == '_' || c == ' ') {
            id += '-';
        } else {
            id += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return id;
}

const ParamValue& ValidatedParams::at(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("No validated parameter named '" + name + "'");
    }
    return it->second;
}

int64_t ValidatedParams::get_int(const std::string& name) const {
    return std::get<int64_t>(at(name));
}

double ValidatedParams::get_double(const std::string& name) const {
    const auto& value = at(name);
    if (auto i = std::get_if<int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(value);
}

bool ValidatedParams::get_bool(const std::string& name) const {
    return std::get<bool>(at(name));
}

const std::string& ValidatedParams::get_string(const std::string& name) const {
    return std::get<std::string>(at(name));
}

std::string ValidatedParams::format(const std::string& name) const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "1" : "0";
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << v;
            return out.str();
        } else {
            return std::to_string(v);
        }
    }, at(name));
}

EffectRegistry EffectRegistry::load(const std::string& manifest_path) {
    std::ifstream file(manifest_path);
    if (!file.good()) {
        throw ConfigError("Cannot open effect manifest: " + manifest_path);
    }

    json manifest;
    try {
        file >> manifest;
    } catch (const json::parse_error& e) {
        throw ConfigError("Malformed effect manifest " + manifest_path + ": " + e.what());
    }

    auto registry = from_json(manifest);
    std::cout << "Loaded effect manifest " << manifest_path << " (version " << registry.version_
              << ", " << registry.effects_.size() << " effects)" << std::endl;
    return registry;
}

EffectRegistry EffectRegistry::from_json(const json& manifest) {
    if (!manifest.is_object() || !manifest.contains("effects") || !manifest["effects"].is_object()) {
        throw ConfigError("Effect manifest needs an 'effects' object");
    }

    EffectRegistry registry;
    try {
        registry.version_ = manifest.value("version", "0.0.0");
        for (const auto& item : manifest["effects"].items()) {
            auto effect = parse_effect(item.key(), item.value());
            std::string id = effect.id;
            if (!registry.effects_.emplace(id, std::move(effect)).second) {
                throw ConfigError("Effect '" + id + "' is declared twice");
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid effect manifest: ") + e.what());
    }

    if (registry.effects_.empty()) {
        throw ConfigError("Effect manifest declares no effects");
    }
    return registry;
}

const EffectDescriptor& EffectRegistry::resolve(const std::string& effect_id) const {
    auto it = effects_.find(normalize_effect_id(effect_id));
    if (it == effects_.end()) {
        throw NotFoundError("Unknown effect: '" + effect_id + "'");
    }
    return it->second;
}

bool EffectRegistry::contains(const std::string& effect_id) const {
    return effects_.count(normalize_effect_id(effect_id)) > 0;
}

ValidatedParams EffectRegistry::validate(const std::string& effect_id, const json& params) const {
    const auto& effect = resolve(effect_id);

    if (!params.is_null() && !params.is_object()) {
        throw ValidationError("Parameters for effect '" + effect.id + "' must be a JSON object");
    }

    std::map<std::string, ParamValue> values;
    for (const auto& [name, spec] : effect.schema) {
        if (params.is_object() && params.contains(name) && !params[name].is_null()) {
            values[name] = coerce(effect.id, name, spec, params[name]);
        } else {
            values[name] = spec.default_value;
        }
    }
    return ValidatedParams(std::move(values));
}

std::vector<std::string> EffectRegistry::effect_ids() const {
    std::vector<std::string> ids;
    ids.reserve(effects_.size());
    for (const auto& [id, effect] : effects_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace roto
