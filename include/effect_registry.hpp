#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace roto {

enum class ParamType { Int, Float, Bool, Enum };

using ParamValue = std::variant<int64_t, double, bool, std::string>;

struct ParamSpec {
    ParamType type = ParamType::Float;
    std::optional<double> min;
    std::optional<double> max;
    ParamValue default_value;
    std::vector<std::string> allowed;  // Enum only
};

// Effect expressed purely as an external filter graph.
struct FilterGraphEffect {
    std::string filter_graph;
    bool preserve_audio = false;
};

// Effect computed frame by frame by a pipeline compiled into the worker.
struct FramePipelineEffect {
    std::string pipeline;
};

using EffectImplementation = std::variant<FilterGraphEffect, FramePipelineEffect>;

enum class EffectKind { FilterGraph, FramePipeline };

struct EffectDescriptor {
    std::string id;
    std::string version;
    std::string description;
    EffectImplementation implementation;
    std::map<std::string, ParamSpec> schema;

    EffectKind kind() const {
        return std::holds_alternative<FilterGraphEffect>(implementation)
            ? EffectKind::FilterGraph
            : EffectKind::FramePipeline;
    }
};

const char* to_string(EffectKind kind);

// Parameters after clamping and default filling. Every schema key is present.
class ValidatedParams {
public:
    ValidatedParams() = default;
    explicit ValidatedParams(std::map<std::string, ParamValue> values) : values_(std::move(values)) {}

    bool contains(const std::string& name) const { return values_.count(name) > 0; }

    int64_t get_int(const std::string& name) const;
    double get_double(const std::string& name) const;  // accepts Int or Float
    bool get_bool(const std::string& name) const;
    const std::string& get_string(const std::string& name) const;

    // Rendered for filter-graph substitution and logging.
    std::string format(const std::string& name) const;

    const std::map<std::string, ParamValue>& values() const { return values_; }

private:
    const ParamValue& at(const std::string& name) const;

    std::map<std::string, ParamValue> values_;
};

// Pipelines compiled into this worker.
constexpr const char* kRotoscopePipeline = "rotoscope";

class EffectRegistry {
public:
    // Startup-fatal: throws ConfigError when the manifest is unreadable,
    // malformed or references an implementation that does not exist.
    static EffectRegistry load(const std::string& manifest_path);
    static EffectRegistry from_json(const nlohmann::json& manifest);

    const EffectDescriptor& resolve(const std::string& effect_id) const;  // NotFoundError
    bool contains(const std::string& effect_id) const;

    // Clamps numeric values, rejects mistyped values (ValidationError),
    // ignores unknown keys, fills defaults.
    ValidatedParams validate(const std::string& effect_id, const nlohmann::json& params) const;

    std::vector<std::string> effect_ids() const;
    const std::string& version() const { return version_; }

private:
    EffectRegistry() = default;

    std::string version_;
    std::map<std::string, EffectDescriptor> effects_;
};

// Names inside `{...}` in a filter graph, in order of appearance.
std::vector<std::string> filter_graph_placeholders(const std::string& filter_graph);

// Lower-case, '_' and ' ' become '-'.
std::string normalize_effect_id(const std::string& effect_id);

} // namespace roto
