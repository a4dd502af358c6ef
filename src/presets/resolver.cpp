#include "resolver.hpp"
#include "condition.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

template <typename T>
void take(Field<T>& dst, const Field<T>& src) {
    if (!src.absent()) dst = src;
}

template <typename T>
void take_entries(std::map<std::string, Field<T>>& dst,
                  const std::map<std::string, Field<T>>& src) {
    for (const auto& [key, value] : src) {
        if (!value.absent()) dst[key] = value;
    }
}

// Lay `layer` over `acc`: every field the layer mentions (value or null) wins.
void overlay(Preset& acc, const Preset& layer) {
    take(acc.generator, layer.generator);
    take(acc.binary_dir, layer.binary_dir);
    take(acc.install_dir, layer.install_dir);
    take(acc.toolchain_file, layer.toolchain_file);
    take(acc.target_executable, layer.target_executable);
    take(acc.configure_preset, layer.configure_preset);
    take(acc.configuration, layer.configuration);
    take(acc.targets, layer.targets);
    take(acc.jobs, layer.jobs);
    take_entries(acc.cache_variables, layer.cache_variables);
    take_entries(acc.environment, layer.environment);
}

} // namespace

PresetResolver::PresetResolver(const PresetDocument& document, const MacroExpander& expander)
    : document_(document), expander_(expander) {}

Result<Preset> PresetResolver::merge(PresetKind kind, const std::string& name) {
    std::vector<std::string> path;
    return merge_from(kind, name, "", path);
}

Result<Preset> PresetResolver::merge_from(PresetKind kind, const std::string& name,
                                          const std::string& referrer,
                                          std::vector<std::string>& path) {
    if (std::find(path.begin(), path.end(), name) != path.end()) {
        std::vector<std::string> chain(std::find(path.begin(), path.end(), name), path.end());
        chain.push_back(name);
        return Result<Preset>::Err(make_error(
            ErrorKind::InheritanceCycle,
            "inheritance cycle: " + join(chain, " -> "),
            path.front(), "inherits"));
    }

    auto cached = merged_.find({kind, name});
    if (cached != merged_.end()) {
        return Result<Preset>::Ok(cached->second);
    }

    const Preset* own = document_.find(kind, name);
    if (!own) {
        if (referrer.empty()) {
            return Result<Preset>::Err(make_error(
                ErrorKind::PresetNotFound,
                fmt::format("no {} preset named '{}'", preset_kind_name(kind), name),
                name));
        }
        return Result<Preset>::Err(make_error(
            ErrorKind::PresetNotFound,
            fmt::format("inherits from unknown {} preset '{}'", preset_kind_name(kind), name),
            referrer, "inherits", name));
    }

    path.push_back(name);

    Preset acc;
    for (auto it = own->inherits.rbegin(); it != own->inherits.rend(); ++it) {
        auto parent = merge_from(kind, *it, name, path);
        if (parent.is_err()) return parent;
        overlay(acc, parent.value);
    }
    overlay(acc, *own);

    // Identity and per-preset attributes are never inherited
    acc.kind = own->kind;
    acc.name = own->name;
    acc.inherits = own->inherits;
    acc.hidden = own->hidden;
    acc.condition = own->condition;
    acc.display_name = own->display_name;
    acc.description = own->description;

    path.pop_back();
    merged_[{kind, name}] = acc;
    return Result<Preset>::Ok(acc);
}

Result<Preset> PresetResolver::resolve(PresetKind kind, const std::string& name) {
    auto merged = merge(kind, name);
    if (merged.is_err()) return merged;

    const Preset& preset = merged.value;
    if (!preset.condition) {
        return merged;
    }

    auto expand = [&](const std::string& text, const std::string& field) {
        return expander_.expand_string(preset, text, field);
    };
    auto ok = evaluate_condition(*preset.condition, expand, preset.name);
    if (ok.is_err()) return Result<Preset>::Err(ok.error);
    if (!ok.value) {
        forge_log(fmt::format("condition of {} preset '{}' is false", preset_kind_name(kind), name));
        return Result<Preset>::Err(make_error(
            ErrorKind::ConditionUnsatisfied,
            "preset condition does not hold on this host", name, "condition"));
    }
    return merged;
}

Result<Preset> PresetResolver::select(PresetKind kind, const std::string& name) {
    const Preset* own = document_.find(kind, name);
    if (own && own->hidden) {
        return Result<Preset>::Err(make_error(
            ErrorKind::PresetNotFound,
            fmt::format("{} preset '{}' is hidden and can only be inherited",
                        preset_kind_name(kind), name),
            name));
    }
    return resolve(kind, name);
}
