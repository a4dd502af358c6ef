#pragma once

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <core/types.hpp>
#include "preset.hpp"
#include "expander.hpp"

// Flattens a preset's inheritance chain.
//
// Parents are merged depth-first and applied in reverse order of the
// `inherits` list, then the preset's own fields go on top. So the preset
// beats every ancestor, a closer ancestor beats a farther one, and of two
// parents the one listed first wins. Explicit nulls travel through the
// merge and only disappear when the result is expanded, so a null in a
// higher-priority layer deletes the key.
//
// The result is merged but not expanded.
class PresetResolver {
public:
    PresetResolver(const PresetDocument& document, const MacroExpander& expander);

    // Merge a preset with its ancestors. Hidden presets are allowed.
    // Fails with PresetNotFound or InheritanceCycle.
    Result<Preset> merge(PresetKind kind, const std::string& name);

    // merge(), then evaluate the preset's own condition
    // (ConditionUnsatisfied when it is false).
    Result<Preset> resolve(PresetKind kind, const std::string& name);

    // resolve() for a name typed on the command line: hidden presets
    // are reported as not found.
    Result<Preset> select(PresetKind kind, const std::string& name);

private:
    Result<Preset> merge_from(PresetKind kind, const std::string& name,
                              const std::string& referrer, std::vector<std::string>& path);

    const PresetDocument& document_;
    const MacroExpander& expander_;
    std::map<std::pair<PresetKind, std::string>, Preset> merged_;
};
