#include "preset.hpp"

namespace fs = std::filesystem;

const char* preset_kind_name(PresetKind kind) {
    switch (kind) {
        case PresetKind::Configure: return "configure";
        case PresetKind::Build:     return "build";
        case PresetKind::Test:      return "test";
    }
    return "configure";
}

std::optional<PresetKind> parse_preset_kind(const std::string& name) {
    if (name == "configure") return PresetKind::Configure;
    if (name == "build") return PresetKind::Build;
    if (name == "test") return PresetKind::Test;
    return std::nullopt;
}

const std::vector<Preset>& PresetDocument::presets(PresetKind kind) const {
    switch (kind) {
        case PresetKind::Build: return build_presets;
        case PresetKind::Test:  return test_presets;
        default:                return configure_presets;
    }
}

std::vector<Preset>& PresetDocument::presets(PresetKind kind) {
    switch (kind) {
        case PresetKind::Build: return build_presets;
        case PresetKind::Test:  return test_presets;
        default:                return configure_presets;
    }
}

const Preset* PresetDocument::find(PresetKind kind, const std::string& name) const {
    for (const auto& p : presets(kind)) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

fs::path PresetDocument::source_dir() const {
    if (source_path.empty()) return fs::current_path();
    return fs::absolute(source_path).lexically_normal().parent_path();
}
