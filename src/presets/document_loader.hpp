#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include "preset.hpp"

// Read and validate a presets file (CMakePresets.json format).
// Fails with MalformedDocument, UnsupportedVersion or SchemaViolation.
Result<PresetDocument> load_preset_document(const std::filesystem::path& path);

// Same, over text already in memory. source_path only anchors ${sourceDir}.
Result<PresetDocument> parse_preset_document(const std::string& text,
                                             const std::filesystem::path& source_path = {});
