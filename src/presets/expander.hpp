#pragma once

#include <string>
#include <map>
#include <optional>
#include <set>
#include <filesystem>
#include <core/types.hpp>
#include "preset.hpp"
#include "resolved_configuration.hpp"

// What macros can see of the machine we run on.
struct HostEnvironment {
    std::map<std::string, std::string> variables;   // process environment
    std::string system_name;                        // ${hostSystemName}
    std::string path_list_separator;                // ${pathListSep}

    static HostEnvironment current();
};

// Expands CMake preset macros: ${sourceDir}, ${sourceParentDir},
// ${sourceDirName}, ${fileDir}, ${presetName}, ${generator},
// ${hostSystemName}, ${pathListSep}, ${dollar}, $env{NAME}, $penv{NAME}.
// $vendor{...} is left alone.
//
// The preset's environment entries and its generator may refer to each
// other; they are settled by repeated left-to-right passes until nothing
// changes, at most (count + 1) passes. Everything else is expanded in a
// single pass over the settled values.
class MacroExpander {
public:
    MacroExpander(HostEnvironment host, const std::filesystem::path& source_dir);

    // Expand a merged preset into its final configuration.
    Result<ResolvedConfiguration> expand(const Preset& merged) const;

    // Expand one string in the context of a merged preset.
    Result<std::string> expand_string(const Preset& merged, const std::string& text,
                                      const std::string& field) const;

    const HostEnvironment& host() const { return host_; }

private:
    // Settled self-referable values of one preset (still escaped).
    struct Scope {
        std::string preset;
        std::optional<std::string> generator;
        std::map<std::string, std::string> environment;
        std::set<std::string> unset;
    };

    Result<Scope> settle(const Preset& merged) const;
    Result<std::string> substitute(const std::string& text, const std::string& field,
                                   const Scope& scope) const;
    Result<std::string> expand_in(const Scope& scope, const std::string& text,
                                  const std::string& field) const;

    HostEnvironment host_;
    std::map<std::string, std::string> builtins_;
};
