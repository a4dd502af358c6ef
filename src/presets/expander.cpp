#include "expander.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <cctype>

namespace fs = std::filesystem;

namespace {

// Text that must not be scanned again (host values, builtin paths,
// ${dollar}) travels with its '$' written as kEscape 'd'. A kEscape already
// present in the input is written as kEscape 'e' so it survives the trip.
constexpr char kEscape = '\x1f';
constexpr char kEscapedDollar = 'd';
constexpr char kEscapedEscape = 'e';

struct MacroToken {
    size_t pos = 0;
    size_t len = 0;
    std::string ns;      // "", "env", "penv" or "vendor"
    std::string name;

    std::string text() const {
        return (ns.empty() ? "$" : "$" + ns) + "{" + name + "}";
    }
};

// Next `$ns{name}` token at or after `from`. A '$' that does not start a
// complete token is ordinary text.
std::optional<MacroToken> next_macro(const std::string& s, size_t from) {
    for (size_t i = s.find('$', from); i != std::string::npos; i = s.find('$', i + 1)) {
        size_t brace = i + 1;
        while (brace < s.size() && std::isalpha(static_cast<unsigned char>(s[brace]))) brace++;
        if (brace >= s.size() || s[brace] != '{') continue;

        std::string ns = s.substr(i + 1, brace - i - 1);
        if (!ns.empty() && ns != "env" && ns != "penv" && ns != "vendor") continue;

        size_t close = s.find('}', brace + 1);
        if (close == std::string::npos) return std::nullopt;

        MacroToken tok;
        tok.pos = i;
        tok.len = close - i + 1;
        tok.ns = ns;
        tok.name = s.substr(brace + 1, close - brace - 1);
        return tok;
    }
    return std::nullopt;
}

// Document text entering expansion: only kEscape needs protecting.
std::string protect(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += c;
        if (c == kEscape) out += kEscapedEscape;
    }
    return out;
}

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '$') {
            out += kEscape;
            out += kEscapedDollar;
        } else {
            out += c;
            if (c == kEscape) out += kEscapedEscape;
        }
    }
    return out;
}

std::string unescape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == kEscape && i + 1 < s.size()) {
            out += s[i + 1] == kEscapedDollar ? '$' : kEscape;
            i++;
        } else {
            out += s[i];
        }
    }
    return out;
}

Error unresolved(const std::string& preset, const std::string& field, const MacroToken& tok,
                 const std::string& why) {
    return make_error(ErrorKind::UnresolvedVariable, why, preset, field, tok.text());
}

} // namespace

HostEnvironment HostEnvironment::current() {
    HostEnvironment host;
    host.variables = platform::environment_variables();
    host.system_name = platform::host_system_name();
    host.path_list_separator = platform::path_list_separator();
    return host;
}

MacroExpander::MacroExpander(HostEnvironment host, const fs::path& source_dir)
    : host_(std::move(host)) {
    fs::path dir = source_dir.lexically_normal();
    builtins_["sourceDir"] = dir.generic_string();
    builtins_["sourceParentDir"] = dir.parent_path().generic_string();
    builtins_["sourceDirName"] = dir.filename().generic_string();
    builtins_["fileDir"] = dir.generic_string();
    builtins_["hostSystemName"] = host_.system_name;
    builtins_["pathListSep"] = host_.path_list_separator;
}

Result<std::string> MacroExpander::substitute(const std::string& text, const std::string& field,
                                              const Scope& scope) const {
    std::string out;
    size_t pos = 0;

    while (auto tok = next_macro(text, pos)) {
        out.append(text, pos, tok->pos - pos);
        pos = tok->pos + tok->len;

        if (tok->ns == "vendor") {
            out += escape(tok->text());
        } else if (tok->ns == "env") {
            auto own = scope.environment.find(tok->name);
            if (own != scope.environment.end()) {
                out += own->second;   // may still hold references; the next pass sees them
                continue;
            }
            if (scope.unset.count(tok->name)) {
                return Result<std::string>::Err(unresolved(
                    scope.preset, field, *tok, "environment variable is explicitly unset by the preset"));
            }
            auto inherited = host_.variables.find(tok->name);
            if (inherited == host_.variables.end()) {
                return Result<std::string>::Err(unresolved(
                    scope.preset, field, *tok, "environment variable is not defined"));
            }
            out += escape(inherited->second);
        } else if (tok->ns == "penv") {
            auto inherited = host_.variables.find(tok->name);
            if (inherited == host_.variables.end()) {
                return Result<std::string>::Err(unresolved(
                    scope.preset, field, *tok, "environment variable is not defined"));
            }
            out += escape(inherited->second);
        } else if (tok->name == "generator") {
            if (!scope.generator) {
                return Result<std::string>::Err(unresolved(
                    scope.preset, field, *tok, "preset has no generator"));
            }
            out += *scope.generator;
        } else if (tok->name == "presetName") {
            out += escape(scope.preset);
        } else if (tok->name == "dollar") {
            out += escape("$");
        } else {
            auto builtin = builtins_.find(tok->name);
            if (builtin == builtins_.end()) {
                return Result<std::string>::Err(unresolved(
                    scope.preset, field, *tok, "unknown macro"));
            }
            out += escape(builtin->second);
        }
    }

    out.append(text, pos, std::string::npos);
    return Result<std::string>::Ok(out);
}

Result<MacroExpander::Scope> MacroExpander::settle(const Preset& merged) const {
    Scope scope;
    scope.preset = merged.name;
    if (merged.generator.is_set()) {
        scope.generator = protect(merged.generator.value);
    }
    for (const auto& [key, value] : merged.environment) {
        if (value.is_set()) {
            scope.environment[key] = protect(value.value);
        } else if (value.is_null()) {
            scope.unset.insert(key);
        }
    }

    const size_t max_passes = scope.environment.size() + (scope.generator ? 1 : 0) + 1;
    std::string last_changed;
    bool changed = true;

    for (size_t pass = 0; pass < max_passes && changed; pass++) {
        changed = false;

        if (scope.generator) {
            auto r = substitute(*scope.generator, "generator", scope);
            if (r.is_err()) return Result<Scope>::Err(r.error);
            if (r.value != *scope.generator) {
                scope.generator = r.value;
                changed = true;
                last_changed = "generator";
            }
        }

        for (auto& [key, value] : scope.environment) {
            auto r = substitute(value, "environment." + key, scope);
            if (r.is_err()) return Result<Scope>::Err(r.error);
            if (r.value != value) {
                value = r.value;
                changed = true;
                last_changed = "environment." + key;
            }
        }
    }

    if (changed) {
        return Result<Scope>::Err(make_error(
            ErrorKind::ExpansionCycle,
            fmt::format("value keeps growing after {} passes", max_passes),
            scope.preset, last_changed));
    }

    // A fixed point that still holds a reference reproduces itself
    auto check = [&](const std::string& value, const std::string& field) -> std::optional<Error> {
        if (auto tok = next_macro(value, 0)) {
            return make_error(ErrorKind::ExpansionCycle, "value refers back to itself",
                              scope.preset, field, tok->text());
        }
        return std::nullopt;
    };
    if (scope.generator) {
        if (auto e = check(*scope.generator, "generator")) return Result<Scope>::Err(*e);
    }
    for (const auto& [key, value] : scope.environment) {
        if (auto e = check(value, "environment." + key)) return Result<Scope>::Err(*e);
    }

    return Result<Scope>::Ok(scope);
}

Result<std::string> MacroExpander::expand_in(const Scope& scope, const std::string& text,
                                             const std::string& field) const {
    auto r = substitute(protect(text), field, scope);
    if (r.is_err()) return r;
    return Result<std::string>::Ok(unescape(r.value));
}

Result<std::string> MacroExpander::expand_string(const Preset& merged, const std::string& text,
                                                 const std::string& field) const {
    auto scope = settle(merged);
    if (scope.is_err()) return Result<std::string>::Err(scope.error);
    return expand_in(scope.value, text, field);
}

Result<ResolvedConfiguration> MacroExpander::expand(const Preset& merged) const {
    auto settled = settle(merged);
    if (settled.is_err()) return Result<ResolvedConfiguration>::Err(settled.error);
    const Scope& scope = settled.value;

    ResolvedConfiguration rc;
    rc.kind = merged.kind;
    rc.preset_name = merged.name;
    rc.display_name = merged.display_name;
    rc.description = merged.description;

    if (scope.generator) {
        rc.generator = unescape(*scope.generator);
    }

    struct StringField {
        const char* name;
        const Field<std::string>* in;
        std::optional<std::string>* out;
    };
    const StringField fields[] = {
        {"binaryDir", &merged.binary_dir, &rc.binary_dir},
        {"installDir", &merged.install_dir, &rc.install_dir},
        {"toolchainFile", &merged.toolchain_file, &rc.toolchain_file},
        {"targetExecutable", &merged.target_executable, &rc.target_executable},
        {"configuration", &merged.configuration, &rc.configuration},
    };
    for (const auto& f : fields) {
        if (!f.in->is_set()) continue;
        auto r = expand_in(scope, f.in->value, f.name);
        if (r.is_err()) return Result<ResolvedConfiguration>::Err(r.error);
        *f.out = r.value;
    }

    if (merged.configure_preset.is_set()) {
        rc.configure_preset = merged.configure_preset.value;
    }

    if (merged.targets.is_set()) {
        for (size_t i = 0; i < merged.targets.value.size(); i++) {
            auto r = expand_in(scope, merged.targets.value[i], fmt::format("targets[{}]", i));
            if (r.is_err()) return Result<ResolvedConfiguration>::Err(r.error);
            rc.targets.push_back(r.value);
        }
    }

    if (merged.jobs.is_set()) {
        rc.jobs = merged.jobs.value;
    }

    for (const auto& [key, var] : merged.cache_variables) {
        if (!var.is_set()) continue;
        auto r = expand_in(scope, var.value.value, "cacheVariables." + key);
        if (r.is_err()) return Result<ResolvedConfiguration>::Err(r.error);
        rc.cache_variables[key] = CacheVariable{var.value.type, r.value};
    }

    for (const auto& [key, value] : scope.environment) {
        rc.environment[key] = unescape(value);
    }
    rc.unset_environment = scope.unset;

    forge_log(fmt::format("expanded {} preset '{}': {} cache variables, {} environment entries",
                          preset_kind_name(rc.kind), rc.preset_name, rc.cache_variables.size(),
                          rc.environment.size()));
    return Result<ResolvedConfiguration>::Ok(rc);
}
