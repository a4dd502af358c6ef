#include "document_loader.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Thrown while walking the JSON tree; converted to a Result at the boundary.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(Error e) : std::runtime_error(e.message), error(std::move(e)) {}
    Error error;
};

[[noreturn]] void violation(const std::string& preset, const std::string& field,
                            const std::string& message) {
    throw SchemaError(make_error(ErrorKind::SchemaViolation, message, preset, field));
}

const char* json_type(const json& node) {
    return node.type_name();
}

std::string read_string(const json& node, const std::string& preset, const std::string& field) {
    if (!node.is_string()) {
        violation(preset, field, fmt::format("expected a string, got {}", json_type(node)));
    }
    return node.get<std::string>();
}

std::vector<std::string> read_string_list(const json& node, const std::string& preset,
                                          const std::string& field) {
    std::vector<std::string> out;
    if (node.is_string()) {
        out.push_back(node.get<std::string>());
        return out;
    }
    if (!node.is_array()) {
        violation(preset, field, fmt::format("expected a string or an array of strings, got {}",
                                             json_type(node)));
    }
    for (const auto& item : node) {
        out.push_back(read_string(item, preset, field));
    }
    return out;
}

// Booleans render the way CMake spells them on the command line
std::string bool_text(bool b) {
    return b ? "TRUE" : "FALSE";
}

Field<std::string> read_string_field(const json& obj, const char* key, const std::string& preset) {
    auto it = obj.find(key);
    if (it == obj.end()) return {};
    if (it->is_null()) return Field<std::string>::null();
    return Field<std::string>::of(read_string(*it, preset, key));
}

Field<CacheVariable> read_cache_variable(const json& node, const std::string& preset,
                                         const std::string& field) {
    if (node.is_null()) return Field<CacheVariable>::null();

    CacheVariable var;
    if (node.is_string()) {
        var.value = node.get<std::string>();
    } else if (node.is_boolean()) {
        var.type = "BOOL";
        var.value = bool_text(node.get<bool>());
    } else if (node.is_object()) {
        if (node.contains("type")) {
            var.type = read_string(node["type"], preset, field + ".type");
        }
        auto value = node.find("value");
        if (value == node.end()) {
            violation(preset, field, "cache variable object requires a 'value'");
        }
        if (value->is_boolean()) {
            var.value = bool_text(value->get<bool>());
        } else {
            var.value = read_string(*value, preset, field + ".value");
        }
    } else {
        violation(preset, field, fmt::format("expected a string, boolean, object or null, got {}",
                                             json_type(node)));
    }
    return Field<CacheVariable>::of(var);
}

Condition parse_condition(const json& node, const std::string& preset, const std::string& field);

std::vector<Condition> parse_condition_list(const json& node, const std::string& preset,
                                            const std::string& field) {
    if (!node.is_array()) {
        violation(preset, field, fmt::format("expected an array of conditions, got {}",
                                             json_type(node)));
    }
    std::vector<Condition> out;
    for (size_t i = 0; i < node.size(); i++) {
        out.push_back(parse_condition(node[i], preset, fmt::format("{}[{}]", field, i)));
    }
    return out;
}

const json& require(const json& obj, const char* key, const std::string& preset,
                    const std::string& field) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        violation(preset, field, fmt::format("condition is missing '{}'", key));
    }
    return *it;
}

Condition parse_condition(const json& node, const std::string& preset, const std::string& field) {
    Condition c;
    if (node.is_boolean()) {
        c.type = Condition::Type::Const;
        c.value = node.get<bool>();
        return c;
    }
    if (!node.is_object()) {
        violation(preset, field, fmt::format("expected a condition object, got {}", json_type(node)));
    }

    std::string type = read_string(require(node, "type", preset, field), preset, field + ".type");

    if (type == "const") {
        const auto& v = require(node, "value", preset, field);
        if (!v.is_boolean()) violation(preset, field + ".value", "expected a boolean");
        c.type = Condition::Type::Const;
        c.value = v.get<bool>();
    } else if (type == "equals" || type == "notEquals") {
        c.type = type == "equals" ? Condition::Type::Equals : Condition::Type::NotEquals;
        c.lhs = read_string(require(node, "lhs", preset, field), preset, field + ".lhs");
        c.rhs = read_string(require(node, "rhs", preset, field), preset, field + ".rhs");
    } else if (type == "inList" || type == "notInList") {
        c.type = type == "inList" ? Condition::Type::InList : Condition::Type::NotInList;
        c.string = read_string(require(node, "string", preset, field), preset, field + ".string");
        const auto& list = require(node, "list", preset, field);
        if (!list.is_array()) violation(preset, field + ".list", "expected an array of strings");
        c.list = read_string_list(list, preset, field + ".list");
    } else if (type == "matches" || type == "notMatches") {
        c.type = type == "matches" ? Condition::Type::Matches : Condition::Type::NotMatches;
        c.string = read_string(require(node, "string", preset, field), preset, field + ".string");
        c.regex = read_string(require(node, "regex", preset, field), preset, field + ".regex");
    } else if (type == "anyOf" || type == "allOf") {
        c.type = type == "anyOf" ? Condition::Type::AnyOf : Condition::Type::AllOf;
        c.conditions = parse_condition_list(require(node, "conditions", preset, field),
                                            preset, field + ".conditions");
    } else if (type == "not") {
        c.type = Condition::Type::Not;
        c.conditions.push_back(parse_condition(require(node, "condition", preset, field),
                                               preset, field + ".condition"));
    } else {
        violation(preset, field + ".type", fmt::format("unknown condition type '{}'", type));
    }
    return c;
}

Preset parse_preset(const json& node, PresetKind kind, size_t index) {
    std::string list_name = fmt::format("{}Presets", preset_kind_name(kind));
    if (!node.is_object()) {
        violation("", fmt::format("{}[{}]", list_name, index),
                  fmt::format("expected a preset object, got {}", json_type(node)));
    }

    auto name_it = node.find("name");
    if (name_it == node.end() || !name_it->is_string() || name_it->get<std::string>().empty()) {
        violation("", fmt::format("{}[{}].name", list_name, index),
                  "every preset needs a non-empty string 'name'");
    }

    Preset p;
    p.kind = kind;
    p.name = name_it->get<std::string>();
    const std::string& name = p.name;

    if (node.contains("inherits")) {
        p.inherits = read_string_list(node["inherits"], name, "inherits");
    }
    if (node.contains("hidden")) {
        if (!node["hidden"].is_boolean()) violation(name, "hidden", "expected a boolean");
        p.hidden = node["hidden"].get<bool>();
    }
    if (node.contains("displayName")) {
        p.display_name = read_string(node["displayName"], name, "displayName");
    }
    if (node.contains("description")) {
        p.description = read_string(node["description"], name, "description");
    }
    if (node.contains("condition") && !node["condition"].is_null()) {
        p.condition = parse_condition(node["condition"], name, "condition");
    }

    p.generator = read_string_field(node, "generator", name);
    p.binary_dir = read_string_field(node, "binaryDir", name);
    p.install_dir = read_string_field(node, "installDir", name);
    p.toolchain_file = read_string_field(node, "toolchainFile", name);
    p.target_executable = read_string_field(node, "targetExecutable", name);
    p.configure_preset = read_string_field(node, "configurePreset", name);
    p.configuration = read_string_field(node, "configuration", name);

    if (node.contains("cacheVariables")) {
        const auto& vars = node["cacheVariables"];
        if (!vars.is_object()) violation(name, "cacheVariables", "expected an object");
        for (auto it = vars.begin(); it != vars.end(); ++it) {
            p.cache_variables[it.key()] =
                read_cache_variable(it.value(), name, "cacheVariables." + it.key());
        }
    }

    if (node.contains("environment")) {
        const auto& env = node["environment"];
        if (!env.is_object()) violation(name, "environment", "expected an object");
        for (auto it = env.begin(); it != env.end(); ++it) {
            if (it.value().is_null()) {
                p.environment[it.key()] = Field<std::string>::null();
            } else {
                p.environment[it.key()] = Field<std::string>::of(
                    read_string(it.value(), name, "environment." + it.key()));
            }
        }
    }

    if (node.contains("targets")) {
        const auto& targets = node["targets"];
        if (targets.is_null()) {
            p.targets = Field<std::vector<std::string>>::null();
        } else {
            p.targets = Field<std::vector<std::string>>::of(
                read_string_list(targets, name, "targets"));
        }
    }

    if (node.contains("jobs")) {
        const auto& jobs = node["jobs"];
        if (jobs.is_null()) {
            p.jobs = Field<int>::null();
        } else if (jobs.is_number_integer() && jobs.get<long long>() >= 0 &&
                   jobs.get<long long>() <= 1 << 16) {
            p.jobs = Field<int>::of(jobs.get<int>());
        } else {
            violation(name, "jobs", "expected a non-negative integer");
        }
    }

    return p;
}

void parse_preset_list(const json& root, const char* key, PresetKind kind,
                       PresetDocument& doc, std::set<std::string>& seen) {
    auto it = root.find(key);
    if (it == root.end() || it->is_null()) return;
    if (!it->is_array()) {
        violation("", key, fmt::format("expected an array of presets, got {}", json_type(*it)));
    }

    auto& out = doc.presets(kind);
    for (size_t i = 0; i < it->size(); i++) {
        Preset p = parse_preset((*it)[i], kind, i);
        if (!seen.insert(p.name).second) {
            violation(p.name, "name",
                      fmt::format("duplicate {} preset name", preset_kind_name(kind)));
        }
        out.push_back(std::move(p));
    }
}

} // namespace

Result<PresetDocument> parse_preset_document(const std::string& text, const fs::path& source_path) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        std::string where = source_path.empty() ? "<input>" : source_path.string();
        return Result<PresetDocument>::Err(
            make_error(ErrorKind::MalformedDocument, fmt::format("{}: {}", where, e.what())));
    }

    try {
        if (!root.is_object()) {
            violation("", "", fmt::format("document root must be an object, got {}", json_type(root)));
        }

        PresetDocument doc;
        doc.source_path = source_path;

        auto version = root.find("version");
        if (version == root.end()) {
            violation("", "version", "missing required 'version'");
        }
        if (!version->is_number_integer()) {
            violation("", "version", fmt::format("expected an integer, got {}", json_type(*version)));
        }
        long long v = version->get<long long>();
        if (v < MIN_PRESET_SCHEMA_VERSION || v > MAX_PRESET_SCHEMA_VERSION) {
            return Result<PresetDocument>::Err(make_error(
                ErrorKind::UnsupportedVersion,
                fmt::format("version {} is outside the supported range {}..{}", v,
                            MIN_PRESET_SCHEMA_VERSION, MAX_PRESET_SCHEMA_VERSION),
                "", "version"));
        }
        doc.version = static_cast<int>(v);

        // Names only have to be unique within one kind
        std::set<std::string> configure_names, build_names, test_names;
        parse_preset_list(root, "configurePresets", PresetKind::Configure, doc, configure_names);
        // Older cppforge files used a bare "presets" list
        parse_preset_list(root, "presets", PresetKind::Configure, doc, configure_names);
        parse_preset_list(root, "buildPresets", PresetKind::Build, doc, build_names);
        parse_preset_list(root, "testPresets", PresetKind::Test, doc, test_names);

        forge_log(fmt::format("loaded {} (version {}): {} configure, {} build, {} test presets",
                              source_path.string(), doc.version, doc.configure_presets.size(),
                              doc.build_presets.size(), doc.test_presets.size()));
        return Result<PresetDocument>::Ok(std::move(doc));
    } catch (const SchemaError& e) {
        return Result<PresetDocument>::Err(e.error);
    } catch (const json::exception& e) {
        return Result<PresetDocument>::Err(make_error(ErrorKind::SchemaViolation, e.what()));
    }
}

Result<PresetDocument> load_preset_document(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<PresetDocument>::Err(make_error(
            ErrorKind::MalformedDocument, "cannot read presets file " + path.string()));
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    return parse_preset_document(buf.str(), path);
}
