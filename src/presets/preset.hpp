#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <utility>

enum class PresetKind {
    Configure,
    Build,
    Test,
};

// "configure", "build", "test"
const char* preset_kind_name(PresetKind kind);
std::optional<PresetKind> parse_preset_kind(const std::string& name);

// A preset value that distinguishes "not mentioned" from an explicit JSON
// null. Null in a higher-priority preset removes the inherited value.
template <typename T>
struct Field {
    enum class State { Absent, Null, Set };

    State state = State::Absent;
    T value{};

    static Field<T> null() {
        Field<T> f;
        f.state = State::Null;
        return f;
    }

    static Field<T> of(T v) {
        Field<T> f;
        f.state = State::Set;
        f.value = std::move(v);
        return f;
    }

    bool absent() const { return state == State::Absent; }
    bool is_null() const { return state == State::Null; }
    bool is_set() const { return state == State::Set; }

    bool operator==(const Field<T>& other) const {
        return state == other.state && (state != State::Set || value == other.value);
    }
    bool operator!=(const Field<T>& other) const { return !(*this == other); }
};

struct CacheVariable {
    std::string type;     // "BOOL", "PATH", ... or empty when untyped
    std::string value;

    bool operator==(const CacheVariable& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const CacheVariable& other) const { return !(*this == other); }
};

// Predicate over the host environment (CMake preset "condition" object).
struct Condition {
    enum class Type {
        Const,
        Equals,
        NotEquals,
        InList,
        NotInList,
        Matches,
        NotMatches,
        AnyOf,
        AllOf,
        Not,
    };

    Type type = Type::Const;
    bool value = true;                    // const
    std::string lhs;                      // equals, notEquals
    std::string rhs;
    std::string string;                   // inList, notInList, matches, notMatches
    std::vector<std::string> list;        // inList, notInList
    std::string regex;                    // matches, notMatches
    std::vector<Condition> conditions;    // anyOf, allOf; not holds exactly one
};

struct Preset {
    PresetKind kind = PresetKind::Configure;
    std::string name;
    std::vector<std::string> inherits;    // first listed wins among parents
    bool hidden = false;
    std::optional<Condition> condition;   // never inherited
    std::string display_name;
    std::string description;

    Field<std::string> generator;
    Field<std::string> binary_dir;
    Field<std::string> install_dir;
    Field<std::string> toolchain_file;
    Field<std::string> target_executable;
    std::map<std::string, Field<CacheVariable>> cache_variables;
    std::map<std::string, Field<std::string>> environment;

    // Build and test presets
    Field<std::string> configure_preset;
    Field<std::string> configuration;
    Field<std::vector<std::string>> targets;
    Field<int> jobs;
};

struct PresetDocument {
    int version = 0;
    std::filesystem::path source_path;    // file the document was read from
    std::vector<Preset> configure_presets;
    std::vector<Preset> build_presets;
    std::vector<Preset> test_presets;

    const std::vector<Preset>& presets(PresetKind kind) const;
    std::vector<Preset>& presets(PresetKind kind);

    // nullptr if no preset of that kind has the name.
    const Preset* find(PresetKind kind, const std::string& name) const;

    // Directory ${sourceDir} refers to: the absolute directory holding
    // the presets file, or the working directory for in-memory documents.
    std::filesystem::path source_dir() const;
};
