#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <utility>

// Every failure the engine can report. ConfigError and UsageError cover the
// config file and the command line; the rest come from the preset engine.
enum class ErrorKind {
    MalformedDocument,
    UnsupportedVersion,
    SchemaViolation,
    PresetNotFound,
    InheritanceCycle,
    ConditionUnsatisfied,
    UnresolvedVariable,
    ExpansionCycle,
    PreconditionFailed,
    LaunchFailure,
    StepFailed,
    ConfigError,
    UsageError,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::UsageError;
    std::string message;
    std::string preset;      // originating preset, if any
    std::string field;       // offending field or key
    std::string token;       // offending macro token
    int exit_code = 1;       // exit status to propagate (StepFailed)

    // "<Kind> in preset 'x', field 'y', token 'z': message"
    std::string describe() const;
};

inline Error make_error(ErrorKind kind, std::string message,
                        std::string preset = "", std::string field = "",
                        std::string token = "") {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    e.preset = std::move(preset);
    e.field = std::move(field);
    e.token = std::move(token);
    return e;
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
