#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedDocument:    return "MalformedDocument";
        case ErrorKind::UnsupportedVersion:   return "UnsupportedVersion";
        case ErrorKind::SchemaViolation:      return "SchemaViolation";
        case ErrorKind::PresetNotFound:       return "PresetNotFound";
        case ErrorKind::InheritanceCycle:     return "InheritanceCycle";
        case ErrorKind::ConditionUnsatisfied: return "ConditionUnsatisfied";
        case ErrorKind::UnresolvedVariable:   return "UnresolvedVariable";
        case ErrorKind::ExpansionCycle:       return "ExpansionCycle";
        case ErrorKind::PreconditionFailed:   return "PreconditionFailed";
        case ErrorKind::LaunchFailure:        return "LaunchFailure";
        case ErrorKind::StepFailed:           return "StepFailed";
        case ErrorKind::ConfigError:          return "ConfigError";
        case ErrorKind::UsageError:           return "UsageError";
    }
    return "Error";
}

std::string Error::describe() const {
    std::string out = error_kind_name(kind);
    std::vector<std::string> where;
    if (!preset.empty()) where.push_back(fmt::format("preset '{}'", preset));
    if (!field.empty())  where.push_back(fmt::format("field '{}'", field));
    if (!token.empty())  where.push_back(fmt::format("token '{}'", token));

    for (size_t i = 0; i < where.size(); i++) {
        out += (i == 0 ? " in " : ", ") + where[i];
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}
