#pragma once

#include <string>
#include <functional>
#include <core/types.hpp>
#include "preset.hpp"

// Macro expansion applied to a condition operand; field names the operand.
using ConditionExpansion =
    std::function<Result<std::string>(const std::string& text, const std::string& field)>;

// Evaluate a preset condition. lhs/rhs/string/list operands go through
// `expand`; regexes are used verbatim (ECMAScript, search semantics).
// An invalid regex is a SchemaViolation.
Result<bool> evaluate_condition(const Condition& condition,
                                const ConditionExpansion& expand,
                                const std::string& preset,
                                const std::string& field = "condition");
