#include "condition.hpp"
#include <fmt/format.h>
#include <regex>

Result<bool> evaluate_condition(const Condition& c, const ConditionExpansion& expand,
                                const std::string& preset, const std::string& field) {
    using Type = Condition::Type;

    switch (c.type) {
        case Type::Const:
            return Result<bool>::Ok(c.value);

        case Type::Equals:
        case Type::NotEquals: {
            auto lhs = expand(c.lhs, field + ".lhs");
            if (lhs.is_err()) return Result<bool>::Err(lhs.error);
            auto rhs = expand(c.rhs, field + ".rhs");
            if (rhs.is_err()) return Result<bool>::Err(rhs.error);
            bool equal = lhs.value == rhs.value;
            return Result<bool>::Ok(c.type == Type::Equals ? equal : !equal);
        }

        case Type::InList:
        case Type::NotInList: {
            auto needle = expand(c.string, field + ".string");
            if (needle.is_err()) return Result<bool>::Err(needle.error);
            bool found = false;
            for (size_t i = 0; i < c.list.size() && !found; i++) {
                auto item = expand(c.list[i], fmt::format("{}.list[{}]", field, i));
                if (item.is_err()) return Result<bool>::Err(item.error);
                found = item.value == needle.value;
            }
            return Result<bool>::Ok(c.type == Type::InList ? found : !found);
        }

        case Type::Matches:
        case Type::NotMatches: {
            auto subject = expand(c.string, field + ".string");
            if (subject.is_err()) return Result<bool>::Err(subject.error);
            try {
                std::regex re(c.regex, std::regex::ECMAScript);
                bool hit = std::regex_search(subject.value, re);
                return Result<bool>::Ok(c.type == Type::Matches ? hit : !hit);
            } catch (const std::regex_error& e) {
                return Result<bool>::Err(make_error(
                    ErrorKind::SchemaViolation,
                    fmt::format("invalid regex '{}': {}", c.regex, e.what()),
                    preset, field + ".regex"));
            }
        }

        case Type::AnyOf:
        case Type::AllOf: {
            bool any = c.type == Type::AnyOf;
            for (size_t i = 0; i < c.conditions.size(); i++) {
                auto r = evaluate_condition(c.conditions[i], expand, preset,
                                            fmt::format("{}.conditions[{}]", field, i));
                if (r.is_err()) return r;
                if (r.value == any) return Result<bool>::Ok(any);
            }
            // anyOf over nothing is false, allOf over nothing is true
            return Result<bool>::Ok(!any);
        }

        case Type::Not: {
            if (c.conditions.empty()) {
                return Result<bool>::Err(make_error(ErrorKind::SchemaViolation,
                                                    "'not' condition has no operand",
                                                    preset, field));
            }
            auto r = evaluate_condition(c.conditions.front(), expand, preset, field + ".condition");
            if (r.is_err()) return r;
            return Result<bool>::Ok(!r.value);
        }
    }

    return Result<bool>::Ok(true);
}
