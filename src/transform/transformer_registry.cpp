#include "transform/transformer_registry.hpp"

#include <algorithm>
#include <array>
#include <format>

namespace dumpscrub {

namespace {

constexpr std::array<std::string_view, 1> kValueArg = {TransformerRegistry::kArgValue};
constexpr std::array<std::string_view, 1> kUniqueArg = {TransformerRegistry::kArgUnique};

struct Problem {
    ErrorCode code;
    std::string detail;
};

std::vector<Problem> find_problems(const TransformerSpec& spec) {
    std::vector<Problem> problems;

    if (spec.name == TransformerKind::ERROR) {
        problems.push_back({ErrorCode::UNCONFIGURED_TRANSFORMER, "transformer is Error"});
        return problems;
    }

    const auto desc = TransformerRegistry::describe(spec.name);
    const auto declared = [&](const std::string& key) {
        const auto has = [&](std::span<const std::string_view> args) {
            return std::find(args.begin(), args.end(), key) != args.end();
        };
        return has(desc.required_args) || has(desc.optional_args);
    };

    for (const auto& required : desc.required_args) {
        if (!spec.args.contains(std::string(required))) {
            problems.push_back({ErrorCode::MISSING_ARGUMENT,
                std::format("{} requires argument '{}'",
                            transformer_kind_to_string(spec.name), required)});
        }
    }

    for (const auto& [key, value] : spec.args) {
        if (!declared(key)) {
            problems.push_back({ErrorCode::INVALID_ARGUMENT,
                std::format("{} does not accept argument '{}'",
                            transformer_kind_to_string(spec.name), key)});
        } else if (key == TransformerRegistry::kArgUnique && value != "true" && value != "false") {
            problems.push_back({ErrorCode::INVALID_ARGUMENT,
                std::format("argument 'unique' must be \"true\" or \"false\", got '{}'", value)});
        }
    }

    return problems;
}

} // anonymous namespace

TransformerDescriptor TransformerRegistry::describe(TransformerKind kind) {
    // No default case: adding a TransformerKind without a descriptor is a -Wswitch warning
    switch (kind) {
        case TransformerKind::FIXED:
            return {kind, kValueArg, {}, false};

        case TransformerKind::FAKE_COMPANY_NAME:
        case TransformerKind::FAKE_EMAIL:
        case TransformerKind::FAKE_FULL_NAME:
        case TransformerKind::FAKE_PHONE_NUMBER:
        case TransformerKind::FAKE_USERNAME:
            return {kind, {}, kUniqueArg, true};

        case TransformerKind::EMPTY_JSON:
        case TransformerKind::ERROR:
        case TransformerKind::FAKE_BASE16_STRING:
        case TransformerKind::FAKE_BASE32_STRING:
        case TransformerKind::FAKE_CITY:
        case TransformerKind::FAKE_FIRST_NAME:
        case TransformerKind::FAKE_FULL_ADDRESS:
        case TransformerKind::FAKE_IPV4:
        case TransformerKind::FAKE_LAST_NAME:
        case TransformerKind::FAKE_NATIONAL_IDENTITY_NUMBER:
        case TransformerKind::FAKE_POST_CODE:
        case TransformerKind::FAKE_STATE:
        case TransformerKind::FAKE_STREET_ADDRESS:
        case TransformerKind::FAKE_UUID:
        case TransformerKind::IDENTITY:
        case TransformerKind::OBFUSCATE_DAY:
        case TransformerKind::SCRAMBLE:
        case TransformerKind::SCRAMBLE_BLANK:
            return {kind, {}, {}, false};
    }
    return {kind, {}, {}, false};
}

Result<Transformer> TransformerRegistry::resolve(const TransformerSpec& spec) {
    const auto problems = find_problems(spec);
    if (!problems.empty()) {
        return Result<Transformer>::error(problems.front().code, problems.front().detail);
    }

    const auto unique_it = spec.args.find(std::string(kArgUnique));
    const bool unique = unique_it != spec.args.end() && unique_it->second == "true";

    std::string fixed_value;
    if (spec.name == TransformerKind::FIXED) {
        fixed_value = spec.args.at(std::string(kArgValue));
    }

    return Result<Transformer>::ok(Transformer(spec.name, unique, std::move(fixed_value)));
}

std::vector<ConfigError> TransformerRegistry::check(const ColumnConfig& column) {
    std::vector<ConfigError> errors;
    for (auto& problem : find_problems(column.transformer)) {
        errors.emplace_back(problem.code, column.table, column.name, std::move(problem.detail));
    }
    return errors;
}

} // namespace dumpscrub
