#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "transform/transformer.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace dumpscrub {

/**
 * @brief Declared argument shape of one transformer kind
 */
struct TransformerDescriptor {
    TransformerKind kind;
    std::span<const std::string_view> required_args;
    std::span<const std::string_view> optional_args;
    bool supports_unique = false;
};

/**
 * @brief Maps TransformerSpec -> Transformer, checking arguments
 *
 * Rules:
 * - ERROR kind            -> UNCONFIGURED_TRANSFORMER
 * - required arg absent   -> MISSING_ARGUMENT (e.g. Fixed.value)
 * - undeclared arg        -> INVALID_ARGUMENT
 * - unique not true/false -> INVALID_ARGUMENT
 */
class TransformerRegistry {
public:
    static constexpr std::string_view kArgValue = "value";
    static constexpr std::string_view kArgUnique = "unique";

    [[nodiscard]] static TransformerDescriptor describe(TransformerKind kind);

    /**
     * @brief Resolve a spec into an applicable transformer
     * @return Transformer, or the first configuration problem found
     */
    [[nodiscard]] static Result<Transformer> resolve(const TransformerSpec& spec);

    /**
     * @brief Every configuration problem with a column's transformer
     */
    [[nodiscard]] static std::vector<ConfigError> check(const ColumnConfig& column);
};

} // namespace dumpscrub
