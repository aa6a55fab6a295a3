#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "transform/ifake_data_source.hpp"
#include "transform/uniqueness_tracker.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace dumpscrub {

/**
 * @brief Per-call collaborators a transformer may consult
 */
struct TransformContext {
    IFakeDataSource& fake;
    UniquenessTracker& uniqueness;
    ColumnKey key;
};

/**
 * @brief A resolved, argument-checked transformer for one column
 *
 * Instances are only produced by TransformerRegistry::resolve(), so an
 * existing Transformer is never of kind ERROR and always has its required
 * arguments.
 */
class Transformer {
public:
    [[nodiscard]] TransformerKind kind() const { return kind_; }
    [[nodiscard]] bool unique() const { return unique_; }

    /**
     * @brief Produce the replacement for one (non-NULL) value
     * @return Replacement, or a data error (UNPARSEABLE_DATE, UNSUPPORTED_COUNTRY_CODE)
     */
    [[nodiscard]] Result<std::string> apply(std::string_view original, TransformContext& ctx) const;

    // ---- Stateless primitives ---------------------------------------------

    // Same character count; spaces kept in place, everything else random [A-Za-z0-9]
    [[nodiscard]] static std::string scramble(std::string_view value);

    // "YYYY-MM-DD[...]" -> "YYYY-MM-01[...]"
    [[nodiscard]] static Result<std::string> obfuscate_day(std::string_view value);

    // First three characters (code points)
    [[nodiscard]] static std::string post_code(std::string_view value);

    // Random subscriber number keeping the input's country calling code (GB, US)
    [[nodiscard]] static Result<std::string> phone_number(std::string_view value);

    [[nodiscard]] static std::string base16_string();
    [[nodiscard]] static std::string base32_string();
    [[nodiscard]] static std::string uuid();
    [[nodiscard]] static std::string ipv4();

    [[nodiscard]] static std::optional<FakeCategory> fake_category(TransformerKind kind);

private:
    friend class TransformerRegistry;

    Transformer(TransformerKind kind, bool unique, std::string fixed_value)
        : kind_(kind), unique_(unique), fixed_value_(std::move(fixed_value)) {}

    [[nodiscard]] std::string generate_fake(FakeCategory category, TransformContext& ctx) const;

    TransformerKind kind_;
    bool unique_;
    std::string fixed_value_;
};

} // namespace dumpscrub
