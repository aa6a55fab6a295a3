#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <span>
#include <vector>

namespace dumpscrub {

/**
 * @brief Registry of sensitivity classes
 *
 * Checks performed by validate():
 * 1. Every column carries a real classification (not UNKNOWN)
 * 2. PII / PotentialPii columns are not declared with Identity (an
 *    operator override to Identity is allowed)
 *
 * All columns are inspected; every violation is reported.
 */
class ClassificationRegistry {
public:
    /**
     * @brief Every classification an operator may assign (excludes UNKNOWN)
     */
    [[nodiscard]] static std::span<const DataType> assignable();

    /**
     * @brief True when values of this class identify a person
     */
    [[nodiscard]] static bool is_personal(DataType type);

    /**
     * @brief Validate classifications for a set of columns
     * @return Report with one error per offending column (empty if valid)
     */
    [[nodiscard]] static ValidationReport validate(const std::vector<ColumnConfig>& columns);
};

} // namespace dumpscrub
