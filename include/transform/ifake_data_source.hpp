#pragma once

#include <string>
#include <string_view>

namespace dumpscrub {

enum class FakeCategory {
    CITY,
    COMPANY_NAME,
    EMAIL,
    FIRST_NAME,
    FULL_ADDRESS,
    FULL_NAME,
    LAST_NAME,
    NATIONAL_IDENTITY_NUMBER,
    STATE,
    STREET_ADDRESS,
    USERNAME
};

[[nodiscard]] std::string_view fake_category_to_string(FakeCategory category);

/**
 * @brief Supplies synthetic values, one per call, for each fake category.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class IFakeDataSource {
public:
    virtual ~IFakeDataSource() = default;

    [[nodiscard]] virtual std::string generate(FakeCategory category) = 0;
};

} // namespace dumpscrub
