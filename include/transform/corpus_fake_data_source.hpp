#pragma once

#include "transform/ifake_data_source.hpp"

#include <string>

namespace dumpscrub {

/**
 * @brief Default fake data source backed by built-in word lists
 *
 * Values are drawn uniformly at random from small English/UK corpora:
 * - Names:     first names x last names
 * - Addresses: building number + street name + street suffix, city, postcode
 * - Emails:    first.last<nn>@<free mail domain>
 * - NINO:      UK National Insurance number (two prefix letters, six digits, A-D)
 */
class CorpusFakeDataSource : public IFakeDataSource {
public:
    [[nodiscard]] std::string generate(FakeCategory category) override;

private:
    static std::string first_name();
    static std::string last_name();
    static std::string street_address();
    static std::string username();
    static std::string email();
    static std::string national_insurance_number();
};

} // namespace dumpscrub
