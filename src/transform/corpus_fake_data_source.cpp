#include "transform/corpus_fake_data_source.hpp"
#include "transform/random_source.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string_view>

namespace dumpscrub {

namespace {

constexpr std::array<std::string_view, 40> kFirstNames = {
    "Oliver", "George", "Harry", "Jack", "Jacob", "Noah", "Charlie", "Muhammad",
    "Thomas", "Oscar", "William", "James", "Henry", "Leo", "Alfie", "Joshua",
    "Freddie", "Archie", "Ethan", "Isaac", "Olivia", "Amelia", "Isla", "Ava",
    "Emily", "Isabella", "Mia", "Poppy", "Ella", "Lily", "Grace", "Sophia",
    "Evie", "Jessica", "Chloe", "Ruby", "Sophie", "Daisy", "Alice", "Freya",
};

constexpr std::array<std::string_view, 40> kLastNames = {
    "Smith", "Jones", "Taylor", "Brown", "Williams", "Wilson", "Johnson", "Davies",
    "Robinson", "Wright", "Thompson", "Evans", "Walker", "White", "Roberts", "Green",
    "Hall", "Wood", "Jackson", "Clarke", "Patel", "Khan", "Lewis", "James",
    "Phillips", "Mason", "Mitchell", "Rose", "Davis", "Rodriguez", "Cox", "Alexander",
    "Cooper", "Morgan", "Hughes", "Edwards", "Turner", "Baker", "Harris", "Ward",
};

constexpr std::array<std::string_view, 24> kStreetNames = {
    "High", "Station", "Main", "Park", "Church", "London", "Victoria", "Green",
    "Manor", "Kings", "Queens", "New", "Grange", "Mill", "School", "North",
    "South", "West", "Alexander", "Chapel", "Springfield", "Windsor", "Albert", "York",
};

constexpr std::array<std::string_view, 10> kStreetSuffixes = {
    "Street", "Road", "Lane", "Avenue", "Close", "Drive", "Way", "Gardens", "Crescent", "Place",
};

constexpr std::array<std::string_view, 24> kCities = {
    "London", "Birmingham", "Manchester", "Leeds", "Glasgow", "Sheffield", "Bradford",
    "Liverpool", "Edinburgh", "Bristol", "Cardiff", "Leicester", "Coventry", "Nottingham",
    "Newcastle", "Belfast", "Brighton", "Hull", "Plymouth", "Stoke", "Wolverhampton",
    "Derby", "Swansea", "Southampton",
};

constexpr std::array<std::string_view, 20> kStates = {
    "Alabama", "Alaska", "Arizona", "California", "Colorado", "Florida", "Georgia",
    "Hawaii", "Idaho", "Illinois", "Kansas", "Maine", "Nevada", "New York", "Ohio",
    "Oregon", "Texas", "Utah", "Vermont", "Washington",
};

constexpr std::array<std::string_view, 20> kCompanyWords = {
    "Acme", "Apex", "Summit", "Northwind", "Bluebird", "Keystone", "Vertex", "Harbour",
    "Oakwood", "Silverline", "Redstone", "Brightwater", "Ironbridge", "Clearview",
    "Evergreen", "Pinnacle", "Riverside", "Starling", "Falcon", "Meridian",
};

constexpr std::array<std::string_view, 8> kCompanySuffixes = {
    "Ltd", "PLC", "LLP", "Group", "Holdings", "Partners", "& Co", "Industries",
};

constexpr std::array<std::string_view, 6> kEmailDomains = {
    "example.com", "example.org", "example.net", "mail.example", "post.example", "inbox.example",
};

constexpr std::string_view kPostcodeLetters = "ABCDEFGHJKLMNPRSTUWXYZ";
constexpr std::string_view kNinoFirst = "ABCEGHJKLMNOPRSTWXYZ";
constexpr std::string_view kNinoSecond = "ABCEGHJKLMNPRSTWXYZ";
constexpr std::array<std::string_view, 7> kNinoDisallowedPrefixes = {
    "BG", "GB", "KN", "NK", "NT", "TN", "ZZ",
};

template<typename Container>
std::string_view pick(const Container& items) {
    return items[static_cast<size_t>(
        random::uniform_int(0, static_cast<int64_t>(std::size(items)) - 1))];
}

char pick_char(std::string_view chars) {
    return chars[static_cast<size_t>(
        random::uniform_int(0, static_cast<int64_t>(chars.size()) - 1))];
}

std::string postcode() {
    return std::format("{}{}{} {}{}{}",
        pick_char(kPostcodeLetters), pick_char(kPostcodeLetters), random::uniform_int(1, 20),
        random::uniform_int(0, 9), pick_char(kPostcodeLetters), pick_char(kPostcodeLetters));
}

} // anonymous namespace

std::string_view fake_category_to_string(FakeCategory category) {
    switch (category) {
        case FakeCategory::CITY:                     return "city";
        case FakeCategory::COMPANY_NAME:             return "company_name";
        case FakeCategory::EMAIL:                    return "email";
        case FakeCategory::FIRST_NAME:               return "first_name";
        case FakeCategory::FULL_ADDRESS:             return "full_address";
        case FakeCategory::FULL_NAME:                return "full_name";
        case FakeCategory::LAST_NAME:                return "last_name";
        case FakeCategory::NATIONAL_IDENTITY_NUMBER: return "national_identity_number";
        case FakeCategory::STATE:                    return "state";
        case FakeCategory::STREET_ADDRESS:           return "street_address";
        case FakeCategory::USERNAME:                 return "username";
    }
    return "unknown";
}

std::string CorpusFakeDataSource::generate(FakeCategory category) {
    switch (category) {
        case FakeCategory::CITY:
            return std::string(pick(kCities));
        case FakeCategory::COMPANY_NAME:
            return std::format("{} {}", pick(kCompanyWords), pick(kCompanySuffixes));
        case FakeCategory::EMAIL:
            return email();
        case FakeCategory::FIRST_NAME:
            return first_name();
        case FakeCategory::FULL_ADDRESS:
            return std::format("{}, {}, {}", street_address(), pick(kCities), postcode());
        case FakeCategory::FULL_NAME:
            return std::format("{} {}", first_name(), last_name());
        case FakeCategory::LAST_NAME:
            return last_name();
        case FakeCategory::NATIONAL_IDENTITY_NUMBER:
            return national_insurance_number();
        case FakeCategory::STATE:
            return std::string(pick(kStates));
        case FakeCategory::STREET_ADDRESS:
            return street_address();
        case FakeCategory::USERNAME:
            return username();
    }
    return {};
}

std::string CorpusFakeDataSource::first_name() {
    return std::string(pick(kFirstNames));
}

std::string CorpusFakeDataSource::last_name() {
    return std::string(pick(kLastNames));
}

std::string CorpusFakeDataSource::street_address() {
    return std::format("{} {} {}", random::uniform_int(1, 250), pick(kStreetNames), pick(kStreetSuffixes));
}

std::string CorpusFakeDataSource::username() {
    return utils::to_lower(std::format("{}{}{}",
        pick(kFirstNames).front(), pick(kLastNames), random::uniform_int(1, 999)));
}

std::string CorpusFakeDataSource::email() {
    return utils::to_lower(std::format("{}.{}{}@{}",
        pick(kFirstNames), pick(kLastNames), random::uniform_int(1, 99), pick(kEmailDomains)));
}

std::string CorpusFakeDataSource::national_insurance_number() {
    std::string prefix;
    do {
        prefix = {pick_char(kNinoFirst), pick_char(kNinoSecond)};
    } while (std::find(kNinoDisallowedPrefixes.begin(), kNinoDisallowedPrefixes.end(), prefix)
             != kNinoDisallowedPrefixes.end());

    return std::format("{}{}{}", prefix, random::digits(6), pick_char("ABCD"));
}

} // namespace dumpscrub
