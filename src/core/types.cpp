#include "core/types.hpp"

#include <array>
#include <utility>

namespace dumpscrub {

namespace {

constexpr std::array<std::pair<DataType, std::string_view>, 6> kDataTypeNames = {{
    {DataType::COMMERCIALLY_SENSITIVE, "CommerciallySensitive"},
    {DataType::GENERAL,                "General"},
    {DataType::POTENTIAL_PII,          "PotentialPii"},
    {DataType::PII,                    "Pii"},
    {DataType::SECURITY,               "Security"},
    {DataType::UNKNOWN,                "Unknown"},
}};

constexpr std::array<std::pair<TransformerKind, std::string_view>, 24> kTransformerNames = {{
    {TransformerKind::EMPTY_JSON,                    "EmptyJson"},
    {TransformerKind::ERROR,                         "Error"},
    {TransformerKind::FAKE_BASE16_STRING,            "FakeBase16String"},
    {TransformerKind::FAKE_BASE32_STRING,            "FakeBase32String"},
    {TransformerKind::FAKE_CITY,                     "FakeCity"},
    {TransformerKind::FAKE_COMPANY_NAME,             "FakeCompanyName"},
    {TransformerKind::FAKE_EMAIL,                    "FakeEmail"},
    {TransformerKind::FAKE_FIRST_NAME,               "FakeFirstName"},
    {TransformerKind::FAKE_FULL_ADDRESS,             "FakeFullAddress"},
    {TransformerKind::FAKE_FULL_NAME,                "FakeFullName"},
    {TransformerKind::FAKE_IPV4,                     "FakeIPv4"},
    {TransformerKind::FAKE_LAST_NAME,                "FakeLastName"},
    {TransformerKind::FAKE_NATIONAL_IDENTITY_NUMBER, "FakeNationalIdentityNumber"},
    {TransformerKind::FAKE_PHONE_NUMBER,             "FakePhoneNumber"},
    {TransformerKind::FAKE_POST_CODE,                "FakePostCode"},
    {TransformerKind::FAKE_STATE,                    "FakeState"},
    {TransformerKind::FAKE_STREET_ADDRESS,           "FakeStreetAddress"},
    {TransformerKind::FAKE_USERNAME,                 "FakeUsername"},
    {TransformerKind::FAKE_UUID,                     "FakeUUID"},
    {TransformerKind::FIXED,                         "Fixed"},
    {TransformerKind::IDENTITY,                      "Identity"},
    {TransformerKind::OBFUSCATE_DAY,                 "ObfuscateDay"},
    {TransformerKind::SCRAMBLE,                      "Scramble"},
    {TransformerKind::SCRAMBLE_BLANK,                "ScrambleBlank"},
}};

} // anonymous namespace

std::string_view data_type_to_string(DataType type) {
    for (const auto& [t, name] : kDataTypeNames) {
        if (t == type) return name;
    }
    return "Unknown";
}

DataType parse_data_type(std::string_view name) {
    for (const auto& [t, n] : kDataTypeNames) {
        if (n == name) return t;
    }
    return DataType::UNKNOWN;
}

std::string_view transformer_kind_to_string(TransformerKind kind) {
    for (const auto& [k, name] : kTransformerNames) {
        if (k == kind) return name;
    }
    return "Error";
}

TransformerKind parse_transformer_kind(std::string_view name) {
    for (const auto& [k, n] : kTransformerNames) {
        if (n == name) return k;
    }
    return TransformerKind::ERROR;
}

} // namespace dumpscrub
