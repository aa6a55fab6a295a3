#include "transform/transformer.hpp"
#include "transform/random_source.hpp"

#include <array>
#include <cctype>
#include <format>

namespace dumpscrub {

namespace {

constexpr std::string_view kEmptyJson = "{}";
constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[static_cast<size_t>(month - 1)];
}

std::optional<int> parse_fixed_digits(std::string_view s) {
    int value = 0;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

// Drops the separators people type (space, dash, brackets, dot); anything else is kept
std::string normalise_phone(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (c != ' ' && c != '-' && c != '(' && c != ')' && c != '.') {
            out += c;
        }
    }
    return out;
}

enum class PhoneRegion { GB, US };

struct PhonePrefix {
    std::string_view prefix;
    PhoneRegion region;
};

// Longest prefixes first
constexpr std::array<PhonePrefix, 5> kPhonePrefixes = {{
    {"0044", PhoneRegion::GB},
    {"+44",  PhoneRegion::GB},
    {"001",  PhoneRegion::US},
    {"+1",   PhoneRegion::US},
    {"0",    PhoneRegion::GB},
}};

std::string random_subscriber(PhoneRegion region) {
    switch (region) {
        case PhoneRegion::GB:
            return "7" + random::digits(9);
        case PhoneRegion::US:
            return std::format("{}{}{}{}{}",
                random::uniform_int(2, 9), random::digits(2),
                random::uniform_int(2, 9), random::digits(2),
                random::digits(4));
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Stateless primitives
// ============================================================================

std::string Transformer::scramble(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (const char c : value) {
        if (c == ' ') {
            result += ' ';
        } else if (!is_utf8_continuation(c)) {
            result += random::alphanumeric_char();
        }
    }
    return result;
}

Result<std::string> Transformer::obfuscate_day(std::string_view value) {
    const auto unparseable = [&] {
        return Result<std::string>::error(ErrorCode::UNPARSEABLE_DATE,
            std::format("'{}' is not a YYYY-MM-DD date", value));
    };

    if (value.size() < 10 || value[4] != '-' || value[7] != '-') return unparseable();
    if (value.size() > 10 && value[10] != ' ' && value[10] != 'T') return unparseable();

    const auto year = parse_fixed_digits(value.substr(0, 4));
    const auto month = parse_fixed_digits(value.substr(5, 2));
    const auto day = parse_fixed_digits(value.substr(8, 2));
    if (!year || !month || !day) return unparseable();
    if (*month < 1 || *month > 12) return unparseable();
    if (*day < 1 || *day > days_in_month(*year, *month)) return unparseable();

    std::string result(value);
    result[8] = '0';
    result[9] = '1';
    return Result<std::string>::ok(std::move(result));
}

std::string Transformer::post_code(std::string_view value) {
    // First three code points
    size_t chars = 0;
    size_t end = 0;
    for (; end < value.size(); ++end) {
        if (is_utf8_continuation(value[end])) continue;
        if (chars == 3) break;
        ++chars;
    }
    return std::string(value.substr(0, end));
}

Result<std::string> Transformer::phone_number(std::string_view value) {
    const std::string normalised = normalise_phone(value);

    for (const auto& [prefix, region] : kPhonePrefixes) {
        if (!normalised.starts_with(prefix)) continue;
        // "00" followed by anything other than 44/1 is an unknown international prefix
        if (prefix == "0" && normalised.starts_with("00")) break;
        return Result<std::string>::ok(std::format("{}{}", prefix, random_subscriber(region)));
    }

    return Result<std::string>::error(ErrorCode::UNSUPPORTED_COUNTRY_CODE,
        std::format("no supported country calling code in '{}'", value));
}

std::string Transformer::base16_string() {
    const auto bytes = random::secure_bytes(16);
    std::string result;
    result.reserve(32);
    for (const uint8_t b : bytes) {
        result += kHexDigits[b >> 4];
        result += kHexDigits[b & 0x0F];
    }
    return result;
}

std::string Transformer::base32_string() {
    // 20 bytes = 160 bits = exactly 32 five-bit groups, no padding
    const auto bytes = random::secure_bytes(20);
    std::string result;
    result.reserve(32);
    uint32_t buffer = 0;
    int bits = 0;
    for (const uint8_t b : bytes) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            result += kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F];
            bits -= 5;
        }
    }
    return result;
}

std::string Transformer::uuid() {
    auto b = random::secure_bytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::string hex;
    hex.reserve(32);
    for (const uint8_t byte : b) {
        hex += kHexDigits[byte >> 4];
        hex += kHexDigits[byte & 0x0F];
    }
    return std::format("{}-{}-{}-{}-{}",
        hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4), hex.substr(16, 4), hex.substr(20));
}

std::string Transformer::ipv4() {
    return std::format("{}.{}.{}.{}",
        random::uniform_int(0, 255), random::uniform_int(0, 255),
        random::uniform_int(0, 255), random::uniform_int(0, 255));
}

std::optional<FakeCategory> Transformer::fake_category(TransformerKind kind) {
    switch (kind) {
        case TransformerKind::FAKE_CITY:                     return FakeCategory::CITY;
        case TransformerKind::FAKE_COMPANY_NAME:             return FakeCategory::COMPANY_NAME;
        case TransformerKind::FAKE_EMAIL:                    return FakeCategory::EMAIL;
        case TransformerKind::FAKE_FIRST_NAME:               return FakeCategory::FIRST_NAME;
        case TransformerKind::FAKE_FULL_ADDRESS:             return FakeCategory::FULL_ADDRESS;
        case TransformerKind::FAKE_FULL_NAME:                return FakeCategory::FULL_NAME;
        case TransformerKind::FAKE_LAST_NAME:                return FakeCategory::LAST_NAME;
        case TransformerKind::FAKE_NATIONAL_IDENTITY_NUMBER: return FakeCategory::NATIONAL_IDENTITY_NUMBER;
        case TransformerKind::FAKE_STATE:                    return FakeCategory::STATE;
        case TransformerKind::FAKE_STREET_ADDRESS:           return FakeCategory::STREET_ADDRESS;
        case TransformerKind::FAKE_USERNAME:                 return FakeCategory::USERNAME;
        default:
            return std::nullopt;
    }
}

// ============================================================================
// Application
// ============================================================================

std::string Transformer::generate_fake(FakeCategory category, TransformContext& ctx) const {
    if (!unique_) {
        return ctx.fake.generate(category);
    }
    const auto position = (category == FakeCategory::EMAIL)
        ? UniquenessTracker::SuffixPosition::BEFORE_AT
        : UniquenessTracker::SuffixPosition::END;
    return ctx.uniqueness.ensure_generated(
        ctx.key, [&] { return ctx.fake.generate(category); }, position);
}

Result<std::string> Transformer::apply(std::string_view original, TransformContext& ctx) const {
    using R = Result<std::string>;

    switch (kind_) {
        case TransformerKind::IDENTITY:
            return R::ok(std::string(original));

        case TransformerKind::FIXED:
            return R::ok(fixed_value_);

        case TransformerKind::EMPTY_JSON:
            return R::ok(std::string(kEmptyJson));

        case TransformerKind::SCRAMBLE:
            return R::ok(scramble(original));

        case TransformerKind::SCRAMBLE_BLANK:
            return R::ok(std::string());

        case TransformerKind::OBFUSCATE_DAY:
            return obfuscate_day(original);

        case TransformerKind::FAKE_POST_CODE:
            return R::ok(post_code(original));

        case TransformerKind::FAKE_PHONE_NUMBER: {
            auto first = phone_number(original);
            if (first.is_error() || !unique_) return first;
            return R::ok(ctx.uniqueness.ensure_generated(ctx.key, [&, attempt = 0]() mutable {
                // The already generated number is the first candidate
                if (attempt++ == 0) return first.value();
                return phone_number(original).value();
            }));
        }

        case TransformerKind::FAKE_BASE16_STRING:
            return R::ok(base16_string());

        case TransformerKind::FAKE_BASE32_STRING:
            return R::ok(base32_string());

        case TransformerKind::FAKE_UUID:
            return R::ok(uuid());

        case TransformerKind::FAKE_IPV4:
            return R::ok(ipv4());

        case TransformerKind::FAKE_CITY:
        case TransformerKind::FAKE_COMPANY_NAME:
        case TransformerKind::FAKE_EMAIL:
        case TransformerKind::FAKE_FIRST_NAME:
        case TransformerKind::FAKE_FULL_ADDRESS:
        case TransformerKind::FAKE_FULL_NAME:
        case TransformerKind::FAKE_LAST_NAME:
        case TransformerKind::FAKE_NATIONAL_IDENTITY_NUMBER:
        case TransformerKind::FAKE_STATE:
        case TransformerKind::FAKE_STREET_ADDRESS:
        case TransformerKind::FAKE_USERNAME:
            return R::ok(generate_fake(*fake_category(kind_), ctx));

        case TransformerKind::ERROR:
            return R::error(ErrorCode::UNCONFIGURED_TRANSFORMER,
                std::format("{} has no transformer configured", ctx.key.full_name()));
    }
    return R::error(ErrorCode::UNCONFIGURED_TRANSFORMER, "unhandled transformer kind");
}

} // namespace dumpscrub
