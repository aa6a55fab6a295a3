#include "transform/random_source.hpp"

#include <openssl/rand.h>

#include <random>
#include <stdexcept>
#include <string_view>

namespace dumpscrub::random {

namespace {

constexpr std::string_view kAlphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

std::mt19937_64& generator() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

} // anonymous namespace

uint64_t next_u64() {
    return generator()();
}

int64_t uniform_int(int64_t lo, int64_t hi) {
    std::uniform_int_distribution<int64_t> dis(lo, hi);
    return dis(generator());
}

char alphanumeric_char() {
    return kAlphanumeric[static_cast<size_t>(
        uniform_int(0, static_cast<int64_t>(kAlphanumeric.size()) - 1))];
}

std::string digits(size_t count) {
    std::string result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result += static_cast<char>('0' + uniform_int(0, 9));
    }
    return result;
}

std::vector<uint8_t> secure_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (count == 0) return bytes;
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

} // namespace dumpscrub::random
