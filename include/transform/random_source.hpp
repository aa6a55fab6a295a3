#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dumpscrub::random {

// Non-cryptographic, per-thread Mersenne Twister. Safe to call concurrently.
[[nodiscard]] uint64_t next_u64();

// Uniform integer in [lo, hi]
[[nodiscard]] int64_t uniform_int(int64_t lo, int64_t hi);

[[nodiscard]] char alphanumeric_char();

[[nodiscard]] std::string digits(size_t count);

// Cryptographically secure bytes (OpenSSL RAND_bytes); throws std::runtime_error on failure
[[nodiscard]] std::vector<uint8_t> secure_bytes(size_t count);

} // namespace dumpscrub::random
