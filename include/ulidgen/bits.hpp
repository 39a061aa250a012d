#pragma once

#include <ulidgen/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidgen {

// GCC/Clang 128-bit integer; the whole library is built around it.
using u128 = unsigned __int128;

// ---- ULID layout: [48-bit timestamp | 80-bit randomness] ----

constexpr unsigned RANDOM_BITS = 80;
constexpr unsigned TIMESTAMP_BITS = 48;

constexpr u128 U128_MAX = ~u128(0);

constexpr u128 RANDOM_MASK = (u128(1) << RANDOM_BITS) - 1;
constexpr uint64_t TIMESTAMP_MAX = (uint64_t(1) << TIMESTAMP_BITS) - 1;
constexpr u128 TIMESTAMP_MASK = u128(TIMESTAMP_MAX) << RANDOM_BITS;

// Random values never drawn fresh; only reachable by incrementing.
constexpr u128 RESERVED = 10000000000ULL;
constexpr u128 RANDOM_GEN_MAX = RANDOM_MASK - RESERVED;

constexpr uint64_t timestamp_of(u128 n) {
    return static_cast<uint64_t>(n >> RANDOM_BITS);
}

constexpr u128 randomness_of(u128 n) {
    return n & RANDOM_MASK;
}

// Compose a value from its parts, rejecting parts wider than 48/80 bits.
Result<u128> from_parts(uint64_t timestamp, u128 randomness);

// ---- Binary form: 16 bytes, big-endian ----

std::array<uint8_t, 16> to_be_bytes(u128 n);
u128 from_be_bytes(const std::array<uint8_t, 16>& bytes);

// Length-checked variant for untyped buffers (TooShort / TooLong)
Result<u128> from_be_bytes(const uint8_t* data, size_t len);

// ---- Text helpers for diagnostics ----

// Uppercase hex, zero-padded to `width` digits
std::string to_hex(u128 n, int width);
std::string to_decimal(u128 n);

} // namespace ulidgen
