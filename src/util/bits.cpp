#include <ulidgen/bits.hpp>
#include <algorithm>

namespace ulidgen {

Result<u128> from_parts(uint64_t timestamp, u128 randomness) {
    if (timestamp > TIMESTAMP_MAX) {
        return UlidError::TimestampOutOfRange;
    }
    if (randomness > RANDOM_MASK) {
        return UlidError::RandomnessOutOfRange;
    }
    return Result<u128>::ok((u128(timestamp) << RANDOM_BITS) | randomness);
}

std::array<uint8_t, 16> to_be_bytes(u128 n) {
    std::array<uint8_t, 16> out;
    for (int i = 15; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(n & 0xFF);
        n >>= 8;
    }
    return out;
}

u128 from_be_bytes(const std::array<uint8_t, 16>& bytes) {
    u128 n = 0;
    for (uint8_t b : bytes) {
        n = (n << 8) | b;
    }
    return n;
}

Result<u128> from_be_bytes(const uint8_t* data, size_t len) {
    if (len < 16) return UlidError::TooShort;
    if (len > 16) return UlidError::TooLong;

    std::array<uint8_t, 16> bytes;
    std::copy(data, data + 16, bytes.begin());
    return Result<u128>::ok(from_be_bytes(bytes));
}

static const char hex_chars[] = "0123456789ABCDEF";

std::string to_hex(u128 n, int width) {
    std::string out(static_cast<size_t>(width), '0');
    for (int i = width - 1; i >= 0 && n != 0; --i) {
        out[static_cast<size_t>(i)] = hex_chars[static_cast<unsigned>(n & 0xF)];
        n >>= 4;
    }
    return out;
}

std::string to_decimal(u128 n) {
    if (n == 0) return "0";
    std::string out;
    while (n != 0) {
        out += static_cast<char>('0' + static_cast<int>(n % 10));
        n /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace ulidgen
