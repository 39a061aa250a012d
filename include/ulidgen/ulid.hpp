#pragma once

#include <ulidgen/bits.hpp>
#include <ulidgen/result.hpp>
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace ulidgen {

class ZeroableUlid;

// A ULID that is never zero. This is the type to use unless a zero
// sentinel is really wanted; "no ULID" is better expressed as
// std::optional<Ulid>.
class Ulid {
public:
    static constexpr Ulid MIN() { return Ulid(1); }
    static constexpr Ulid MAX() { return Ulid(U128_MAX); }

    // Next value from the global generator. Throws std::runtime_error if the
    // generator cannot produce one (see try_generate()).
    static Ulid generate();
    static std::optional<Ulid> try_generate();

    static Result<Ulid> from_parts(uint64_t timestamp, u128 randomness);
    static std::optional<Ulid> from_u128(u128 n);
    static std::optional<Ulid> from_bytes(const std::array<uint8_t, 16>& bytes);
    static Result<Ulid> from_bytes(const uint8_t* data, size_t len);
    static Result<Ulid> from_zeroable(ZeroableUlid z);

    // Case-insensitive; fails with InvalidZero on "000...0".
    static Result<Ulid> parse(std::string_view s);

    uint64_t timestamp() const { return timestamp_of(value_); }
    u128 randomness() const { return randomness_of(value_); }
    std::pair<uint64_t, u128> to_parts() const { return {timestamp(), randomness()}; }

    u128 to_u128() const { return value_; }
    std::array<uint8_t, 16> to_bytes() const { return to_be_bytes(value_); }

    // Empty if the timestamp does not fit system_clock's range.
    std::optional<std::chrono::system_clock::time_point> datetime() const;

    std::string to_string() const;
    // Ulid { string: "...", timestamp: "...", randomness: "..." }
    std::string debug_string() const;

    bool operator==(const Ulid& o) const { return value_ == o.value_; }
    bool operator!=(const Ulid& o) const { return value_ != o.value_; }
    bool operator<(const Ulid& o) const { return value_ < o.value_; }
    bool operator<=(const Ulid& o) const { return value_ <= o.value_; }
    bool operator>(const Ulid& o) const { return value_ > o.value_; }
    bool operator>=(const Ulid& o) const { return value_ >= o.value_; }

private:
    constexpr explicit Ulid(u128 n) : value_(n) {}

    u128 value_;
};

// A ULID that may be zero, e.g. as an "unset" marker in fixed layouts.
class ZeroableUlid {
public:
    constexpr ZeroableUlid() = default;
    // Every Ulid is a valid ZeroableUlid.
    ZeroableUlid(Ulid u) : value_(u.to_u128()) {}

    static constexpr ZeroableUlid MIN() { return ZeroableUlid(); }
    static constexpr ZeroableUlid MAX() { return ZeroableUlid(U128_MAX, 0); }
    static constexpr ZeroableUlid zeroed() { return ZeroableUlid(); }
    static constexpr ZeroableUlid from_u128(u128 n) { return ZeroableUlid(n, 0); }

    // Generated values are never zero. generate() throws std::runtime_error
    // when the generator cannot produce one.
    static ZeroableUlid generate();
    static std::optional<ZeroableUlid> try_generate();

    static Result<ZeroableUlid> from_parts(uint64_t timestamp, u128 randomness);
    static ZeroableUlid from_bytes(const std::array<uint8_t, 16>& bytes);
    static Result<ZeroableUlid> from_bytes(const uint8_t* data, size_t len);
    static Result<ZeroableUlid> parse(std::string_view s);

    bool is_zero() const { return value_ == 0; }
    uint64_t timestamp() const { return timestamp_of(value_); }
    u128 randomness() const { return randomness_of(value_); }
    std::pair<uint64_t, u128> to_parts() const { return {timestamp(), randomness()}; }

    u128 to_u128() const { return value_; }
    std::array<uint8_t, 16> to_bytes() const { return to_be_bytes(value_); }
    std::optional<Ulid> to_ulid() const { return Ulid::from_u128(value_); }

    std::optional<std::chrono::system_clock::time_point> datetime() const;

    std::string to_string() const;
    std::string debug_string() const;

    bool operator==(const ZeroableUlid& o) const { return value_ == o.value_; }
    bool operator!=(const ZeroableUlid& o) const { return value_ != o.value_; }
    bool operator<(const ZeroableUlid& o) const { return value_ < o.value_; }
    bool operator<=(const ZeroableUlid& o) const { return value_ <= o.value_; }
    bool operator>(const ZeroableUlid& o) const { return value_ > o.value_; }
    bool operator>=(const ZeroableUlid& o) const { return value_ >= o.value_; }

private:
    constexpr ZeroableUlid(u128 n, int) : value_(n) {}

    u128 value_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Ulid& u);
std::ostream& operator<<(std::ostream& os, const ZeroableUlid& u);

// Mixes the two 64-bit halves of a ULID value.
size_t hash_u128(u128 n);

} // namespace ulidgen

namespace std {

template<>
struct hash<ulidgen::Ulid> {
    size_t operator()(const ulidgen::Ulid& u) const { return ulidgen::hash_u128(u.to_u128()); }
};

template<>
struct hash<ulidgen::ZeroableUlid> {
    size_t operator()(const ulidgen::ZeroableUlid& u) const { return ulidgen::hash_u128(u.to_u128()); }
};

} // namespace std
