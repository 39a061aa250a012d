#include <ulidgen/ulid.hpp>
#include <ulidgen/base32.hpp>
#include <ulidgen/generator.hpp>
#include <ulidgen/log.hpp>
#include <ulidgen/timefmt.hpp>
#include <stdexcept>

namespace ulidgen {

// ---- Shared helpers ----

static u128 generate_or_throw() {
    auto n = generate();
    if (!n) {
        log::error("no ULID available: the entropy source failed or the ULID space is exhausted");
        throw std::runtime_error("ULID generation failed");
    }
    return *n;
}

static std::optional<std::chrono::system_clock::time_point> to_time_point(uint64_t millis) {
    using namespace std::chrono;
    using tp = system_clock::time_point;
    auto limit = duration_cast<milliseconds>(tp::duration::max()).count();
    if (millis > static_cast<uint64_t>(limit)) {
        return std::nullopt;
    }
    return tp(duration_cast<tp::duration>(milliseconds(static_cast<int64_t>(millis))));
}

static std::string debug_ulid(const char* name, u128 n) {
    std::string out = name;
    out += " { string: \"";
    out += base32::encode(n);
    out += "\", timestamp: \"";
    out += format_timestamp(timestamp_of(n));
    out += "\", randomness: \"";
    out += to_hex(randomness_of(n), 20);
    out += "\" }";
    return out;
}

size_t hash_u128(u128 n) {
    uint64_t lo = static_cast<uint64_t>(n);
    uint64_t hi = static_cast<uint64_t>(n >> 64);
    size_t seed = std::hash<uint64_t>{}(hi);
    seed ^= std::hash<uint64_t>{}(lo) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    return seed;
}

// ---- Ulid ----

Ulid Ulid::generate() {
    return Ulid(generate_or_throw());
}

std::optional<Ulid> Ulid::try_generate() {
    auto n = ulidgen::generate();
    if (!n) return std::nullopt;
    return from_u128(*n);
}

Result<Ulid> Ulid::from_parts(uint64_t timestamp, u128 randomness) {
    auto n = ulidgen::from_parts(timestamp, randomness);
    ULIDGEN_TRY(n);
    if (n.value() == 0) {
        return UlidError::InvalidZero;
    }
    return Result<Ulid>::ok(Ulid(n.value()));
}

std::optional<Ulid> Ulid::from_u128(u128 n) {
    if (n == 0) return std::nullopt;
    return Ulid(n);
}

std::optional<Ulid> Ulid::from_bytes(const std::array<uint8_t, 16>& bytes) {
    return from_u128(from_be_bytes(bytes));
}

Result<Ulid> Ulid::from_bytes(const uint8_t* data, size_t len) {
    auto n = from_be_bytes(data, len);
    ULIDGEN_TRY(n);
    if (n.value() == 0) {
        return UlidError::InvalidZero;
    }
    return Result<Ulid>::ok(Ulid(n.value()));
}

Result<Ulid> Ulid::from_zeroable(ZeroableUlid z) {
    if (z.is_zero()) {
        return UlidError::InvalidZero;
    }
    return Result<Ulid>::ok(Ulid(z.to_u128()));
}

Result<Ulid> Ulid::parse(std::string_view s) {
    auto n = base32::decode(s);
    ULIDGEN_TRY(n);
    if (n.value() == 0) {
        return UlidError::InvalidZero;
    }
    return Result<Ulid>::ok(Ulid(n.value()));
}

std::optional<std::chrono::system_clock::time_point> Ulid::datetime() const {
    return to_time_point(timestamp());
}

std::string Ulid::to_string() const {
    return base32::encode(value_);
}

std::string Ulid::debug_string() const {
    return debug_ulid("Ulid", value_);
}

// ---- ZeroableUlid ----

ZeroableUlid ZeroableUlid::generate() {
    return from_u128(generate_or_throw());
}

std::optional<ZeroableUlid> ZeroableUlid::try_generate() {
    auto n = ulidgen::generate();
    if (!n) return std::nullopt;
    return from_u128(*n);
}

Result<ZeroableUlid> ZeroableUlid::from_parts(uint64_t timestamp, u128 randomness) {
    return ulidgen::from_parts(timestamp, randomness).map(from_u128);
}

ZeroableUlid ZeroableUlid::from_bytes(const std::array<uint8_t, 16>& bytes) {
    return from_u128(from_be_bytes(bytes));
}

Result<ZeroableUlid> ZeroableUlid::from_bytes(const uint8_t* data, size_t len) {
    return from_be_bytes(data, len).map(from_u128);
}

Result<ZeroableUlid> ZeroableUlid::parse(std::string_view s) {
    return base32::decode(s).map(from_u128);
}

std::optional<std::chrono::system_clock::time_point> ZeroableUlid::datetime() const {
    return to_time_point(timestamp());
}

std::string ZeroableUlid::to_string() const {
    return base32::encode(value_);
}

std::string ZeroableUlid::debug_string() const {
    return debug_ulid("ZeroableUlid", value_);
}

// ---- Streams ----

std::ostream& operator<<(std::ostream& os, const Ulid& u) {
    char buf[base32::ENCODED_LEN];
    base32::encode(u.to_u128(), buf);
    return os.write(buf, base32::ENCODED_LEN);
}

std::ostream& operator<<(std::ostream& os, const ZeroableUlid& u) {
    char buf[base32::ENCODED_LEN];
    base32::encode(u.to_u128(), buf);
    return os.write(buf, base32::ENCODED_LEN);
}

} // namespace ulidgen
