#include <catch2/catch.hpp>
#include <ulidgen/ulid.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <thread>
#include <unordered_set>

using namespace ulidgen;

// ===== Generation =====

TEST_CASE("generated ULIDs are unique and increasing", "[ulid]") {
    auto u1 = Ulid::generate();
    auto u2 = Ulid::generate();
    auto u3 = Ulid::generate();

    REQUIRE(u1 < u2);
    REQUIRE(u2 < u3);
    REQUIRE(u1 != u3);
}

TEST_CASE("generated timestamps follow the clock", "[ulid]") {
    auto u1 = Ulid::generate();
    auto u2 = Ulid::generate();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    auto u3 = Ulid::generate();

    REQUIRE(u1.timestamp() <= u2.timestamp());
    REQUIRE(u2.timestamp() < u3.timestamp());
    REQUIRE(u1.timestamp() > 1704067200000ULL);  // 2024-01-01
}

TEST_CASE("try_generate yields values", "[ulid]") {
    auto a = Ulid::try_generate();
    auto b = ZeroableUlid::try_generate();
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE_FALSE(b->is_zero());
    REQUIRE(ZeroableUlid(*a) < *b);
}

TEST_CASE("generated ULID string is 26 chars", "[ulid]") {
    REQUIRE(Ulid::generate().to_string().size() == 26);
    REQUIRE(ZeroableUlid::generate().to_string().size() == 26);
}

// ===== Limits =====

TEST_CASE("MIN and MAX", "[ulid]") {
    REQUIRE(Ulid::MIN().to_u128() == u128(1));
    REQUIRE(Ulid::MAX().to_u128() == U128_MAX);
    REQUIRE(Ulid::MAX().to_string() == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
}

TEST_CASE("zeroed ZeroableUlid", "[ulid]") {
    ZeroableUlid z;
    REQUIRE(z.is_zero());
    REQUIRE(z == ZeroableUlid::zeroed());
    REQUIRE(z.to_string() == "00000000000000000000000000");
    REQUIRE_FALSE(z.to_ulid().has_value());
}

TEST_CASE("ZeroableUlid MIN and MAX", "[ulid]") {
    REQUIRE(ZeroableUlid::MIN().is_zero());
    REQUIRE(ZeroableUlid::MIN() == ZeroableUlid::zeroed());
    REQUIRE(ZeroableUlid::MAX().to_u128() == U128_MAX);
    REQUIRE(ZeroableUlid::MAX() == ZeroableUlid(Ulid::MAX()));
    REQUIRE(ZeroableUlid::MAX().to_string() == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    REQUIRE(ZeroableUlid::MIN() < ZeroableUlid(Ulid::MIN()));
}

// ===== Parsing =====

TEST_CASE("parse round-trips through lowercase", "[ulid]") {
    auto u = Ulid::generate();
    std::string lower = u.to_string();
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    auto parsed = Ulid::parse(lower);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("parse zero string", "[ulid]") {
    auto nz = Ulid::parse("00000000000000000000000000");
    REQUIRE(nz.is_err());
    REQUIRE(nz.error().code == UlidError::InvalidZero);

    auto z = ZeroableUlid::parse("oooooooooooooooooooooooooo");
    REQUIRE(z.is_ok());
    REQUIRE(z.value().is_zero());
}

TEST_CASE("parse max and overflow", "[ulid]") {
    auto max = Ulid::parse("7zzzzzzzzzzzzzzzzzzzzzzzzz");
    REQUIRE(max.is_ok());
    REQUIRE(max.value() == Ulid::MAX());

    auto over = Ulid::parse("80000000000000000000000000");
    REQUIRE(over.is_err());
    REQUIRE(over.error().code == UlidError::InvalidChar);
}

TEST_CASE("parse length errors", "[ulid]") {
    REQUIRE(ZeroableUlid::parse("").error().code == UlidError::TooShort);
    REQUIRE(ZeroableUlid::parse("1234567890123456789012345").error().code == UlidError::TooShort);
    REQUIRE(ZeroableUlid::parse("123456789012345678901234567").error().code == UlidError::TooLong);
    REQUIRE(ZeroableUlid::parse("zzzzzzzzzzzzzzzzzzzzzzzzzz").error().code == UlidError::InvalidChar);
}

// ===== Parts =====

TEST_CASE("from_parts zero", "[ulid]") {
    auto nz = Ulid::from_parts(0, 0);
    REQUIRE(nz.is_err());
    REQUIRE(nz.error().code == UlidError::InvalidZero);

    auto z = ZeroableUlid::from_parts(0, 0);
    REQUIRE(z.is_ok());
    REQUIRE(z.value() == ZeroableUlid::zeroed());

    auto one = ZeroableUlid::from_parts(0, 1);
    REQUIRE(one.value() == ZeroableUlid::from_u128(1));
}

TEST_CASE("from_parts bounds", "[ulid]") {
    u128 max_rnd = (u128(1) << 80) - 1;
    uint64_t max_ts = (uint64_t(1) << 48) - 1;

    REQUIRE(ZeroableUlid::from_parts(max_ts, max_rnd).is_ok());
    REQUIRE(Ulid::from_parts(max_ts, max_rnd).value() == Ulid::MAX());

    auto rnd = ZeroableUlid::from_parts(max_ts, u128(1) << 80);
    REQUIRE(rnd.error().code == UlidError::RandomnessOutOfRange);

    auto ts = ZeroableUlid::from_parts(uint64_t(1) << 48, max_rnd);
    REQUIRE(ts.error().code == UlidError::TimestampOutOfRange);

    auto nz_ts = Ulid::from_parts(uint64_t(1) << 48, 1);
    REQUIRE(nz_ts.error().code == UlidError::TimestampOutOfRange);
}

TEST_CASE("to_parts round-trip", "[ulid]") {
    auto u = Ulid::generate();
    auto parts = u.to_parts();
    REQUIRE(parts.first == u.timestamp());
    REQUIRE(parts.second == u.randomness());
    REQUIRE(Ulid::from_parts(parts.first, parts.second).value() == u);
}

// ===== Bytes and integers =====

TEST_CASE("to_bytes is big-endian", "[ulid]") {
    auto u = Ulid::parse("01JB05JV6H9ZA2YQ6X3K1DAGVA").value();
    std::array<uint8_t, 16> expected = {1, 146, 192, 89, 108, 209, 79, 212,
                                        47, 92, 221, 28, 194, 213, 67, 106};
    REQUIRE(u.to_bytes() == expected);

    auto back = Ulid::from_bytes(expected);
    REQUIRE(back.has_value());
    REQUIRE(back->to_string() == "01JB05JV6H9ZA2YQ6X3K1DAGVA");
}

TEST_CASE("from_bytes all zero", "[ulid]") {
    std::array<uint8_t, 16> zeros{};
    REQUIRE_FALSE(Ulid::from_bytes(zeros).has_value());
    REQUIRE(ZeroableUlid::from_bytes(zeros).is_zero());

    auto r = Ulid::from_bytes(zeros.data(), zeros.size());
    REQUIRE(r.error().code == UlidError::InvalidZero);
}

TEST_CASE("from_bytes length checks", "[ulid]") {
    uint8_t buf[20] = {1};
    REQUIRE(Ulid::from_bytes(buf, 15).error().code == UlidError::TooShort);
    REQUIRE(Ulid::from_bytes(buf, 17).error().code == UlidError::TooLong);
    REQUIRE(ZeroableUlid::from_bytes(buf, 0).error().code == UlidError::TooShort);
    REQUIRE(ZeroableUlid::from_bytes(buf, 16).is_ok());
}

TEST_CASE("from_u128 known value", "[ulid]") {
    auto u = Ulid::parse("01JB07NQ643XZXVHZDY0JNYR02").value();
    REQUIRE(to_decimal(u.to_u128()) == "2091207293934528941058695985186693122");
    REQUIRE(Ulid::from_u128(u.to_u128()).value() == u);
    REQUIRE_FALSE(Ulid::from_u128(0).has_value());
}

// ===== Conversions between domains =====

TEST_CASE("Ulid converts to ZeroableUlid", "[ulid]") {
    auto u = Ulid::generate();
    ZeroableUlid z = u;
    REQUIRE(z.to_u128() == u.to_u128());
    REQUIRE(z.to_ulid().value() == u);
}

TEST_CASE("ZeroableUlid converts to Ulid unless zero", "[ulid]") {
    auto ok = Ulid::from_zeroable(ZeroableUlid::from_u128(42));
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().to_u128() == u128(42));

    auto zero = Ulid::from_zeroable(ZeroableUlid::zeroed());
    REQUIRE(zero.is_err());
    REQUIRE(zero.error().code == UlidError::InvalidZero);
}

// ===== Formatting =====

TEST_CASE("debug string", "[ulid]") {
    const char* s = "01javee2cb2r1mp14kpoawiwiz";
    auto z = ZeroableUlid::parse(s).value();
    auto u = Ulid::parse(s).value();

    REQUIRE(z.debug_string() ==
        "ZeroableUlid { string: \"01JAVEE2CB2R1MP14KP0AW1W1Z\", "
        "timestamp: \"2024-10-23T01:04:07.563Z\", randomness: \"16034B0493B015C0F03F\" }");
    REQUIRE(u.debug_string() ==
        "Ulid { string: \"01JAVEE2CB2R1MP14KP0AW1W1Z\", "
        "timestamp: \"2024-10-23T01:04:07.563Z\", randomness: \"16034B0493B015C0F03F\" }");
}

TEST_CASE("stream output matches to_string", "[ulid]") {
    auto u = Ulid::generate();
    std::ostringstream os;
    os << u << " " << ZeroableUlid::zeroed();
    REQUIRE(os.str() == u.to_string() + " 00000000000000000000000000");
}

TEST_CASE("datetime", "[ulid]") {
    auto u = Ulid::generate();
    auto dt = u.datetime();
    REQUIRE(dt.has_value());
    REQUIRE(*dt <= std::chrono::system_clock::now());

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(dt->time_since_epoch());
    REQUIRE(static_cast<uint64_t>(ms.count()) == u.timestamp());
}

// ===== Hashing =====

TEST_CASE("ULIDs work as unordered keys", "[ulid]") {
    std::unordered_set<Ulid> seen;
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(seen.insert(Ulid::generate()).second);
    }
    auto first = *seen.begin();
    REQUIRE_FALSE(seen.insert(first).second);

    std::unordered_set<ZeroableUlid> zs{ZeroableUlid::zeroed(), ZeroableUlid::zeroed()};
    REQUIRE(zs.size() == 1);
}
