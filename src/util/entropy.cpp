#include <ulidgen/entropy.hpp>
#include <ulidgen/log.hpp>
#include <array>
#include <chrono>
#include <fstream>

namespace ulidgen {

// ---- Seed material: /dev/urandom with std::random_device fallback ----

static std::array<uint32_t, 8> os_seed_words() {
    std::array<uint32_t, 8> words{};
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(words.data()),
                     static_cast<std::streamsize>(sizeof(words)));
        if (static_cast<size_t>(urandom.gcount()) == sizeof(words)) return words;
    }
    log::debug("/dev/urandom unavailable, seeding from std::random_device");
    std::random_device rd;
    for (auto& w : words) {
        w = rd();
    }
    return words;
}

// ---- StandardEntropySource ----

std::optional<uint64_t> StandardEntropySource::timestamp() {
    using namespace std::chrono;
    auto since_epoch = system_clock::now().time_since_epoch();
    auto millis = duration_cast<milliseconds>(since_epoch).count();
    if (millis < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(millis);
}

std::optional<u128> StandardEntropySource::random(u128 min, u128 max) {
    if (min > max) {
        return std::nullopt;
    }
    if (!rng_) {
        auto words = os_seed_words();
        std::seed_seq seq(words.begin(), words.end());
        rng_.emplace(seq);
    }
    return uniform_u128(*rng_, min, max);
}

u128 uniform_u128(std::mt19937_64& rng, u128 min, u128 max) {
    u128 span = max - min;
    if (span <= u128(UINT64_MAX)) {
        std::uniform_int_distribution<uint64_t> dist(0, static_cast<uint64_t>(span));
        return min + dist(rng);
    }

    // span needs more than 64 bits: mask two draws down to its width and retry
    // until the value lands inside. Expected draws per call stay below two.
    uint64_t hi = static_cast<uint64_t>(span >> 64);
    unsigned width = 128 - static_cast<unsigned>(__builtin_clzll(hi));
    u128 mask = width == 128 ? U128_MAX : (u128(1) << width) - 1;

    for (;;) {
        u128 r = (u128(rng()) << 64) | u128(rng());
        r &= mask;
        if (r <= span) {
            return min + r;
        }
    }
}

// ---- Factories ----

std::unique_ptr<EntropySource> no_entropy_source() {
    return std::make_unique<NoEntropySource>();
}

std::unique_ptr<EntropySource> standard_entropy_source() {
    return std::make_unique<StandardEntropySource>();
}

} // namespace ulidgen
