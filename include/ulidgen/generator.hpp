#pragma once

#include <ulidgen/bits.hpp>
#include <ulidgen/entropy.hpp>
#include <memory>
#include <mutex>
#include <optional>

namespace ulidgen {

// Monotonic ULID allocator.
//
// Every value returned by one instance is strictly greater than the one
// before it. When the clock has not moved past the last timestamp, the last
// value is incremented instead of drawing fresh randomness; fresh draws stay
// below RANDOM_GEN_MAX, which leaves RESERVED increments of headroom in
// every millisecond.
//
// Any failure (no clock, clock at or past the reserved last millisecond,
// no randomness, 128-bit overflow) returns nullopt and leaves the state as
// it was. Nothing is retried.
class Generator {
public:
    // `floor` seeds the last produced value, so a sequence can be resumed
    // above an identifier persisted by an earlier run.
    explicit Generator(std::unique_ptr<EntropySource> source, u128 floor = 0);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Process-wide instance backed by StandardEntropySource
    static Generator& global();

    std::optional<u128> generate();

    // Swap the active source; the displaced one is handed back so it can be
    // restored later. A null pointer installs a NoEntropySource.
    std::unique_ptr<EntropySource> install_entropy_source(std::unique_ptr<EntropySource> source);

private:
    std::optional<uint64_t> read_timestamp();
    std::optional<u128> draw_random(u128 min, u128 max);

    std::mutex mutex_;
    std::unique_ptr<EntropySource> source_;
    u128 last_value_;
};

// Shorthands for Generator::global()
std::optional<u128> generate();
std::unique_ptr<EntropySource> install_entropy_source(std::unique_ptr<EntropySource> source);

} // namespace ulidgen
