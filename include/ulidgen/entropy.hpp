#pragma once

#include <ulidgen/bits.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace ulidgen {

// Supplies the two nondeterministic inputs of generation. An empty optional
// means "unavailable" and makes the generation fail.
//
// The generator never calls one source from two threads at once, so
// implementations need no locking of their own.
class EntropySource {
public:
    virtual ~EntropySource() = default;

    // Milliseconds since the Unix epoch
    virtual std::optional<uint64_t> timestamp() = 0;

    // Uniform value in [min, max] (inclusive)
    virtual std::optional<u128> random(u128 min, u128 max) = 0;
};

// Never yields anything; installing it disables generation.
class NoEntropySource : public EntropySource {
public:
    std::optional<uint64_t> timestamp() override { return std::nullopt; }
    std::optional<u128> random(u128, u128) override { return std::nullopt; }
};

// System clock plus a mt19937_64 seeded from OS entropy on first use.
class StandardEntropySource : public EntropySource {
public:
    std::optional<uint64_t> timestamp() override;
    std::optional<u128> random(u128 min, u128 max) override;

private:
    std::optional<std::mt19937_64> rng_;
};

std::unique_ptr<EntropySource> no_entropy_source();
std::unique_ptr<EntropySource> standard_entropy_source();

// Uniform draw from [min, max] over any 64-bit engine (rejection sampling
// for spans wider than 64 bits). Exposed for custom sources.
u128 uniform_u128(std::mt19937_64& rng, u128 min, u128 max);

} // namespace ulidgen
