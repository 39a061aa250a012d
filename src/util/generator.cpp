#include <ulidgen/generator.hpp>
#include <ulidgen/log.hpp>

namespace ulidgen {

Generator::Generator(std::unique_ptr<EntropySource> source, u128 floor)
    : source_(source ? std::move(source) : no_entropy_source()),
      last_value_(floor) {}

Generator& Generator::global() {
    static Generator instance(standard_entropy_source());
    return instance;
}

std::optional<uint64_t> Generator::read_timestamp() {
    auto now = source_->timestamp();
    if (!now) {
        log::debug("entropy source has no timestamp");
        return std::nullopt;
    }
    // The last representable millisecond is reserved as headroom.
    if (*now >= TIMESTAMP_MAX) {
        log::debug("timestamp %llu is beyond the ULID range",
                   static_cast<unsigned long long>(*now));
        return std::nullopt;
    }
    return now;
}

std::optional<u128> Generator::draw_random(u128 min, u128 max) {
    auto r = source_->random(min, max);
    if (!r) {
        log::debug("entropy source has no randomness");
        return std::nullopt;
    }
    // Out-of-range answers are rejected, not clamped.
    if (*r < min || *r > max) {
        log::debug("entropy source returned randomness outside the requested range");
        return std::nullopt;
    }
    return r;
}

std::optional<u128> Generator::generate() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = read_timestamp();
    if (!now) return std::nullopt;

    u128 timestamp = u128(*now) << RANDOM_BITS;
    u128 last_timestamp = last_value_ & TIMESTAMP_MASK;

    u128 next;
    if (timestamp > last_timestamp) {
        // Randomness starts at 1 so the value is never zero, even at timestamp 0.
        auto random = draw_random(1, RANDOM_GEN_MAX);
        if (!random) return std::nullopt;
        next = timestamp | *random;
    } else {
        if (timestamp < last_timestamp) {
            log::debug("clock is behind the last ULID by %llu ms, incrementing",
                       static_cast<unsigned long long>(timestamp_of(last_value_) - *now));
        }
        if (last_value_ == U128_MAX) {
            log::debug("ULID space exhausted");
            return std::nullopt;
        }
        next = last_value_ + 1;
    }

    if (next <= last_value_) {
        log::error("generated ULID is not above the previous one, refusing it");
        return std::nullopt;
    }

    last_value_ = next;
    return next;
}

std::unique_ptr<EntropySource> Generator::install_entropy_source(std::unique_ptr<EntropySource> source) {
    if (!source) {
        source = no_entropy_source();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    source_.swap(source);
    return source;
}

std::optional<u128> generate() {
    return Generator::global().generate();
}

std::unique_ptr<EntropySource> install_entropy_source(std::unique_ptr<EntropySource> source) {
    return Generator::global().install_entropy_source(std::move(source));
}

} // namespace ulidgen
