#pragma once

#include <ulidgen/bits.hpp>
#include <ulidgen/result.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace ulidgen::base32 {

constexpr size_t ENCODED_LEN = 26;

// Canonical alphabet; I, L, O and U are left out.
constexpr const char ALPHABET[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// Writes exactly 26 characters into `out`, most significant group first.
void encode(u128 n, char out[ENCODED_LEN]);
std::string encode(u128 n);

// Strict decode. Case-insensitive; I/L/O are read as 1/1/0.
Result<u128> decode(std::string_view s);

// Character-set check only. Accepts non-canonical case and aliases.
Status validate(std::string_view s);

// Result of canonicalize(). Either views the caller's input (which was
// already canonical) or owns a rewritten copy.
class Canonical {
public:
    static Canonical borrowed(std::string_view input);
    static Canonical owned(std::string rewritten);

    bool is_borrowed() const { return !owned_.has_value(); }
    std::string_view view() const;
    std::string str() const { return std::string(view()); }

    bool operator==(std::string_view other) const { return view() == other; }
    bool operator!=(std::string_view other) const { return view() != other; }

private:
    std::string_view borrowed_;
    std::optional<std::string> owned_;
};

// Maps i/l -> 1, o -> 0, uppercases the rest. The borrowed result refers to
// `s`, so the input must outlive it.
Result<Canonical> canonicalize(std::string_view s);

} // namespace ulidgen::base32
