#include <ulidgen/base32.hpp>

namespace ulidgen::base32 {

// ---- Inverse alphabet: ASCII -> 5-bit group, -1 for invalid ----
// Lowercase mirrors uppercase; I and L alias 1, O aliases 0, U is rejected.

static constexpr int8_t DECODE[256] = {
    /* 0x00 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0x10 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0x20 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0x30 */  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, -1, -1, -1, -1, -1, -1,
    /* 0x40 */ -1, 10, 11, 12, 13, 14, 15, 16, 17,  1, 18, 19,  1, 20, 21,  0,
    /* 0x50 */ 22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1,
    /* 0x60 */ -1, 10, 11, 12, 13, 14, 15, 16, 17,  1, 18, 19,  1, 20, 21,  0,
    /* 0x70 */ 22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1,
    /* 0x80 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0x90 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xA0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xB0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xC0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xD0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xE0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    /* 0xF0 */ -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
};

static inline int digit_of(char c) {
    return DECODE[static_cast<unsigned char>(c)];
}

static inline bool is_ascii_alnum(char c) {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static Status check_length(std::string_view s) {
    if (s.size() < ENCODED_LEN) return UlidError::TooShort;
    if (s.size() > ENCODED_LEN) return UlidError::TooLong;
    return ok_status();
}

// ---- encode ----

void encode(u128 n, char out[ENCODED_LEN]) {
    for (int i = static_cast<int>(ENCODED_LEN) - 1; i >= 0; --i) {
        out[i] = ALPHABET[static_cast<unsigned>(n & 0x1F)];
        n >>= 5;
    }
}

std::string encode(u128 n) {
    char buf[ENCODED_LEN];
    encode(n, buf);
    return std::string(buf, ENCODED_LEN);
}

// ---- decode ----

Result<u128> decode(std::string_view s) {
    ULIDGEN_TRY(check_length(s));

    // 26 * 5 = 130 bits: the leading group may only carry 3 of them.
    int first = digit_of(s[0]);
    if (first < 0 || first > 7) {
        return UlidError::InvalidChar;
    }

    u128 n = static_cast<u128>(first);
    for (size_t i = 1; i < ENCODED_LEN; ++i) {
        int d = digit_of(s[i]);
        if (d < 0) {
            return UlidError::InvalidChar;
        }
        n = (n << 5) | static_cast<u128>(d);
    }
    return Result<u128>::ok(n);
}

// ---- validate ----

static bool is_valid_first_char(char c) {
    switch (c) {
        case '0': case '1': case '2': case '3':
        case '4': case '5': case '6': case '7':
        case 'o': case 'O': case 'i': case 'I': case 'l': case 'L':
            return true;
        default:
            return false;
    }
}

static bool is_valid_char(char c) {
    return is_ascii_alnum(c) && c != 'u' && c != 'U';
}

Status validate(std::string_view s) {
    ULIDGEN_TRY(check_length(s));

    if (!is_valid_first_char(s[0])) {
        return UlidError::InvalidChar;
    }
    for (size_t i = 1; i < ENCODED_LEN; ++i) {
        if (!is_valid_char(s[i])) {
            return UlidError::InvalidChar;
        }
    }
    return ok_status();
}

// ---- canonicalize ----

// Returns 0 for characters that cannot appear at this position.
static char normalize_char(char c) {
    switch (c) {
        case 'i': case 'I': case 'l': case 'L': return '1';
        case 'o': case 'O': return '0';
        case 'u': case 'U': return 0;
        default: break;
    }
    if (!is_ascii_alnum(c)) return 0;
    if (c >= 'a' && c <= 'z') return static_cast<char>(c - 'a' + 'A');
    return c;
}

static char normalize_first_char(char c) {
    char n = normalize_char(c);
    return (n >= '0' && n <= '7') ? n : 0;
}

Canonical Canonical::borrowed(std::string_view input) {
    Canonical c;
    c.borrowed_ = input;
    return c;
}

Canonical Canonical::owned(std::string rewritten) {
    Canonical c;
    c.owned_ = std::move(rewritten);
    return c;
}

std::string_view Canonical::view() const {
    if (owned_) return *owned_;
    return borrowed_;
}

Result<Canonical> canonicalize(std::string_view s) {
    ULIDGEN_TRY(check_length(s));

    char buf[ENCODED_LEN];
    buf[0] = normalize_first_char(s[0]);
    if (buf[0] == 0) {
        return UlidError::InvalidChar;
    }
    for (size_t i = 1; i < ENCODED_LEN; ++i) {
        buf[i] = normalize_char(s[i]);
        if (buf[i] == 0) {
            return UlidError::InvalidChar;
        }
    }

    std::string_view cleaned(buf, ENCODED_LEN);
    if (cleaned == s) {
        return Result<Canonical>::ok(Canonical::borrowed(s));
    }
    return Result<Canonical>::ok(Canonical::owned(std::string(cleaned)));
}

} // namespace ulidgen::base32
