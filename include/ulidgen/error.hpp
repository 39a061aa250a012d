#pragma once

#include <string>

namespace ulidgen {

struct UlidError {
    enum Code {
        TooShort,
        TooLong,
        InvalidChar,
        InvalidZero,
        TimestampOutOfRange,
        RandomnessOutOfRange,
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    UlidError() = default;
    explicit UlidError(Code c)
        : code(c), message(default_message(c)) {}
    UlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
    static const char* default_message(Code c);
};

} // namespace ulidgen
