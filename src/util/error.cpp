#include <ulidgen/error.hpp>

namespace ulidgen {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case TooShort:             return "TooShort";
        case TooLong:              return "TooLong";
        case InvalidChar:          return "InvalidChar";
        case InvalidZero:          return "InvalidZero";
        case TimestampOutOfRange:  return "TimestampOutOfRange";
        case RandomnessOutOfRange: return "RandomnessOutOfRange";
        case IO:                   return "IO";
        case Parse:                return "Parse";
        case Config:               return "Config";
        case InvalidArg:           return "InvalidArg";
    }
    return "Unknown";
}

const char* UlidError::default_message(Code c) {
    switch (c) {
        case TooShort:             return "string is too short";
        case TooLong:              return "string is too long";
        case InvalidChar:          return "string contains an invalid character";
        case InvalidZero:          return "invalid zero value";
        case TimestampOutOfRange:  return "timestamp is too large";
        case RandomnessOutOfRange: return "randomness is too large";
        case IO:                   return "I/O error";
        case Parse:                return "parse error";
        case Config:               return "invalid configuration";
        case InvalidArg:           return "invalid argument";
    }
    return "unknown error";
}

std::string UlidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ulidgen
