#pragma once

#include <cstdint>
#include <string>

namespace ulidgen {

// RFC 3339 UTC with milliseconds: "2024-10-23T01:04:07.563Z".
// Covers the whole 48-bit ULID range (years 1970 through 10889).
std::string format_timestamp(uint64_t millis);

} // namespace ulidgen
