#include <ulidgen/timefmt.hpp>
#include <cstdio>

namespace ulidgen {

// Civil-from-days over 400-year eras (proleptic Gregorian). Years start in
// March so the leap day is the last day of the shifted year.
static void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day) {
    days += 719468;  // 0000-03-01 -> 1970-01-01
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);          // [0, 146096]
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);              // [0, 365]
    const unsigned mp = (5 * doy + 2) / 153;                                  // [0, 11]
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int64_t>(yoe) + era * 400 + (month <= 2 ? 1 : 0);
}

std::string format_timestamp(uint64_t millis) {
    uint64_t secs = millis / 1000;
    unsigned ms = static_cast<unsigned>(millis % 1000);
    unsigned sec = static_cast<unsigned>(secs % 60);
    unsigned min = static_cast<unsigned>((secs / 60) % 60);
    unsigned hour = static_cast<unsigned>((secs / 3600) % 24);
    int64_t days = static_cast<int64_t>(secs / 86400);

    int64_t year;
    unsigned month, day;
    civil_from_days(days, year, month, day);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%03uZ",
                  static_cast<long long>(year), month, day, hour, min, sec, ms);
    return buf;
}

} // namespace ulidgen
