#pragma once

#include <string>

namespace lunisolar {

// Gregorian calendar date; time of day never enters the conversion
struct SolarDate {
    int year;
    int month;
    int day;

    SolarDate(int y = 1900, int m = 1, int d = 31)
        : year(y), month(m), day(d) {}

    bool is_valid() const;
    std::string to_string() const;  // YYYY-MM-DD

    bool operator==(const SolarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const SolarDate& other) const { return !(*this == other); }
};

// Lunar date produced by a conversion; month is always 1-12, leap months
// are flagged through is_leap_month
struct LunarDate {
    int year;
    int month;
    int day;
    bool is_leap_month;

    LunarDate(int y = 1900, int m = 1, int d = 1, bool leap = false)
        : year(y), month(m), day(d), is_leap_month(leap) {}

    bool operator==(const LunarDate& other) const {
        return year == other.year && month == other.month && day == other.day &&
               is_leap_month == other.is_leap_month;
    }
    bool operator!=(const LunarDate& other) const { return !(*this == other); }
};

/**
 * Standalone Solar/Lunar converter
 * Walks the packed year table forward from lunar New Year 1900 (1900-01-31).
 * Within a year the leap month of month k is consumed before month k itself.
 */
class LunarConverter {
public:
    // Gregorian date of lunar 1900-01-01
    static const SolarDate EPOCH;

    // Returned for dates before EPOCH
    static const LunarDate PRE_EPOCH_FALLBACK;

    static LunarDate solar_to_lunar(const SolarDate& date);

    // Inverse of solar_to_lunar. Returns false and leaves out untouched when
    // the lunar date does not exist in the table.
    static bool lunar_to_solar(const LunarDate& lunar, SolarDate& out);

    // Whole days between EPOCH and date (negative before the epoch)
    static long days_since_epoch(const SolarDate& date);

    // Proleptic Gregorian day numbers
    static long julian_day_number(const SolarDate& date);
    static SolarDate from_julian_day_number(long jdn);

    static bool is_leap_year(int year);
    static int days_in_solar_month(int year, int month);
};

} // namespace lunisolar
