#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "lunar_converter.h"

namespace lunisolar {

// Local civil time at which a solar term begins
struct SolarTermInstant {
    bool valid = false;
    int index = -1;
    std::string name;
    SolarDate date;
    int hour = 0;
    int minute = 0;
};

// Result of matching a date against the year's terms; index is -1 when none
struct SolarTermMatch {
    bool valid = false;
    int index = -1;
    std::string name;
};

/**
 * Standalone Solar Term Calculator
 * Term instants are a linear offset from 1900-01-06 02:05 UTC: one mean
 * tropical year per year plus a fixed minute offset per term. Accurate for
 * 1900-2100 only.
 */
class SolarTermCalculator {
public:
    static constexpr double MEAN_TROPICAL_YEAR_MS = 31556925974.7;
    static constexpr int64_t BASE_EPOCH_MS = -2208549300000LL;  // 1900-01-06T02:05:00Z
    static constexpr int TERM_COUNT = 24;

    // Uses the C library's local time zone
    SolarTermCalculator();
    // Uses a fixed offset from UTC, e.g. 480 for China Standard Time
    explicit SolarTermCalculator(int utc_offset_minutes);

    // Time zone configuration
    void use_system_timezone() { use_system_timezone_ = true; }
    void set_utc_offset_minutes(int minutes) {
        use_system_timezone_ = false;
        utc_offset_minutes_ = minutes;
    }
    bool is_using_system_timezone() const { return use_system_timezone_; }
    int get_utc_offset_minutes() const { return utc_offset_minutes_; }

    // Milliseconds since the Unix epoch at which the term begins. Returns
    // false and leaves utc_millis untouched for an index outside 0-23.
    static bool term_utc_millis(int year, int index, int64_t& utc_millis);

    SolarTermInstant get_term_instant(int year, int index) const;
    SolarDate solar_term_date(int year, int index) const;
    std::vector<SolarTermInstant> get_terms_for_year(int year) const;

    // Term whose local date equals date exactly
    SolarTermMatch get_solar_term(const SolarDate& date) const;

private:
    bool use_system_timezone_;
    int utc_offset_minutes_;

    void to_local_time(int64_t utc_millis, SolarTermInstant& instant) const;
};

} // namespace lunisolar
