#pragma once

#include <cstdint>

namespace lunisolar {

/**
 * Packed lunar year data for 1900-2100
 *
 * Each entry encodes, from the low bits up:
 *   bits 0-3   leap month (1-12), 0 when the year has none
 *   bits 4-15  big/small flag per regular month, month 1 in bit 15
 *   bit 16     big/small flag of the leap month
 * A big month has 30 days, a small month 29.
 */
class LunarYearTable {
public:
    static constexpr int MIN_YEAR = 1900;
    static constexpr int MAX_YEAR = 2100;
    static constexpr int LEAP_MONTH = 13;  // Month index used to address the leap month

    // Raw encoding for a year; years outside the table use the 1900 entry
    static uint32_t encoding(int year);
    static bool in_range(int year) { return year >= MIN_YEAR && year <= MAX_YEAR; }

    // Leap month position (1-12) or 0
    static int leap_month(int year);

    // month 1-12 for regular months, 13 for the leap month
    static bool is_big_month(int year, int month);

    static int month_days(int year, int month);
    static int leap_month_days(int year);   // 0 when there is no leap month
    static int month_count(int year);       // 12 or 13
    static int year_days(int year);
};

} // namespace lunisolar
