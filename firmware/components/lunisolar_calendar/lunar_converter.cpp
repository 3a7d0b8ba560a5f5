#include "lunar_converter.h"
#include "lunar_year_table.h"
#include <cstdio>

#ifdef ESP_PLATFORM
#include "esp_log.h"
static const char* TAG = "LunarConverter";
#define LOG_WARN(fmt, ...) ESP_LOGW(TAG, fmt, ##__VA_ARGS__)
#else
#define LOG_WARN(fmt, ...) printf("[WARN] " fmt "\n", ##__VA_ARGS__)
#endif

namespace lunisolar {

const SolarDate LunarConverter::EPOCH(1900, 1, 31);
const LunarDate LunarConverter::PRE_EPOCH_FALLBACK(1900, 1, 1, false);

bool SolarDate::is_valid() const {
    if (month < 1 || month > 12 || day < 1) return false;
    return day <= LunarConverter::days_in_solar_month(year, month);
}

std::string SolarDate::to_string() const {
    char buffer[16];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

bool LunarConverter::is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int LunarConverter::days_in_solar_month(int year, int month) {
    static const int MONTH_DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return MONTH_DAYS[month - 1];
}

long LunarConverter::julian_day_number(const SolarDate& date) {
    // Shift the year to start in March so the leap day is the last day
    long a = (14 - date.month) / 12;
    long y = date.year + 4800 - a;
    long m = date.month + 12 * a - 3;
    return date.day + (153 * m + 2) / 5 + 365 * y + y / 4 - y / 100 + y / 400 - 32045;
}

SolarDate LunarConverter::from_julian_day_number(long jdn) {
    long a = jdn + 32044;
    long b = (4 * a + 3) / 146097;
    long c = a - 146097 * b / 4;
    long d = (4 * c + 3) / 1461;
    long e = c - 1461 * d / 4;
    long m = (5 * e + 2) / 153;

    int day = static_cast<int>(e - (153 * m + 2) / 5 + 1);
    int month = static_cast<int>(m + 3 - 12 * (m / 10));
    int year = static_cast<int>(100 * b + d - 4800 + m / 10);
    return SolarDate(year, month, day);
}

long LunarConverter::days_since_epoch(const SolarDate& date) {
    return julian_day_number(date) - julian_day_number(EPOCH);
}

// Locate the month inside a lunar year; offset is days since that year's New Year
static LunarDate walk_months(int year, long offset) {
    int leap = LunarYearTable::leap_month(year);

    for (int month = 1; month <= 12; month++) {
        if (leap == month) {
            int leap_days = LunarYearTable::leap_month_days(year);
            if (offset < leap_days) {
                return LunarDate(year, month, static_cast<int>(offset) + 1, true);
            }
            offset -= leap_days;
        }

        int days = LunarYearTable::month_days(year, month);
        if (offset < days) {
            return LunarDate(year, month, static_cast<int>(offset) + 1, false);
        }
        offset -= days;
    }

    // offset is always below year_days(year), so the loop returns first
    return LunarDate(year, 12, LunarYearTable::month_days(year, 12), false);
}

LunarDate LunarConverter::solar_to_lunar(const SolarDate& date) {
    long offset = days_since_epoch(date);
    if (offset < 0) {
        LOG_WARN("%s precedes the lunar epoch, using 1900-01-01", date.to_string().c_str());
        return PRE_EPOCH_FALLBACK;
    }

    for (int year = LunarYearTable::MIN_YEAR; year <= LunarYearTable::MAX_YEAR; year++) {
        int days = LunarYearTable::year_days(year);
        if (offset < days) {
            return walk_months(year, offset);
        }
        offset -= days;
    }

    LOG_WARN("%s is past lunar year %d, the end of the table",
             date.to_string().c_str(), LunarYearTable::MAX_YEAR);
    return LunarDate(LunarYearTable::MAX_YEAR + 1, 1, 1, false);
}

bool LunarConverter::lunar_to_solar(const LunarDate& lunar, SolarDate& out) {
    if (!LunarYearTable::in_range(lunar.year)) return false;
    if (lunar.month < 1 || lunar.month > 12 || lunar.day < 1) return false;

    int leap = LunarYearTable::leap_month(lunar.year);
    if (lunar.is_leap_month && leap != lunar.month) return false;

    int length = lunar.is_leap_month ? LunarYearTable::leap_month_days(lunar.year)
                                     : LunarYearTable::month_days(lunar.year, lunar.month);
    if (lunar.day > length) return false;

    long offset = 0;
    for (int year = LunarYearTable::MIN_YEAR; year < lunar.year; year++) {
        offset += LunarYearTable::year_days(year);
    }
    for (int month = 1; month < lunar.month; month++) {
        if (leap == month) offset += LunarYearTable::leap_month_days(lunar.year);
        offset += LunarYearTable::month_days(lunar.year, month);
    }
    // The leap month is walked ahead of its regular month
    if (!lunar.is_leap_month && leap == lunar.month) {
        offset += LunarYearTable::leap_month_days(lunar.year);
    }
    offset += lunar.day - 1;

    out = from_julian_day_number(julian_day_number(EPOCH) + offset);
    return true;
}

} // namespace lunisolar
