#pragma once

#include <string>
#include <utility>
#include "lunar_converter.h"

namespace lunisolar {

// Festival lookup result; valid is false when the day carries no festival
struct FestivalMatch {
    bool valid = false;
    std::string name;

    FestivalMatch() = default;
    explicit FestivalMatch(std::string festival_name)
        : valid(true), name(std::move(festival_name)) {}
};

/**
 * Traditional naming tables
 * Heavenly stems, earthly branches, zodiac animals, lunar month and day
 * names, the 24 solar terms and the festival table. All strings are UTF-8.
 */
class LunarNames {
public:
    static constexpr int SOLAR_TERM_COUNT = 24;

    // Sexagenary name of a year, e.g. 2024 -> 甲辰
    static std::string year_stem_branch(int year);
    static std::string heavenly_stem(int year);
    static std::string earthly_branch(int year);
    static std::string zodiac_animal(int year);

    // 正月 .. 腊月, prefixed with 闰 for leap months; empty outside 1-12
    static std::string month_name(int month, bool is_leap_month = false);
    // 初一 .. 三十; empty outside 1-30
    static std::string day_name(int day);
    // Month name followed by day name, e.g. 八月十五
    static std::string lunar_date_string(const LunarDate& date);

    // Term names in index order, 0 = 小寒 ... 23 = 冬至; empty outside 0-23
    static std::string solar_term_name(int index);

    // Leap months never carry a festival
    static FestivalMatch festival(const LunarDate& date);
    static FestivalMatch festival(int month, int day);
};

} // namespace lunisolar
