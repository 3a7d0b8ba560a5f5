#include "lunar_names.h"
#include <map>

namespace lunisolar {

static const char* const HEAVENLY_STEMS[10] = {
    "甲", "乙", "丙", "丁", "戊", "己", "庚", "辛", "壬", "癸"
};

static const char* const EARTHLY_BRANCHES[12] = {
    "子", "丑", "寅", "卯", "辰", "巳", "午", "未", "申", "酉", "戌", "亥"
};

static const char* const ZODIAC_ANIMALS[12] = {
    "鼠", "牛", "虎", "兔", "龙", "蛇", "马", "羊", "猴", "鸡", "狗", "猪"
};

static const char* const MONTH_NAMES[12] = {
    "正", "二", "三", "四", "五", "六", "七", "八", "九", "十", "冬", "腊"
};

static const char* const DAY_NAMES[30] = {
    "初一", "初二", "初三", "初四", "初五", "初六", "初七", "初八", "初九", "初十",
    "十一", "十二", "十三", "十四", "十五", "十六", "十七", "十八", "十九", "二十",
    "廿一", "廿二", "廿三", "廿四", "廿五", "廿六", "廿七", "廿八", "廿九", "三十"
};

static const char* const SOLAR_TERM_NAMES[LunarNames::SOLAR_TERM_COUNT] = {
    "小寒", "大寒", "立春", "雨水", "惊蛰", "春分",
    "清明", "谷雨", "立夏", "小满", "芒种", "夏至",
    "小暑", "大暑", "立秋", "处暑", "白露", "秋分",
    "寒露", "霜降", "立冬", "小雪", "大雪", "冬至"
};

static const char* const LEAP_PREFIX = "闰";
static const char* const MONTH_SUFFIX = "月";

// Keyed by "month-day" of a regular lunar month
static const std::map<std::string, std::string>& festival_table() {
    static const std::map<std::string, std::string> table = {
        {"1-1", "春节"},
        {"1-15", "元宵节"},
        {"2-2", "龙抬头"},
        {"5-5", "端午节"},
        {"7-7", "七夕"},
        {"7-15", "中元节"},
        {"8-15", "中秋节"},
        {"9-9", "重阳节"},
        {"10-15", "下元节"},
        {"12-8", "腊八节"},
        {"12-23", "小年"},
        {"12-30", "除夕"},
        {"12-29", "除夕"},  // The twelfth month may have only 29 days
    };
    return table;
}

// Cycle position of a year counted from 4 AD, the first 甲子 year
static int cycle_index(int year, int period) {
    int index = (year - 4) % period;
    return index < 0 ? index + period : index;
}

std::string LunarNames::heavenly_stem(int year) {
    return HEAVENLY_STEMS[cycle_index(year, 10)];
}

std::string LunarNames::earthly_branch(int year) {
    return EARTHLY_BRANCHES[cycle_index(year, 12)];
}

std::string LunarNames::year_stem_branch(int year) {
    return heavenly_stem(year) + earthly_branch(year);
}

std::string LunarNames::zodiac_animal(int year) {
    return ZODIAC_ANIMALS[cycle_index(year, 12)];
}

std::string LunarNames::month_name(int month, bool is_leap_month) {
    if (month < 1 || month > 12) return "";

    std::string name;
    if (is_leap_month) name += LEAP_PREFIX;
    name += MONTH_NAMES[month - 1];
    name += MONTH_SUFFIX;
    return name;
}

std::string LunarNames::day_name(int day) {
    if (day < 1 || day > 30) return "";
    return DAY_NAMES[day - 1];
}

std::string LunarNames::lunar_date_string(const LunarDate& date) {
    return month_name(date.month, date.is_leap_month) + day_name(date.day);
}

std::string LunarNames::solar_term_name(int index) {
    if (index < 0 || index >= SOLAR_TERM_COUNT) return "";
    return SOLAR_TERM_NAMES[index];
}

FestivalMatch LunarNames::festival(const LunarDate& date) {
    if (date.is_leap_month) {
        return FestivalMatch();
    }
    return festival(date.month, date.day);
}

FestivalMatch LunarNames::festival(int month, int day) {
    const auto& table = festival_table();
    auto it = table.find(std::to_string(month) + "-" + std::to_string(day));
    if (it == table.end()) {
        return FestivalMatch();
    }
    return FestivalMatch(it->second);
}

} // namespace lunisolar
