#include "components/lunisolar_calendar/lunar_names.h"
#include "test_framework.h"

using namespace lunisolar;

void test_stem_branch(TestRunner& runner) {
    runner.start_suite("Stem Branch Tests");

    runner.assert_equals("甲辰", LunarNames::year_stem_branch(2024), "2024 is 甲辰");
    runner.assert_equals("癸卯", LunarNames::year_stem_branch(2023), "2023 is 癸卯");
    runner.assert_equals("庚子", LunarNames::year_stem_branch(1900), "1900 is 庚子");
    runner.assert_equals("甲子", LunarNames::year_stem_branch(1984), "1984 starts a cycle");
    runner.assert_equals("甲子", LunarNames::year_stem_branch(4), "Year 4 is 甲子");
    runner.assert_equals("癸亥", LunarNames::year_stem_branch(3), "Year 3 wraps to 癸亥");
    runner.assert_equals("甲", LunarNames::heavenly_stem(2024), "2024 stem");
    runner.assert_equals("辰", LunarNames::earthly_branch(2024), "2024 branch");

    bool cycles = true;
    for (int year = -100; year <= 2200; year++) {
        if (LunarNames::year_stem_branch(year) != LunarNames::year_stem_branch(year + 60)) cycles = false;
        if (LunarNames::zodiac_animal(year) != LunarNames::zodiac_animal(year + 12)) cycles = false;
    }
    runner.assert_true(cycles, "Names repeat every 60 and 12 years");
}

void test_zodiac(TestRunner& runner) {
    runner.start_suite("Zodiac Tests");

    runner.assert_equals("龙", LunarNames::zodiac_animal(2024), "2024 is the dragon");
    runner.assert_equals("兔", LunarNames::zodiac_animal(2023), "2023 is the rabbit");
    runner.assert_equals("鼠", LunarNames::zodiac_animal(1900), "1900 is the rat");
    runner.assert_equals("蛇", LunarNames::zodiac_animal(2025), "2025 is the snake");
}

void test_month_and_day_names(TestRunner& runner) {
    runner.start_suite("Month And Day Name Tests");

    runner.assert_equals("正月", LunarNames::month_name(1), "Month 1");
    runner.assert_equals("冬月", LunarNames::month_name(11), "Month 11");
    runner.assert_equals("腊月", LunarNames::month_name(12), "Month 12");
    runner.assert_equals("闰二月", LunarNames::month_name(2, true), "Leap month 2");
    runner.assert_equals("", LunarNames::month_name(0), "Month 0 has no name");
    runner.assert_equals("", LunarNames::month_name(13), "Month 13 has no name");

    runner.assert_equals("初一", LunarNames::day_name(1), "Day 1");
    runner.assert_equals("初十", LunarNames::day_name(10), "Day 10");
    runner.assert_equals("二十", LunarNames::day_name(20), "Day 20");
    runner.assert_equals("廿九", LunarNames::day_name(29), "Day 29");
    runner.assert_equals("三十", LunarNames::day_name(30), "Day 30");
    runner.assert_equals("", LunarNames::day_name(0), "Day 0 has no name");
    runner.assert_equals("", LunarNames::day_name(31), "Day 31 has no name");

    runner.assert_equals("八月十五", LunarNames::lunar_date_string(LunarDate(2024, 8, 15, false)), "Mid-autumn string");
    runner.assert_equals("闰二月初一", LunarNames::lunar_date_string(LunarDate(2023, 2, 1, true)), "Leap month string");
}

void test_solar_term_names(TestRunner& runner) {
    runner.start_suite("Solar Term Name Tests");

    runner.assert_equals("小寒", LunarNames::solar_term_name(0), "Term 0");
    runner.assert_equals("立春", LunarNames::solar_term_name(2), "Term 2");
    runner.assert_equals("清明", LunarNames::solar_term_name(6), "Term 6");
    runner.assert_equals("冬至", LunarNames::solar_term_name(23), "Term 23");
    runner.assert_equals("", LunarNames::solar_term_name(24), "Term 24 has no name");
    runner.assert_equals("", LunarNames::solar_term_name(-1), "Term -1 has no name");
}

void test_festivals(TestRunner& runner) {
    runner.start_suite("Festival Tests");

    FestivalMatch spring = LunarNames::festival(LunarDate(2024, 1, 1, false));
    runner.assert_true(spring.valid, "New Year is a festival");
    runner.assert_equals("春节", spring.name, "New Year name");

    runner.assert_equals("元宵节", LunarNames::festival(1, 15).name, "Lantern festival");
    runner.assert_equals("端午节", LunarNames::festival(5, 5).name, "Dragon boat festival");
    runner.assert_equals("中秋节", LunarNames::festival(8, 15).name, "Mid-autumn festival");
    runner.assert_equals("腊八节", LunarNames::festival(12, 8).name, "Laba festival");
    runner.assert_equals("除夕", LunarNames::festival(12, 30).name, "Eve on day 30");
    runner.assert_equals("除夕", LunarNames::festival(12, 29).name, "Eve on day 29");

    FestivalMatch none = LunarNames::festival(3, 3);
    runner.assert_false(none.valid, "3-3 carries no festival");
    runner.assert_equals("", none.name, "No festival gives an empty name");

    runner.assert_false(LunarNames::festival(LunarDate(2024, 1, 1, true)).valid, "Leap month 1-1 is not 春节");
    runner.assert_false(LunarNames::festival(LunarDate(1903, 5, 5, true)).valid, "Leap month 5-5 is not 端午节");
    runner.assert_true(LunarNames::festival(LunarDate(1903, 5, 5, false)).valid, "Regular month 5-5 is 端午节");
}

int main() {
    std::cout << "Lunar Names Test Suite" << std::endl;
    std::cout << "======================" << std::endl;

    TestRunner runner;
    TestResults results;

    test_stem_branch(runner);
    results.add_suite_results(runner);

    test_zodiac(runner);
    results.add_suite_results(runner);

    test_month_and_day_names(runner);
    results.add_suite_results(runner);

    test_solar_term_names(runner);
    results.add_suite_results(runner);

    test_festivals(runner);
    results.add_suite_results(runner);

    results.print_final_summary("Lunar Names");

    return results.get_exit_code();
}
