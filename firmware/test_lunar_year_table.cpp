#include "components/lunisolar_calendar/lunar_year_table.h"
#include "test_framework.h"

using namespace lunisolar;

void test_leap_months(TestRunner& runner) {
    runner.start_suite("Leap Month Tests");

    runner.assert_equals(8, LunarYearTable::leap_month(1900), "1900 has leap month 8");
    runner.assert_equals(4, LunarYearTable::leap_month(2020), "2020 has leap month 4");
    runner.assert_equals(2, LunarYearTable::leap_month(2023), "2023 has leap month 2");
    runner.assert_equals(0, LunarYearTable::leap_month(2024), "2024 has no leap month");
    runner.assert_equals(6, LunarYearTable::leap_month(2025), "2025 has leap month 6");

    runner.assert_equals(13, LunarYearTable::month_count(2023), "Leap year has 13 months");
    runner.assert_equals(12, LunarYearTable::month_count(2024), "Common year has 12 months");

    int leap_years = 0;
    for (int year = LunarYearTable::MIN_YEAR; year <= LunarYearTable::MAX_YEAR; year++) {
        if (LunarYearTable::leap_month(year) > 0) leap_years++;
    }
    runner.assert_equals(74, leap_years, "Leap years in 1900-2100");
}

void test_month_lengths(TestRunner& runner) {
    runner.start_suite("Month Length Tests");

    // 2024: 29 30 29 29 30 29 30 30 29 30 30 29
    const int expected_2024[12] = {29, 30, 29, 29, 30, 29, 30, 30, 29, 30, 30, 29};
    bool all_match = true;
    for (int month = 1; month <= 12; month++) {
        if (LunarYearTable::month_days(2024, month) != expected_2024[month - 1]) all_match = false;
    }
    runner.assert_true(all_match, "2024 month lengths decoded from 0x04b60");

    runner.assert_false(LunarYearTable::is_big_month(2024, 1), "2024 month 1 is small");
    runner.assert_true(LunarYearTable::is_big_month(2024, 2), "2024 month 2 is big");
    runner.assert_true(LunarYearTable::is_big_month(1900, 9), "1900 month 9 is big");

    runner.assert_equals(29, LunarYearTable::leap_month_days(2023), "2023 leap month is small");
    runner.assert_equals(30, LunarYearTable::leap_month_days(2017), "2017 leap month is big");
    runner.assert_equals(0, LunarYearTable::leap_month_days(2024), "No leap month length in 2024");
}

void test_leap_month_queries(TestRunner& runner) {
    runner.start_suite("Leap Month Query Tests");

    runner.assert_true(LunarYearTable::is_big_month(2017, LunarYearTable::LEAP_MONTH), "Month 13 reads the leap flag");
    runner.assert_false(LunarYearTable::is_big_month(2024, LunarYearTable::LEAP_MONTH), "Month 13 is small without a leap month");
    runner.assert_false(LunarYearTable::is_big_month(2024, 0), "Month 0 is not a big month");
    runner.assert_false(LunarYearTable::is_big_month(2017, 14), "Month 14 is not a big month");
    runner.assert_false(LunarYearTable::is_big_month(2017, -1), "Negative month is not a big month");
}

void test_year_lengths(TestRunner& runner) {
    runner.start_suite("Year Length Tests");

    runner.assert_equals(384, LunarYearTable::year_days(1900), "1900 has 384 days");
    runner.assert_equals(384, LunarYearTable::year_days(2023), "2023 has 384 days");
    runner.assert_equals(354, LunarYearTable::year_days(2024), "2024 has 354 days");
    runner.assert_equals(354, LunarYearTable::year_days(2100), "2100 has 354 days");

    // Every leap year: 12 regular months plus the leap month
    bool sums_match = true;
    for (int year = LunarYearTable::MIN_YEAR; year <= LunarYearTable::MAX_YEAR; year++) {
        int total = 0;
        for (int month = 1; month <= 12; month++) {
            total += LunarYearTable::is_big_month(year, month) ? 30 : 29;
        }
        if (LunarYearTable::leap_month(year) > 0) {
            total += LunarYearTable::is_big_month(year, LunarYearTable::LEAP_MONTH) ? 30 : 29;
        }
        if (total != LunarYearTable::year_days(year)) {
            sums_match = false;
            std::cout << "Year " << year << " sums to " << total << std::endl;
        }
    }
    runner.assert_true(sums_match, "Year length equals the sum of its months");

    bool plausible = true;
    for (int year = LunarYearTable::MIN_YEAR; year <= LunarYearTable::MAX_YEAR; year++) {
        int days = LunarYearTable::year_days(year);
        bool leap = LunarYearTable::leap_month(year) > 0;
        if (leap ? (days < 383 || days > 385) : (days < 353 || days > 355)) plausible = false;
    }
    runner.assert_true(plausible, "Year lengths within 353-355 or 383-385 days");
}

void test_out_of_range_clamp(TestRunner& runner) {
    runner.start_suite("Out Of Range Tests");

    runner.assert_equals(LunarYearTable::leap_month(1900), LunarYearTable::leap_month(1899), "1899 uses the 1900 entry");
    runner.assert_equals(LunarYearTable::leap_month(1900), LunarYearTable::leap_month(2101), "2101 uses the 1900 entry");
    runner.assert_true(LunarYearTable::encoding(-5) == LunarYearTable::encoding(1900), "Negative year uses the 1900 entry");
    runner.assert_true(LunarYearTable::encoding(2100) != LunarYearTable::encoding(1900), "2100 has its own entry");
    runner.assert_false(LunarYearTable::in_range(1899), "1899 outside the table");
    runner.assert_true(LunarYearTable::in_range(2100), "2100 inside the table");
}

int main() {
    std::cout << "Lunar Year Table Test Suite" << std::endl;
    std::cout << "===========================" << std::endl;

    TestRunner runner;
    TestResults results;

    test_leap_months(runner);
    results.add_suite_results(runner);

    test_month_lengths(runner);
    results.add_suite_results(runner);

    test_leap_month_queries(runner);
    results.add_suite_results(runner);

    test_year_lengths(runner);
    results.add_suite_results(runner);

    test_out_of_range_clamp(runner);
    results.add_suite_results(runner);

    results.print_final_summary("Lunar Year Table");

    return results.get_exit_code();
}
