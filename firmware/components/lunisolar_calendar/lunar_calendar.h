#pragma once

#include <string>
#include "lunar_converter.h"
#include "lunar_names.h"
#include "lunar_year_table.h"
#include "solar_terms.h"

namespace lunisolar {

// Calendar configuration
struct LunarCalendarConfig {
    bool use_system_timezone = true;   // Convert term instants with the C library's local zone
    int utc_offset_minutes = 480;      // Used when use_system_timezone is false (UTC+8)
};

// Everything a calendar view shows for one solar day
struct LunarInfo {
    SolarDate solar;
    LunarDate lunar;
    std::string lunar_date;    // e.g. 闰二月初一
    SolarTermMatch solar_term;
    FestivalMatch festival;
    std::string year_name;     // Stem-branch name of the lunar year
    std::string zodiac;
    std::string display;       // Solar term, else festival, else lunar_date
};

/**
 * Lunisolar calendar facade
 * Pure C++ implementation, cJSON is used for export only.
 * Combines the year table, converter, term calculator and naming tables.
 */
class LunarCalendar {
public:
    LunarCalendar();
    explicit LunarCalendar(const LunarCalendarConfig& config);

    // Configuration
    void set_config(const LunarCalendarConfig& config);
    const LunarCalendarConfig& get_config() const { return config_; }
    void set_utc_offset_minutes(int minutes);
    void use_system_timezone();

    // Conversion and naming
    LunarDate solar_to_lunar(const SolarDate& date) const { return LunarConverter::solar_to_lunar(date); }
    bool lunar_to_solar(const LunarDate& lunar, SolarDate& out) const { return LunarConverter::lunar_to_solar(lunar, out); }
    std::string lunar_date_string(const SolarDate& date) const;
    std::string year_stem_branch(int year) const { return LunarNames::year_stem_branch(year); }
    std::string zodiac_animal(int year) const { return LunarNames::zodiac_animal(year); }

    // Solar terms
    const SolarTermCalculator& get_term_calculator() const { return terms_; }
    SolarDate solar_term_date(int year, int index) const { return terms_.solar_term_date(year, index); }
    SolarTermMatch get_solar_term(const SolarDate& date) const { return terms_.get_solar_term(date); }

    // Festivals, suppressed in leap months
    FestivalMatch get_festival(const SolarDate& date) const;

    // Single display string: solar term > festival > lunar date
    std::string full_lunar_info(const SolarDate& date) const;
    LunarInfo get_lunar_info(const SolarDate& date) const;

    // JSON export
    std::string export_day_json(const SolarDate& date) const;
    std::string export_month_json(int year, int month) const;
    std::string export_terms_json(int year) const;

    // Configuration JSON; import returns false and keeps the current
    // configuration when the document is rejected
    std::string export_config_json() const;
    bool import_config_json(const std::string& json_str);

    static constexpr int MIN_UTC_OFFSET_MINUTES = -720;
    static constexpr int MAX_UTC_OFFSET_MINUTES = 840;

private:
    LunarCalendarConfig config_;
    SolarTermCalculator terms_;

    void apply_timezone();
    static std::string select_display(const LunarInfo& info);
};

} // namespace lunisolar
