#include "solar_terms.h"
#include "lunar_names.h"
#include <cmath>
#include <ctime>
#include <cstdio>

#ifdef ESP_PLATFORM
#include "esp_log.h"
static const char* TAG = "SolarTermCalculator";
#define LOG_WARN(fmt, ...) ESP_LOGW(TAG, fmt, ##__VA_ARGS__)
#else
#define LOG_WARN(fmt, ...) printf("[WARN] " fmt "\n", ##__VA_ARGS__)
#endif

namespace lunisolar {

// Minutes from the base epoch to each term within a tropical year
static const int32_t TERM_OFFSET_MINUTES[SolarTermCalculator::TERM_COUNT] = {
    0, 21208, 42467, 63836, 85337, 107014, 128867, 150921, 173149, 195551, 218072,
    240693, 263343, 285989, 308563, 331033, 353350, 375494, 397447, 419210, 440795,
    462224, 483532, 504758
};

static const int64_t MILLIS_PER_MINUTE = 60000;
static const int64_t MILLIS_PER_DAY = 86400000;
static const long UNIX_EPOCH_JDN = 2440588;  // 1970-01-01

// Division rounding toward negative infinity, instants before 1970 are negative
static int64_t floor_div(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) quotient--;
    return quotient;
}

SolarTermCalculator::SolarTermCalculator()
    : use_system_timezone_(true), utc_offset_minutes_(0) {
}

SolarTermCalculator::SolarTermCalculator(int utc_offset_minutes)
    : use_system_timezone_(false), utc_offset_minutes_(utc_offset_minutes) {
}

bool SolarTermCalculator::term_utc_millis(int year, int index, int64_t& utc_millis) {
    if (index < 0 || index >= TERM_COUNT) {
        return false;
    }

    utc_millis = BASE_EPOCH_MS +
                 static_cast<int64_t>(std::llround((year - 1900) * MEAN_TROPICAL_YEAR_MS)) +
                 static_cast<int64_t>(TERM_OFFSET_MINUTES[index]) * MILLIS_PER_MINUTE;
    return true;
}

void SolarTermCalculator::to_local_time(int64_t utc_millis, SolarTermInstant& instant) const {
    if (use_system_timezone_) {
        time_t seconds = static_cast<time_t>(floor_div(utc_millis, 1000));
        struct tm local;
        if (localtime_r(&seconds, &local) != nullptr) {
            instant.date = SolarDate(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
            instant.hour = local.tm_hour;
            instant.minute = local.tm_min;
            return;
        }
        LOG_WARN("localtime_r failed for %lld ms, falling back to UTC",
                 static_cast<long long>(utc_millis));
    }

    int offset = use_system_timezone_ ? 0 : utc_offset_minutes_;
    int64_t local_millis = utc_millis + offset * MILLIS_PER_MINUTE;
    int64_t days = floor_div(local_millis, MILLIS_PER_DAY);
    int64_t millis_of_day = local_millis - days * MILLIS_PER_DAY;

    instant.date = LunarConverter::from_julian_day_number(UNIX_EPOCH_JDN + static_cast<long>(days));
    instant.hour = static_cast<int>(millis_of_day / 3600000);
    instant.minute = static_cast<int>((millis_of_day % 3600000) / MILLIS_PER_MINUTE);
}

SolarTermInstant SolarTermCalculator::get_term_instant(int year, int index) const {
    SolarTermInstant instant;
    int64_t utc_millis = 0;
    if (!term_utc_millis(year, index, utc_millis)) {
        return instant;
    }

    instant.valid = true;
    instant.index = index;
    instant.name = LunarNames::solar_term_name(index);
    to_local_time(utc_millis, instant);
    return instant;
}

SolarDate SolarTermCalculator::solar_term_date(int year, int index) const {
    return get_term_instant(year, index).date;
}

std::vector<SolarTermInstant> SolarTermCalculator::get_terms_for_year(int year) const {
    std::vector<SolarTermInstant> terms;
    terms.reserve(TERM_COUNT);
    for (int index = 0; index < TERM_COUNT; index++) {
        terms.push_back(get_term_instant(year, index));
    }
    return terms;
}

SolarTermMatch SolarTermCalculator::get_solar_term(const SolarDate& date) const {
    SolarTermMatch match;
    for (int index = 0; index < TERM_COUNT; index++) {
        SolarTermInstant instant = get_term_instant(date.year, index);
        if (instant.date == date) {
            match.valid = true;
            match.index = index;
            match.name = instant.name;
            break;
        }
    }
    return match;
}

} // namespace lunisolar
