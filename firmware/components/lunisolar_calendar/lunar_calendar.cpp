#include "lunar_calendar.h"
#include <cmath>
#include <cstdio>

// cJSON is a single-file library that also ships with ESP-IDF
extern "C" {
    #include "cJSON.h"
}

#ifdef ESP_PLATFORM
#include "esp_log.h"
static const char* TAG = "LunarCalendar";
#define LOG_INFO(fmt, ...) ESP_LOGI(TAG, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) ESP_LOGW(TAG, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) ESP_LOGE(TAG, fmt, ##__VA_ARGS__)
#else
#define LOG_INFO(fmt, ...) printf("[INFO] " fmt "\n", ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) printf("[WARN] " fmt "\n", ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) printf("[ERROR] " fmt "\n", ##__VA_ARGS__)
#endif

namespace lunisolar {

namespace {

// Owns a cJSON tree for the duration of a scope
struct JSONDeleter {
    cJSON* json;
    ~JSONDeleter() { if (json) cJSON_Delete(json); }
};

std::string print_json(cJSON* root) {
    char* json_str = cJSON_PrintUnformatted(root);
    if (!json_str) {
        LOG_ERROR("cJSON_PrintUnformatted failed");
        return "{}";
    }

    std::string result(json_str);
    cJSON_free(json_str);
    return result;
}

void add_optional_string(cJSON* object, const char* key, bool valid, const std::string& value) {
    if (valid) {
        cJSON_AddStringToObject(object, key, value.c_str());
    } else {
        cJSON_AddNullToObject(object, key);
    }
}

cJSON* create_day_object(const LunarInfo& info) {
    cJSON* day = cJSON_CreateObject();
    if (!day) return nullptr;

    cJSON_AddStringToObject(day, "solar", info.solar.to_string().c_str());

    cJSON* lunar = cJSON_CreateObject();
    if (lunar) {
        cJSON_AddNumberToObject(lunar, "year", info.lunar.year);
        cJSON_AddNumberToObject(lunar, "month", info.lunar.month);
        cJSON_AddNumberToObject(lunar, "day", info.lunar.day);
        cJSON_AddBoolToObject(lunar, "leap", info.lunar.is_leap_month);
        cJSON_AddItemToObject(day, "lunar", lunar);
    }

    cJSON_AddStringToObject(day, "lunar_date", info.lunar_date.c_str());
    cJSON_AddStringToObject(day, "display", info.display.c_str());
    add_optional_string(day, "solar_term", info.solar_term.valid, info.solar_term.name);
    add_optional_string(day, "festival", info.festival.valid, info.festival.name);
    cJSON_AddStringToObject(day, "year_name", info.year_name.c_str());
    cJSON_AddStringToObject(day, "zodiac", info.zodiac.c_str());
    return day;
}

} // namespace

LunarCalendar::LunarCalendar() {
    apply_timezone();
}

LunarCalendar::LunarCalendar(const LunarCalendarConfig& config) : config_(config) {
    apply_timezone();
}

void LunarCalendar::set_config(const LunarCalendarConfig& config) {
    config_ = config;
    apply_timezone();
}

void LunarCalendar::set_utc_offset_minutes(int minutes) {
    config_.use_system_timezone = false;
    config_.utc_offset_minutes = minutes;
    apply_timezone();
}

void LunarCalendar::use_system_timezone() {
    config_.use_system_timezone = true;
    apply_timezone();
}

void LunarCalendar::apply_timezone() {
    if (config_.use_system_timezone) {
        terms_.use_system_timezone();
    } else {
        terms_.set_utc_offset_minutes(config_.utc_offset_minutes);
    }
}

std::string LunarCalendar::lunar_date_string(const SolarDate& date) const {
    return LunarNames::lunar_date_string(solar_to_lunar(date));
}

FestivalMatch LunarCalendar::get_festival(const SolarDate& date) const {
    return LunarNames::festival(solar_to_lunar(date));
}

std::string LunarCalendar::select_display(const LunarInfo& info) {
    if (info.solar_term.valid) {
        return info.solar_term.name;
    }
    if (info.festival.valid) {
        return info.festival.name;
    }
    return info.lunar_date;
}

std::string LunarCalendar::full_lunar_info(const SolarDate& date) const {
    return get_lunar_info(date).display;
}

LunarInfo LunarCalendar::get_lunar_info(const SolarDate& date) const {
    LunarInfo info;
    info.solar = date;
    info.lunar = solar_to_lunar(date);
    info.lunar_date = LunarNames::lunar_date_string(info.lunar);
    info.solar_term = terms_.get_solar_term(date);
    info.festival = LunarNames::festival(info.lunar);
    info.year_name = LunarNames::year_stem_branch(info.lunar.year);
    info.zodiac = LunarNames::zodiac_animal(info.lunar.year);
    info.display = select_display(info);
    return info;
}

std::string LunarCalendar::export_day_json(const SolarDate& date) const {
    cJSON* root = create_day_object(get_lunar_info(date));
    if (!root) {
        LOG_ERROR("Failed to allocate JSON for %s", date.to_string().c_str());
        return "{}";
    }
    JSONDeleter deleter{root};

    return print_json(root);
}

std::string LunarCalendar::export_month_json(int year, int month) const {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "{}";
    JSONDeleter deleter{root};

    cJSON_AddNumberToObject(root, "year", year);
    cJSON_AddNumberToObject(root, "month", month);

    cJSON* days = cJSON_CreateArray();
    if (!days) {
        LOG_ERROR("Failed to allocate JSON array for %04d-%02d", year, month);
        return "{}";
    }
    cJSON_AddItemToObject(root, "days", days);

    int day_count = LunarConverter::days_in_solar_month(year, month);
    for (int day = 1; day <= day_count; day++) {
        cJSON* day_obj = create_day_object(get_lunar_info(SolarDate(year, month, day)));
        if (day_obj) cJSON_AddItemToArray(days, day_obj);
    }

    return print_json(root);
}

std::string LunarCalendar::export_terms_json(int year) const {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "{}";
    JSONDeleter deleter{root};

    cJSON_AddNumberToObject(root, "year", year);

    cJSON* terms_array = cJSON_CreateArray();
    if (!terms_array) return "{}";
    cJSON_AddItemToObject(root, "terms", terms_array);

    for (const auto& instant : terms_.get_terms_for_year(year)) {
        cJSON* term_obj = cJSON_CreateObject();
        if (!term_obj) continue;

        char time_str[6];
        snprintf(time_str, sizeof(time_str), "%02d:%02d", instant.hour, instant.minute);

        cJSON_AddNumberToObject(term_obj, "index", instant.index);
        cJSON_AddStringToObject(term_obj, "name", instant.name.c_str());
        cJSON_AddStringToObject(term_obj, "date", instant.date.to_string().c_str());
        cJSON_AddStringToObject(term_obj, "time", time_str);
        cJSON_AddItemToArray(terms_array, term_obj);
    }

    return print_json(root);
}

std::string LunarCalendar::export_config_json() const {
    cJSON* root = cJSON_CreateObject();
    if (!root) return "{}";
    JSONDeleter deleter{root};

    cJSON_AddBoolToObject(root, "use_system_timezone", config_.use_system_timezone);
    cJSON_AddNumberToObject(root, "utc_offset_minutes", config_.utc_offset_minutes);

    return print_json(root);
}

bool LunarCalendar::import_config_json(const std::string& json_str) {
    cJSON* root = cJSON_Parse(json_str.c_str());
    if (!root) {
        LOG_ERROR("Calendar config is not valid JSON");
        return false;
    }
    JSONDeleter deleter{root};

    if (!cJSON_IsObject(root)) {
        LOG_ERROR("Calendar config must be a JSON object");
        return false;
    }

    LunarCalendarConfig new_config = config_;

    cJSON* system_tz_item = cJSON_GetObjectItem(root, "use_system_timezone");
    if (system_tz_item) {
        if (!cJSON_IsBool(system_tz_item)) {
            LOG_ERROR("use_system_timezone must be a boolean");
            return false;
        }
        new_config.use_system_timezone = cJSON_IsTrue(system_tz_item);
    }

    cJSON* offset_item = cJSON_GetObjectItem(root, "utc_offset_minutes");
    if (offset_item) {
        if (!cJSON_IsNumber(offset_item) ||
            offset_item->valuedouble != std::floor(offset_item->valuedouble)) {
            LOG_ERROR("utc_offset_minutes must be a whole number");
            return false;
        }
        if (offset_item->valuedouble < MIN_UTC_OFFSET_MINUTES ||
            offset_item->valuedouble > MAX_UTC_OFFSET_MINUTES) {
            LOG_WARN("utc_offset_minutes %.0f outside [%d, %d]", offset_item->valuedouble,
                     MIN_UTC_OFFSET_MINUTES, MAX_UTC_OFFSET_MINUTES);
            return false;
        }
        new_config.utc_offset_minutes = static_cast<int>(offset_item->valuedouble);
    }

    set_config(new_config);
    LOG_INFO("Calendar config imported - %s, offset %d min",
             new_config.use_system_timezone ? "system time zone" : "fixed offset",
             new_config.utc_offset_minutes);
    return true;
}

} // namespace lunisolar
