#include "lunisolar_calendar_component.h"
#include "esphome/core/log.h"

// The standalone calendar sources are compiled separately by ESPHome

namespace esphome {
namespace lunisolar_calendar {

static const char *const TAG = "lunisolar_calendar";

void LunisolarCalendarComponent::setup() {
  ESP_LOGCONFIG(TAG, "Setting up Lunisolar Calendar...");

  if (!fixed_offset_) {
    // Until the time source reports its offset, assume China Standard Time
    calendar_.set_utc_offset_minutes(480);
  }

  if (!time_source_) {
    ESP_LOGW(TAG, "No time source configured, calendar sensors will stay empty");
  }
}

void LunisolarCalendarComponent::set_utc_offset_minutes(int minutes) {
  fixed_offset_ = true;
  calendar_.set_utc_offset_minutes(minutes);
}

void LunisolarCalendarComponent::force_refresh() {
  force_next_update_ = true;
  update();
}

void LunisolarCalendarComponent::update() {
  if (!time_source_) {
    return;
  }

  auto now = time_source_->now();
  if (!now.is_valid()) {
    if (!warned_invalid_time_) {
      ESP_LOGW(TAG, "Time source not synchronized yet, skipping calendar update");
      warned_invalid_time_ = true;
    }
    return;
  }
  warned_invalid_time_ = false;

  update_timezone_from_time_source(now);

  SolarDate today(now.year, now.month, now.day_of_month);
  if (has_info_ && !force_next_update_ && current_info_.solar == today) {
    return;
  }
  force_next_update_ = false;

  current_info_ = calendar_.get_lunar_info(today);
  has_info_ = true;

  ESP_LOGI(TAG, "%s -> %s%s年 %s (%s)", today.to_string().c_str(),
           current_info_.year_name.c_str(), current_info_.zodiac.c_str(),
           current_info_.lunar_date.c_str(), current_info_.display.c_str());

  publish_info(current_info_);
}

void LunisolarCalendarComponent::update_timezone_from_time_source(const ESPTime &now) {
  if (fixed_offset_) {
    return;
  }

  // ESPTime reports the UTC offset in seconds
  int offset_minutes = static_cast<int>(now.timezone_offset() / 60);
  if (offset_minutes == calendar_.get_config().utc_offset_minutes) {
    return;
  }

  ESP_LOGI(TAG, "UTC offset updated from %+d min to %+d min",
           calendar_.get_config().utc_offset_minutes, offset_minutes);
  calendar_.set_utc_offset_minutes(offset_minutes);

  // Term dates may move across midnight with the new offset
  force_next_update_ = true;
}

void LunisolarCalendarComponent::publish_info(const LunarInfo &info) {
  if (lunar_date_sensor_) lunar_date_sensor_->publish_state(info.lunar_date);
  if (display_sensor_) display_sensor_->publish_state(info.display);
  if (solar_term_sensor_) solar_term_sensor_->publish_state(info.solar_term.valid ? info.solar_term.name : "");
  if (festival_sensor_) festival_sensor_->publish_state(info.festival.valid ? info.festival.name : "");
  if (year_name_sensor_) year_name_sensor_->publish_state(info.year_name);
  if (zodiac_sensor_) zodiac_sensor_->publish_state(info.zodiac);

  ESP_LOGD(TAG, "Published - term: %s, festival: %s, leap month: %s",
           info.solar_term.valid ? info.solar_term.name.c_str() : "none",
           info.festival.valid ? info.festival.name.c_str() : "none",
           info.lunar.is_leap_month ? "yes" : "no");
}

void LunisolarCalendarComponent::export_day_json(std::string &json_output) const {
  if (!has_info_) {
    json_output = "{}";
    return;
  }
  json_output = calendar_.export_day_json(current_info_.solar);
}

void LunisolarCalendarComponent::dump_config() {
  ESP_LOGCONFIG(TAG, "Lunisolar Calendar:");
  ESP_LOGCONFIG(TAG, "  Time Source: %s", time_source_ ? "CONFIGURED" : "NOT SET");
  ESP_LOGCONFIG(TAG, "  UTC Offset: %+d min (%s)", calendar_.get_config().utc_offset_minutes,
                fixed_offset_ ? "fixed" : "from time source");
  ESP_LOGCONFIG(TAG, "  Table Range: %d-%d", lunisolar::LunarYearTable::MIN_YEAR,
                lunisolar::LunarYearTable::MAX_YEAR);
  LOG_TEXT_SENSOR("  ", "Lunar Date", lunar_date_sensor_);
  LOG_TEXT_SENSOR("  ", "Display", display_sensor_);
  LOG_TEXT_SENSOR("  ", "Solar Term", solar_term_sensor_);
  LOG_TEXT_SENSOR("  ", "Festival", festival_sensor_);
  LOG_TEXT_SENSOR("  ", "Year Name", year_name_sensor_);
  LOG_TEXT_SENSOR("  ", "Zodiac", zodiac_sensor_);

  if (has_info_) {
    ESP_LOGCONFIG(TAG, "  Today: %s (%s)", current_info_.lunar_date.c_str(), current_info_.display.c_str());
  }
}

} // namespace lunisolar_calendar
} // namespace esphome
