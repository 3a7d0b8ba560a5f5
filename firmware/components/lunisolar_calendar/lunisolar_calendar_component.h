#pragma once

#include "esphome/core/component.h"
#include "esphome/core/automation.h"
#include "esphome/core/time.h"
#include "esphome/components/time/real_time_clock.h"
#include "esphome/components/text_sensor/text_sensor.h"
#include "lunar_calendar.h"  // Standalone calendar
#include <string>

namespace esphome {
namespace lunisolar_calendar {

using lunisolar::LunarCalendar;
using lunisolar::LunarInfo;
using lunisolar::SolarDate;

class LunisolarCalendarComponent : public PollingComponent {
 public:
  LunisolarCalendarComponent() : PollingComponent() {}
  explicit LunisolarCalendarComponent(uint32_t update_interval) : PollingComponent(update_interval) {}

  void setup() override;
  void update() override;
  void dump_config() override;
  float get_setup_priority() const override { return setup_priority::DATA; }

  // Configuration
  void set_time_source(time::RealTimeClock *time_source) { time_source_ = time_source; }
  // Pins the offset used for solar term dates; without it the offset follows the time source
  void set_utc_offset_minutes(int minutes);
  int get_utc_offset_minutes() const { return calendar_.get_config().utc_offset_minutes; }

  // Text sensors
  void set_lunar_date_sensor(text_sensor::TextSensor *sensor) { lunar_date_sensor_ = sensor; }
  void set_display_sensor(text_sensor::TextSensor *sensor) { display_sensor_ = sensor; }
  void set_solar_term_sensor(text_sensor::TextSensor *sensor) { solar_term_sensor_ = sensor; }
  void set_festival_sensor(text_sensor::TextSensor *sensor) { festival_sensor_ = sensor; }
  void set_year_name_sensor(text_sensor::TextSensor *sensor) { year_name_sensor_ = sensor; }
  void set_zodiac_sensor(text_sensor::TextSensor *sensor) { zodiac_sensor_ = sensor; }

  // Current state
  bool has_current_info() const { return has_info_; }
  const LunarInfo &get_current_info() const { return current_info_; }
  const LunarCalendar &get_calendar() const { return calendar_; }

  // JSON for other components (delegates to the standalone calendar)
  void export_day_json(std::string &json_output) const;
  void export_month_json(int year, int month, std::string &json_output) const { json_output = calendar_.export_month_json(year, month); }

  // Recompute even if the local date has not changed
  void force_refresh();

 protected:
  LunarCalendar calendar_;
  time::RealTimeClock *time_source_{nullptr};

  bool fixed_offset_{false};  // utc_offset configured in YAML
  bool has_info_{false};
  bool force_next_update_{false};
  bool warned_invalid_time_{false};
  LunarInfo current_info_;

  text_sensor::TextSensor *lunar_date_sensor_{nullptr};
  text_sensor::TextSensor *display_sensor_{nullptr};
  text_sensor::TextSensor *solar_term_sensor_{nullptr};
  text_sensor::TextSensor *festival_sensor_{nullptr};
  text_sensor::TextSensor *year_name_sensor_{nullptr};
  text_sensor::TextSensor *zodiac_sensor_{nullptr};

  // Follow the time source's UTC offset unless one was configured
  void update_timezone_from_time_source(const ESPTime &now);
  void publish_info(const LunarInfo &info);
};

template<typename... Ts> class RefreshAction : public Action<Ts...>, public Parented<LunisolarCalendarComponent> {
 public:
  void play(Ts... x) override { this->parent_->force_refresh(); }
};

} // namespace lunisolar_calendar
} // namespace esphome
