#pragma once
#include "OrientationDetector.hpp"
#include "StudySession.hpp"
#include <string>

struct AppConfig {
  std::string replay_file = "data/sample_frames.json";
  bool realtime = true;
  std::string serial_port = "/dev/ttyUSB0";
  std::string store_file = "flipstudy_store.json";
  DetectorConfig detector = DetectorConfig::defaults_for(SampleKind::AccelerationZ);
  TimerSettings timer;
  bool has_timer_settings = false;   // true if the file overrides the stored ones
};

SampleKind sample_kind_from_name(const std::string& name);

// Empty path gives the defaults. Throws std::runtime_error on an unreadable
// file and ConfigError on bad values.
AppConfig load_app_config(const std::string& path);
AppConfig parse_app_config(const nlohmann::json& j);
