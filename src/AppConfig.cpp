#include "AppConfig.hpp"
#include <fstream>
#include <stdexcept>

using nlohmann::json;

SampleKind sample_kind_from_name(const std::string& name) {
  if (name == "acceleration_z") return SampleKind::AccelerationZ;
  if (name == "tilt_degrees") return SampleKind::TiltDegrees;
  throw ConfigError("unknown sample kind: " + name);
}

AppConfig parse_app_config(const json& j) {
  AppConfig cfg;
  if (!j.is_object()) throw ConfigError("config must be a JSON object");

  cfg.replay_file = j.value("replay_file", cfg.replay_file);
  cfg.realtime    = j.value("realtime", cfg.realtime);
  cfg.serial_port = j.value("serial_port", cfg.serial_port);
  cfg.store_file  = j.value("store_file", cfg.store_file);

  if (j.contains("detector")) {
    const auto& d = j["detector"];
    SampleKind kind = sample_kind_from_name(d.value("kind", std::string("acceleration_z")));

    // start from the per-kind defaults, then apply overrides
    DetectorConfig dc = DetectorConfig::defaults_for(kind);
    dc.ema_alpha          = d.value("ema_alpha", dc.ema_alpha);
    dc.enter_threshold    = d.value("enter_threshold", dc.enter_threshold);
    dc.exit_threshold     = d.value("exit_threshold", dc.exit_threshold);
    dc.stable_required    = d.value("stable_required", dc.stable_required);
    dc.sample_interval_ms = d.value("sample_interval_ms", dc.sample_interval_ms);
    dc.validate();
    cfg.detector = dc;
  }

  if (j.contains("timer")) {
    cfg.timer = j["timer"].get<TimerSettings>();
    if (cfg.timer.max_session_minutes <= 0) {
      throw ConfigError("max_session_minutes must be > 0");
    }
    cfg.has_timer_settings = true;
  }

  return cfg;
}

AppConfig load_app_config(const std::string& path) {
  if (path.empty()) return AppConfig{};

  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);

  json j = json::parse(f, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("Invalid JSON in config file: " + path);

  return parse_app_config(j);
}
