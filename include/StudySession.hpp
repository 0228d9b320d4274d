#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

struct StudySession {
  std::string id;
  int64_t start_ms = 0;     // epoch ms
  int64_t end_ms = 0;
  int64_t duration_s = 0;
  std::string subject;      // empty = none
  std::string notes;
  int64_t created_ms = 0;
  bool is_manual = false;
};

enum class TimerPhase { Idle, Running, Paused };

struct TimerState {
  TimerPhase phase = TimerPhase::Idle;
  std::string session_id;
  int64_t session_start_ms = -1;  // when the session first started
  int64_t run_start_ms = -1;      // start of the current running stretch
  int64_t paused_elapsed_s = 0;   // time banked by earlier stretches
  int flip_count = 0;
};

struct TimerSettings {
  bool timer_alerts = true;
  int max_session_minutes = 120;
  bool pause_on_flip = false;    // false = a face-up flip ends the session
};

const char* timer_phase_name(TimerPhase phase);

void to_json(nlohmann::json& j, const StudySession& s);
void from_json(const nlohmann::json& j, StudySession& s);
void to_json(nlohmann::json& j, const TimerState& t);
void from_json(const nlohmann::json& j, TimerState& t);
void to_json(nlohmann::json& j, const TimerSettings& s);
void from_json(const nlohmann::json& j, TimerSettings& s);
