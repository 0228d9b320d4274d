#include "StudySession.hpp"

using nlohmann::json;

const char* timer_phase_name(TimerPhase phase) {
  switch (phase) {
    case TimerPhase::Idle:    return "idle";
    case TimerPhase::Running: return "running";
    case TimerPhase::Paused:  return "paused";
  }
  return "idle";
}

static TimerPhase phase_from_name(const std::string& name) {
  if (name == "running") return TimerPhase::Running;
  if (name == "paused") return TimerPhase::Paused;
  return TimerPhase::Idle;
}

void to_json(json& j, const StudySession& s) {
  j = json{
    {"id", s.id},
    {"start_ms", s.start_ms},
    {"end_ms", s.end_ms},
    {"duration_s", s.duration_s},
    {"created_ms", s.created_ms},
    {"is_manual", s.is_manual}
  };
  if (!s.subject.empty()) j["subject"] = s.subject;
  if (!s.notes.empty()) j["notes"] = s.notes;
}

void from_json(const json& j, StudySession& s) {
  s.id         = j.value("id", std::string());
  s.start_ms   = j.value("start_ms", int64_t(0));
  s.end_ms     = j.value("end_ms", int64_t(0));
  s.duration_s = j.value("duration_s", int64_t(0));
  s.subject    = j.value("subject", std::string());
  s.notes      = j.value("notes", std::string());
  s.created_ms = j.value("created_ms", s.end_ms);
  s.is_manual  = j.value("is_manual", false);
}

void to_json(json& j, const TimerState& t) {
  j = json{
    {"phase", timer_phase_name(t.phase)},
    {"session_id", t.session_id},
    {"session_start_ms", t.session_start_ms},
    {"run_start_ms", t.run_start_ms},
    {"paused_elapsed_s", t.paused_elapsed_s},
    {"flip_count", t.flip_count}
  };
}

void from_json(const json& j, TimerState& t) {
  t.phase            = phase_from_name(j.value("phase", std::string("idle")));
  t.session_id       = j.value("session_id", std::string());
  t.session_start_ms = j.value("session_start_ms", int64_t(-1));
  t.run_start_ms     = j.value("run_start_ms", int64_t(-1));
  t.paused_elapsed_s = j.value("paused_elapsed_s", int64_t(0));
  t.flip_count       = j.value("flip_count", 0);
}

void to_json(json& j, const TimerSettings& s) {
  j = json{
    {"timer_alerts", s.timer_alerts},
    {"max_session_minutes", s.max_session_minutes},
    {"pause_on_flip", s.pause_on_flip}
  };
}

void from_json(const json& j, TimerSettings& s) {
  TimerSettings d;
  s.timer_alerts        = j.value("timer_alerts", d.timer_alerts);
  s.max_session_minutes = j.value("max_session_minutes", d.max_session_minutes);
  s.pause_on_flip       = j.value("pause_on_flip", d.pause_on_flip);
}
