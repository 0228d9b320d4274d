#pragma once
#include "OrientationDetector.hpp"
#include "SessionStore.hpp"
#include <cstdint>
#include <functional>
#include <random>
#include <string>

// Study session bookkeeping driven by the flip signal.
//
// Face down starts (or resumes) a session. Face up pauses it when
// pause_on_flip is set, otherwise the session is finalized into the store.
// The timer owns its detector; tearing the timer down tears the detector
// down with it.
class StudyTimer {
public:
  using Clock = std::function<int64_t()>;                        // epoch ms
  using AlertHandler = std::function<void(int64_t elapsed_s, int max_minutes)>;

  StudyTimer(ISampleSource& source, const DetectorConfig& detector_config,
             SessionStore& store, Clock clock = system_clock_ms);

  void start();
  void pause();
  void resume();
  void stop();
  void reset();

  // Orientation observer: true = face down.
  void on_flip(bool flipped);

  TimerPhase phase() const { return state_.phase; }
  bool is_active() const { return state_.phase != TimerPhase::Idle; }
  bool is_paused() const { return state_.phase == TimerPhase::Paused; }
  bool is_flipped() const { return detector_.current_state(); }
  int flip_count() const { return state_.flip_count; }
  const std::string& session_id() const { return state_.session_id; }
  int64_t elapsed_seconds() const;

  // Fires the alert handler once per session after max_session_minutes.
  bool check_alert();
  void set_alert_handler(AlertHandler h) { alert_ = std::move(h); }

  OrientationDetector& detector() { return detector_; }
  void shutdown() { detector_.destroy(); }

  static int64_t system_clock_ms();

private:
  std::string generate_id();
  void commit(const char* what);

  SessionStore& store_;
  Clock clock_;
  OrientationDetector detector_;
  TimerState state_;
  bool alerted_ = false;
  AlertHandler alert_;
  std::mt19937 rng_;
};
