#include "StudyTimer.hpp"
#include <chrono>
#include <exception>
#include <iostream>

namespace {

int64_t seconds_between(int64_t from_ms, int64_t to_ms) {
  if (from_ms < 0 || to_ms < from_ms) return 0;
  return (to_ms - from_ms) / 1000;
}

}  // namespace

int64_t StudyTimer::system_clock_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

StudyTimer::StudyTimer(ISampleSource& source, const DetectorConfig& detector_config,
                       SessionStore& store, Clock clock)
  : store_(store),
    clock_(std::move(clock)),
    detector_(source, detector_config),
    state_(store.timer_state()),
    rng_(std::random_device{}()) {
  alert_ = [](int64_t elapsed_s, int max_minutes) {
    std::cerr << "Timer alert: session running " << elapsed_s / 60
              << " min, limit is " << max_minutes << " min\n";
  };

  // a persisted session without an id cannot be finalized, start clean
  if (state_.phase != TimerPhase::Idle && state_.session_id.empty()) {
    state_ = TimerState{};
    state_.flip_count = store.timer_state().flip_count;
  }

  detector_.add_observer([this](bool flipped) { on_flip(flipped); });
}

std::string StudyTimer::generate_id() {
  static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<int> pick(0, 35);
  std::string id = std::to_string(clock_()) + "-";
  for (int i = 0; i < 9; ++i) id += digits[pick(rng_)];
  return id;
}

void StudyTimer::commit(const char* what) {
  try {
    store_.set_timer_state(state_);
  } catch (const std::exception& e) {
    std::cerr << "Error " << what << " timer: " << e.what() << "\n";
  }
}

void StudyTimer::start() {
  if (state_.phase != TimerPhase::Idle) return;

  const int64_t now = clock_();
  state_.phase = TimerPhase::Running;
  state_.session_id = generate_id();
  state_.session_start_ms = now;
  state_.run_start_ms = now;
  state_.paused_elapsed_s = 0;
  state_.flip_count++;
  alerted_ = false;
  commit("starting");
}

void StudyTimer::pause() {
  if (state_.phase != TimerPhase::Running) return;

  state_.paused_elapsed_s += seconds_between(state_.run_start_ms, clock_());
  state_.run_start_ms = -1;
  state_.phase = TimerPhase::Paused;
  commit("pausing");
}

void StudyTimer::resume() {
  if (state_.phase != TimerPhase::Paused || state_.session_id.empty()) return;

  state_.run_start_ms = clock_();
  state_.phase = TimerPhase::Running;
  commit("resuming");
}

void StudyTimer::stop() {
  if (state_.phase == TimerPhase::Idle) return;

  const int64_t now = clock_();
  StudySession s;
  s.id = state_.session_id;
  s.start_ms = state_.session_start_ms;
  s.end_ms = now;
  s.duration_s = state_.paused_elapsed_s;
  if (state_.phase == TimerPhase::Running) {
    s.duration_s += seconds_between(state_.run_start_ms, now);
  }
  s.created_ms = now;
  s.is_manual = false;

  try {
    store_.add_session(s);
  } catch (const std::exception& e) {
    std::cerr << "Error stopping timer: " << e.what() << "\n";
  }

  reset();
}

void StudyTimer::reset() {
  const int flips = state_.flip_count;
  state_ = TimerState{};
  state_.flip_count = flips;
  alerted_ = false;
  commit("resetting");
}

void StudyTimer::on_flip(bool flipped) {
  if (flipped && state_.phase == TimerPhase::Idle) {
    start();
  } else if (flipped && state_.phase == TimerPhase::Paused) {
    resume();
  } else if (!flipped && state_.phase == TimerPhase::Running) {
    if (store_.settings().pause_on_flip) {
      pause();
    } else {
      stop();
    }
  }
}

int64_t StudyTimer::elapsed_seconds() const {
  int64_t e = state_.paused_elapsed_s;
  if (state_.phase == TimerPhase::Running) {
    e += seconds_between(state_.run_start_ms, clock_());
  }
  return e;
}

bool StudyTimer::check_alert() {
  const TimerSettings& cfg = store_.settings();
  if (!cfg.timer_alerts || alerted_ || state_.phase != TimerPhase::Running) return false;

  const int64_t elapsed = elapsed_seconds();
  if (elapsed <= static_cast<int64_t>(cfg.max_session_minutes) * 60) return false;

  alerted_ = true;
  if (alert_) alert_(elapsed, cfg.max_session_minutes);
  return true;
}
