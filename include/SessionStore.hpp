#pragma once
#include "StudySession.hpp"
#include <string>
#include <vector>

// Sessions, timer state and settings kept in one JSON document.
// With an empty path the store lives in memory only.
class SessionStore {
public:
  explicit SessionStore(std::string path = "");

  // Missing file = empty store. Throws std::runtime_error on a corrupt file.
  void load();
  // Throws std::runtime_error if the file cannot be written.
  void save() const;

  const std::vector<StudySession>& sessions() const { return sessions_; }
  void add_session(const StudySession& s);
  bool update_session(const StudySession& s);   // matched by id
  // Overwrites only the fields present in updates, e.g. {"subject":"Maths"}.
  // The id never changes. Throws std::invalid_argument on a wrong-typed field.
  bool update_session(const std::string& id, const nlohmann::json& updates);
  bool delete_session(const std::string& id);

  const TimerState& timer_state() const { return timer_state_; }
  void set_timer_state(const TimerState& t);

  const TimerSettings& settings() const { return settings_; }
  void set_settings(const TimerSettings& s);

  void clear();

private:
  std::string path_;
  std::vector<StudySession> sessions_;
  TimerState timer_state_;
  TimerSettings settings_;
};
