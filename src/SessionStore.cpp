#include "SessionStore.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

SessionStore::SessionStore(std::string path) : path_(std::move(path)) {}

void SessionStore::load() {
  if (path_.empty()) return;

  std::ifstream f(path_);
  if (!f.is_open()) return;   // first run

  json j = json::parse(f, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw std::runtime_error("Corrupt session store: " + path_);
  }

  // decode into temporaries so a bad entry leaves the store untouched
  std::vector<StudySession> sessions;
  TimerState timer_state;
  TimerSettings settings;
  try {
    if (j.contains("sessions") && j["sessions"].is_array()) {
      for (const auto& item : j["sessions"]) {
        sessions.push_back(item.get<StudySession>());
      }
    }
    if (j.contains("timer_state")) timer_state = j["timer_state"].get<TimerState>();
    if (j.contains("settings")) settings = j["settings"].get<TimerSettings>();
  } catch (const json::exception& e) {
    throw std::runtime_error("Corrupt session store: " + path_ + ": " + e.what());
  }

  sessions_ = std::move(sessions);
  timer_state_ = timer_state;
  settings_ = settings;
}

void SessionStore::save() const {
  if (path_.empty()) return;

  json j;
  j["sessions"] = sessions_;
  j["timer_state"] = timer_state_;
  j["settings"] = settings_;

  std::ofstream f(path_, std::ios::trunc);
  if (!f.is_open()) throw std::runtime_error("Could not write session store: " + path_);
  f << j.dump(2) << "\n";
  if (!f) throw std::runtime_error("Write failed for session store: " + path_);
}

void SessionStore::add_session(const StudySession& s) {
  sessions_.push_back(s);
  save();
}

bool SessionStore::update_session(const StudySession& s) {
  auto it = std::find_if(sessions_.begin(), sessions_.end(),
                         [&](const StudySession& x) { return x.id == s.id; });
  if (it == sessions_.end()) return false;
  *it = s;
  save();
  return true;
}

bool SessionStore::update_session(const std::string& id, const json& updates) {
  if (!updates.is_object()) return false;

  auto it = std::find_if(sessions_.begin(), sessions_.end(),
                         [&](const StudySession& x) { return x.id == id; });
  if (it == sessions_.end()) return false;

  json merged = *it;
  merged.update(updates);
  merged["id"] = id;

  StudySession edited;
  try {
    edited = merged.get<StudySession>();
  } catch (const json::exception& e) {
    throw std::invalid_argument("Bad update for session " + id + ": " + e.what());
  }
  *it = edited;
  save();
  return true;
}

bool SessionStore::delete_session(const std::string& id) {
  auto it = std::remove_if(sessions_.begin(), sessions_.end(),
                           [&](const StudySession& x) { return x.id == id; });
  if (it == sessions_.end()) return false;
  sessions_.erase(it, sessions_.end());
  save();
  return true;
}

void SessionStore::set_timer_state(const TimerState& t) {
  timer_state_ = t;
  save();
}

void SessionStore::set_settings(const TimerSettings& s) {
  settings_ = s;
  save();
}

void SessionStore::clear() {
  sessions_.clear();
  timer_state_ = TimerState{};
  settings_ = TimerSettings{};
  save();
}
