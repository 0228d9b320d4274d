#pragma once
#include "StudySession.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct UserStats {
  int64_t total_study_s = 0;
  int total_sessions = 0;
  double average_session_s = 0.0;
  int64_t longest_session_s = 0;
  int current_streak = 0;
  int64_t last_study_ms = -1;   // -1 when there are no sessions
};

// Streak: walk sessions newest first from now_ms; each session whose start
// is at most one whole day before the previous check point extends it.
UserStats compute_stats(std::vector<StudySession> sessions, int64_t now_ms);

// "MM:SS", or "HH:MM:SS" once there is at least one hour.
std::string format_duration(int64_t seconds);
