#include "SessionStats.hpp"
#include <algorithm>
#include <cstdio>

namespace {
constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;
}

UserStats compute_stats(std::vector<StudySession> sessions, int64_t now_ms) {
  UserStats st;
  if (sessions.empty()) return st;

  for (const auto& s : sessions) {
    st.total_study_s += s.duration_s;
    st.longest_session_s = std::max(st.longest_session_s, s.duration_s);
  }
  st.total_sessions = static_cast<int>(sessions.size());
  st.average_session_s = static_cast<double>(st.total_study_s) / st.total_sessions;

  std::sort(sessions.begin(), sessions.end(),
            [](const StudySession& a, const StudySession& b) { return a.start_ms > b.start_ms; });

  int64_t check_ms = now_ms;
  for (const auto& s : sessions) {
    int64_t diff = check_ms - s.start_ms;
    // floor division, a session in the future counts as today
    int64_t diff_days = diff >= 0 ? diff / kDayMs : -((-diff + kDayMs - 1) / kDayMs);
    if (diff_days > 1) break;
    st.current_streak++;
    check_ms = s.start_ms;
  }
  st.last_study_ms = sessions.front().start_ms;

  return st;
}

std::string format_duration(int64_t seconds) {
  if (seconds < 0) seconds = 0;
  const long long h = seconds / 3600;
  const long long m = (seconds % 3600) / 60;
  const long long s = seconds % 60;

  char buf[32];
  if (h > 0) {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", h, m, s);
  } else {
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", m, s);
  }
  return buf;
}
