#include "AppConfig.hpp"
#include "JsonSampleSource.hpp"
#include "SessionStats.hpp"
#include "SessionStore.hpp"
#include "StudyTimer.hpp"

#include <iostream>
#include <string>

// Replays a recorded sample file through the detector and timer, printing
// one JSON line per confirmed flip for the frontend.
int main(int argc, char** argv) {
  try {
    AppConfig cfg = load_app_config(argc > 1 ? argv[1] : "");

    SessionStore store(cfg.store_file);
    store.load();
    if (cfg.has_timer_settings) store.set_settings(cfg.timer);

    JsonSampleSource source(cfg.replay_file, cfg.detector.kind);

    // recording time drives the session clock so replays are reproducible
    const int64_t base_ms = StudyTimer::system_clock_ms();
    StudyTimer timer(source, cfg.detector, store, [&]() {
      return base_ms + (source.last_t_ms() < 0 ? 0 : source.last_t_ms());
    });

    timer.detector().add_observer([&](bool flipped) {
      std::cout
        << "{"
        << "\"t_ms\":"      << source.last_t_ms()                << ","
        << "\"flipped\":"   << (flipped ? "true" : "false")       << ","
        << "\"state\":\""   << timer_phase_name(timer.phase())    << "\","
        << "\"elapsed_s\":" << timer.elapsed_seconds()           << ","
        << "\"flips\":"     << timer.flip_count()
        << "}"
        << std::endl;
    });

    while (source.pump(cfg.realtime)) {
      timer.check_alert();
    }

    timer.shutdown();

    UserStats st = compute_stats(store.sessions(), StudyTimer::system_clock_ms());
    std::cerr << "Sessions: " << st.total_sessions
              << ", total " << format_duration(st.total_study_s)
              << ", longest " << format_duration(st.longest_session_s)
              << ", streak " << st.current_streak << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
