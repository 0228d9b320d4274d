#include "AppConfig.hpp"
#include "SerialSampleSource.hpp"
#include "SessionStore.hpp"
#include "StudyTimer.hpp"

#include <iostream>
#include <string>

// Live mode: reads JSON sample lines from a device on a serial port, e.g.
// {"t_ms":0,"accel_with_gravity":{"x":0.01,"y":-0.02,"z":9.79}}
int main(int argc, char** argv) {
  try {
    AppConfig cfg = load_app_config(argc > 1 ? argv[1] : "");

    SessionStore store(cfg.store_file);
    store.load();
    if (cfg.has_timer_settings) store.set_settings(cfg.timer);

    SerialSampleSource serial(cfg.serial_port, cfg.detector.kind);

    // an absent sensor leaves the detector inert rather than failing
    StudyTimer timer(serial, cfg.detector, store);
    if (!timer.detector().active()) {
      std::cerr << "No sensor on " << cfg.serial_port << ", nothing to do\n";
      return 0;
    }

    timer.detector().add_observer([&](bool flipped) {
      // EXACT format Node/server expects: one JSON object per line
      std::cout
        << "{"
        << "\"t_ms\":"      << StudyTimer::system_clock_ms()     << ","
        << "\"flipped\":"   << (flipped ? "true" : "false")       << ","
        << "\"state\":\""   << timer_phase_name(timer.phase())    << "\","
        << "\"elapsed_s\":" << timer.elapsed_seconds()           << ","
        << "\"flips\":"     << timer.flip_count()
        << "}"
        << std::endl;
    });

    // Serial timing is driven by the device, so no manual sleeps here
    serial.run([&]() { timer.check_alert(); });

    timer.shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error in main: " << e.what() << "\n";
    return 1;
  }
}
