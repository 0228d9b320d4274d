#pragma once
#include "EmaFilter.hpp"
#include "ISampleSource.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

struct DetectorConfig {
  SampleKind kind = SampleKind::AccelerationZ;
  float ema_alpha = 0.25f;         // acceleration mode only
  float enter_threshold = -0.6f;   // acceleration: filtered z below this
  float exit_threshold = -0.2f;    // acceleration: filtered z above this
  int stable_required = 3;
  int sample_interval_ms = 100;

  // Acceleration: enter -0.6 / exit -0.2 on the filtered value.
  // Tilt: enter 150 / exit 30 on abs(angle).
  static DetectorConfig defaults_for(SampleKind kind);

  // Throws ConfigError on crossed thresholds or non-positive counts.
  void validate() const;
};

struct StabilityCounters {
  int flip = 0;
  int unflip = 0;
};

// Turns a noisy sample stream into a debounced face-down signal.
//
// Three layers: EMA smoothing (acceleration mode), separate enter/exit
// thresholds, and stable_required consecutive samples before a change is
// published. Observers run synchronously on the thread delivering samples
// and only on a confirmed change.
class OrientationDetector {
public:
  using Observer = std::function<void(bool is_flipped)>;
  using ObserverId = int;

  // Subscribes to source immediately. If the source is unavailable the
  // detector stays inert and never publishes.
  OrientationDetector(ISampleSource& source, const DetectorConfig& config);
  ~OrientationDetector();

  OrientationDetector(const OrientationDetector&) = delete;
  OrientationDetector& operator=(const OrientationDetector&) = delete;

  ObserverId add_observer(Observer fn);
  void remove_observer(ObserverId id);

  bool current_state() const { return is_flipped_; }

  void on_sample(const Sample& s);

  // Unsubscribes and drops all observers. Terminal.
  void destroy();

  bool active() const { return !destroyed_ && source_ != nullptr; }
  bool destroyed() const { return destroyed_; }
  const StabilityCounters& counters() const { return counters_; }
  const DetectorConfig& config() const { return cfg_; }

private:
  bool enters_flipped(float v) const;
  bool exits_flipped(float v) const;
  void publish(bool flipped);

  DetectorConfig cfg_;
  ISampleSource* source_ = nullptr;   // null when unavailable or torn down
  EmaFilter ema_;

  StabilityCounters counters_;
  bool is_flipped_ = false;
  bool destroyed_ = false;

  std::vector<std::pair<ObserverId, Observer>> observers_;
  ObserverId next_id_ = 1;
};
