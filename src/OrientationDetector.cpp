#include "OrientationDetector.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

DetectorConfig DetectorConfig::defaults_for(SampleKind kind) {
  DetectorConfig c;
  c.kind = kind;
  if (kind == SampleKind::TiltDegrees) {
    c.enter_threshold = 150.0f;
    c.exit_threshold = 30.0f;
  }
  return c;
}

void DetectorConfig::validate() const {
  if (stable_required <= 0) {
    throw ConfigError("stable_required must be > 0");
  }
  if (sample_interval_ms <= 0) {
    throw ConfigError("sample_interval_ms must be > 0");
  }
  if (!(ema_alpha > 0.0f && ema_alpha <= 1.0f)) {
    throw ConfigError("ema_alpha must be in (0, 1]");
  }

  // the exit boundary has to sit on the unflipped side of the enter one,
  // otherwise there is no dead zone and the branches overlap
  if (kind == SampleKind::AccelerationZ) {
    if (!(enter_threshold < exit_threshold)) {
      throw ConfigError("acceleration mode needs enter_threshold < exit_threshold");
    }
  } else {
    if (enter_threshold < 0.0f || exit_threshold < 0.0f) {
      throw ConfigError("tilt thresholds are magnitudes and must be >= 0");
    }
    if (!(enter_threshold > exit_threshold)) {
      throw ConfigError("tilt mode needs enter_threshold > exit_threshold");
    }
  }
}

OrientationDetector::OrientationDetector(ISampleSource& source, const DetectorConfig& config)
  : cfg_(config), ema_(config.ema_alpha) {
  cfg_.validate();
  if (source.kind() != cfg_.kind) {
    throw ConfigError(std::string("sample source delivers ") + sample_kind_name(source.kind()) +
                      " but detector expects " + sample_kind_name(cfg_.kind));
  }

  bool ok = source.subscribe([this](const Sample& s) { on_sample(s); },
                             cfg_.sample_interval_ms);
  if (ok) {
    source_ = &source;
  } else {
    std::cerr << "Warning: " << sample_kind_name(cfg_.kind)
              << " source unavailable, orientation detection disabled\n";
  }
}

OrientationDetector::~OrientationDetector() {
  destroy();
}

OrientationDetector::ObserverId OrientationDetector::add_observer(Observer fn) {
  if (destroyed_) return 0;
  ObserverId id = next_id_++;
  observers_.emplace_back(id, std::move(fn));
  return id;
}

void OrientationDetector::remove_observer(ObserverId id) {
  observers_.erase(
    std::remove_if(observers_.begin(), observers_.end(),
                   [id](const std::pair<ObserverId, Observer>& o) { return o.first == id; }),
    observers_.end());
}

bool OrientationDetector::enters_flipped(float v) const {
  if (cfg_.kind == SampleKind::AccelerationZ) return v < cfg_.enter_threshold;
  return v > cfg_.enter_threshold;
}

bool OrientationDetector::exits_flipped(float v) const {
  if (cfg_.kind == SampleKind::AccelerationZ) return v > cfg_.exit_threshold;
  return v < cfg_.exit_threshold;
}

void OrientationDetector::on_sample(const Sample& s) {
  // torn down, or never got a source
  if (!active()) return;
  // transient sensor gaps: drop silently
  if (!s.valid || !std::isfinite(s.value)) return;

  float v;
  if (cfg_.kind == SampleKind::AccelerationZ) {
    v = ema_.update(s.value);
  } else {
    v = std::fabs(s.value);
  }

  if (enters_flipped(v)) {
    counters_.flip++;
    counters_.unflip = 0;
  } else if (exits_flipped(v)) {
    counters_.unflip++;
    counters_.flip = 0;
  } else {
    // dead zone: decay instead of clearing so a short dip keeps evidence
    counters_.flip = std::max(0, counters_.flip - 1);
    counters_.unflip = std::max(0, counters_.unflip - 1);
  }

  if (counters_.flip >= cfg_.stable_required) {
    publish(true);
  } else if (counters_.unflip >= cfg_.stable_required) {
    publish(false);
  }
}

void OrientationDetector::publish(bool flipped) {
  if (flipped == is_flipped_) return;
  is_flipped_ = flipped;

  // snapshot: observers may remove themselves or tear us down
  auto snapshot = observers_;
  for (auto& o : snapshot) {
    if (destroyed_) break;
    o.second(flipped);
  }
}

void OrientationDetector::destroy() {
  if (destroyed_) return;
  destroyed_ = true;
  if (source_) {
    source_->unsubscribe();
    source_ = nullptr;
  }
  observers_.clear();
}
