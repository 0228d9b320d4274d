#include "JsonSampleSource.hpp"
#include "SampleParser.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

using nlohmann::json;

JsonSampleSource::JsonSampleSource(SampleKind kind) : kind_(kind) {}

JsonSampleSource::JsonSampleSource(const std::string& path, SampleKind kind)
  : kind_(kind) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open JSON file: " + path);

  json j = json::parse(f, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("Invalid JSON in " + path);
  load(j);
}

JsonSampleSource JsonSampleSource::from_text(const std::string& text, SampleKind kind) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) throw std::runtime_error("Invalid JSON sample text");

  JsonSampleSource src(kind);
  src.load(j);
  return src;
}

void JsonSampleSource::load(const json& j) {
  if (!j.is_array()) throw std::runtime_error("JSON must be an array");

  frames_.reserve(j.size());
  for (const auto& item : j) {
    Sample s;
    // non-object entries are kept as gaps so the timeline stays intact
    if (!parse_sample(item, kind_, s)) s = Sample{};
    frames_.push_back(s);
  }
}

bool JsonSampleSource::subscribe(SampleHandler handler, int interval_ms) {
  handler_ = std::move(handler);
  interval_ms_ = interval_ms;
  return true;
}

void JsonSampleSource::unsubscribe() {
  handler_ = nullptr;
}

bool JsonSampleSource::pump(bool realtime) {
  if (!handler_ || idx_ >= frames_.size()) return false;

  const Sample& s = frames_[idx_++];
  // simulate real-time spacing based on t_ms in the recording
  if (realtime && last_t_ms_ >= 0) {
    int64_t dt = s.t_ms - last_t_ms_;
    if (dt > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(dt));
    }
  }
  last_t_ms_ = s.t_ms;

  // copy: the handler may unsubscribe us while running
  SampleHandler handler = handler_;
  handler(s);
  return true;
}

void JsonSampleSource::run(bool realtime) {
  while (pump(realtime)) {
  }
}
