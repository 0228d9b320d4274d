#pragma once
#include "ISampleSource.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Replays a recorded JSON array of frames.
class JsonSampleSource : public ISampleSource {
public:
  JsonSampleSource(const std::string& path, SampleKind kind);

  static JsonSampleSource from_text(const std::string& text, SampleKind kind);

  SampleKind kind() const override { return kind_; }
  bool subscribe(SampleHandler handler, int interval_ms) override;
  void unsubscribe() override;
  bool subscribed() const override { return static_cast<bool>(handler_); }

  // Deliver the next frame. False at the end of the recording or when
  // nobody is subscribed. With realtime set, first sleeps the t_ms gap
  // since the previous frame.
  bool pump(bool realtime = false);

  // Deliver every remaining frame.
  void run(bool realtime);

  size_t size() const { return frames_.size(); }
  // Timestamp of the most recently delivered frame, -1 before the first.
  int64_t last_t_ms() const { return last_t_ms_; }
  int requested_interval_ms() const { return interval_ms_; }

private:
  explicit JsonSampleSource(SampleKind kind);
  void load(const nlohmann::json& j);

  SampleKind kind_;
  std::vector<Sample> frames_;
  size_t idx_ = 0;
  int64_t last_t_ms_ = -1;
  SampleHandler handler_;
  int interval_ms_ = 0;
};
