#pragma once
#include "Sample.hpp"
#include <functional>

using SampleHandler = std::function<void(const Sample&)>;

class ISampleSource {
public:
  virtual ~ISampleSource() = default;

  virtual SampleKind kind() const = 0;

  // Returns false if the underlying sensor is not available.
  // interval_ms is a request, sources may deliver at their own cadence.
  virtual bool subscribe(SampleHandler handler, int interval_ms) = 0;
  virtual void unsubscribe() = 0;
  virtual bool subscribed() const = 0;
};
