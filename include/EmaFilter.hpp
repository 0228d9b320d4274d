#pragma once

// Exponential moving average. The first update seeds the filter with the
// raw value; after that it is never reset.
class EmaFilter {
public:
  explicit EmaFilter(float alpha);

  float update(float x);

  bool has_value() const { return has_prev_; }
  float value() const { return prev_filt_; }
  float alpha() const { return alpha_; }

private:
  float alpha_;
  bool has_prev_ = false;
  float prev_filt_ = 0.0f;
};
