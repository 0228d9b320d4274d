#include "EmaFilter.hpp"

EmaFilter::EmaFilter(float alpha) : alpha_(alpha) {}

float EmaFilter::update(float x) {
  if (!has_prev_) {
    has_prev_ = true;
    prev_filt_ = x;
    return x;
  }
  prev_filt_ = alpha_ * x + (1.0f - alpha_) * prev_filt_;
  return prev_filt_;
}
