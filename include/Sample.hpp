#pragma once
#include <cstdint>

enum class SampleKind {
  AccelerationZ,  // gravity-axis acceleration in m/s^2
  TiltDegrees     // front-to-back tilt in degrees, [-180, 180]
};

struct Sample {
  int64_t t_ms = 0;
  bool valid = false;   // false when the reading had no usable value
  float value = 0.0f;
};

const char* sample_kind_name(SampleKind kind);
