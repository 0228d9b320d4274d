#include "SampleParser.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

using nlohmann::json;

const char* sample_kind_name(SampleKind kind) {
  switch (kind) {
    case SampleKind::AccelerationZ: return "acceleration_z";
    case SampleKind::TiltDegrees:   return "tilt_degrees";
  }
  return "unknown";
}

namespace {

// Integral timestamps pass through; fractional ones are rounded. Anything
// that does not fit in int64 is rejected.
bool read_timestamp(const json& t, int64_t& out) {
  if (t.is_number_unsigned()) {
    uint64_t u = t.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
    out = static_cast<int64_t>(u);
    return true;
  }
  if (t.is_number_integer()) {
    out = t.get<int64_t>();
    return true;
  }
  double d = t.get<double>();
  // 2^63 as a double; the max int64 itself is not representable
  if (!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
    return false;
  }
  out = static_cast<int64_t>(std::llround(d));
  return true;
}

bool read_number(const json& j, const char* key, float& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return false;
  out = it->get<float>();
  return true;
}

}  // namespace

bool parse_sample(const json& j, SampleKind kind, Sample& out) {
  if (!j.is_object()) return false;

  out = Sample{};
  if (j.contains("t_ms") && j["t_ms"].is_number()) {
    if (!read_timestamp(j["t_ms"], out.t_ms)) return false;
  }

  if (kind == SampleKind::AccelerationZ) {
    // prefer the gravity-inclusive vector, fall back to plain acceleration
    const json* acc = nullptr;
    if (j.contains("accel_with_gravity") && j["accel_with_gravity"].is_object()) {
      acc = &j["accel_with_gravity"];
    } else if (j.contains("accel") && j["accel"].is_object()) {
      acc = &j["accel"];
    }
    if (acc) out.valid = read_number(*acc, "z", out.value);
  } else {
    out.valid = read_number(j, "beta", out.value);
  }

  return true;
}

bool parse_sample_line(std::string line, SampleKind kind, Sample& out) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (line.empty()) {
    return false;
  }

  json j = json::parse(line, nullptr, false);
  if (j.is_discarded()) return false;

  return parse_sample(j, kind, out);
}
