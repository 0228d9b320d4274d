#pragma once
#include "Sample.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Map one JSON frame onto a Sample of the given kind.
// Acceleration frames:  {"t_ms":0,"accel_with_gravity":{"z":-9.7}}  (or "accel")
// Tilt frames:          {"t_ms":0,"beta":172.5}
// A frame without a usable reading yields out.valid == false.
// Returns false if the frame is not a JSON object or its t_ms does not fit
// in 64 bits.
bool parse_sample(const nlohmann::json& j, SampleKind kind, Sample& out);

// Same as above for one line of text. Empty or unparseable lines return false.
bool parse_sample_line(std::string line, SampleKind kind, Sample& out);
