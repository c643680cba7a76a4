#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace sbp {
// All cue and scene times share this fixed-point unit.
using Duration = std::chrono::microseconds;

// Parses "[hh:]mm:ss.mmm" (',' is accepted in place of '.'). Throws Error(ParseError).
Duration parse_timestamp(std::string_view text);

// "HH:MM:SS", truncated to whole seconds. Hours grow past two digits when needed.
std::string format_hms(Duration d);

// Timestamp of frame `index` in a stream running at `fps` frames per second.
Duration frame_time(int64_t index, double fps);

Duration from_seconds(double seconds);
double to_seconds(Duration d);
}
