#pragma once
#include <string>
#include "logger.hpp"
#include "time.hpp"

namespace sbp {
// Command line value parsers. Each returns false and leaves `out` unspecified on bad input.
bool parse_level(const std::string& s, LogLevel& out);
// Finite decimal only; "nan" and "inf" are rejected.
bool parse_double(const std::string& s, double& out);
// Base 10, must fit in an int.
bool parse_int(const std::string& s, int& out);
// Seconds as a finite decimal within the range of Duration.
bool parse_seconds(const std::string& s, Duration& out);

const char* usage_text();
}
