#include "sbp/cli.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace sbp {
bool parse_level(const std::string& s, LogLevel& out) {
    if (s == "error") out = LogLevel::Error;
    else if (s == "warn" || s == "warning") out = LogLevel::Warn;
    else if (s == "info") out = LogLevel::Info;
    else if (s == "debug") out = LogLevel::Debug;
    else return false;
    return true;
}

bool parse_double(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtod(s.c_str(), &end);
    return end && *end == '\0' && errno != ERANGE && std::isfinite(out);
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (!end || *end != '\0' || errno == ERANGE) return false;
    if (v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_seconds(const std::string& s, Duration& out) {
    double secs = 0;
    if (!parse_double(s, secs) || std::fabs(secs) > 1e12) return false;
    out = from_seconds(secs);
    return true;
}

const char* usage_text() {
    return "usage: storyboard <video> <captions.vtt> [--output-dir DIR] [--threshold F]\n"
           "         [--tolerance N] [--stride N] [--min-gap SECONDS] [--title TEXT]\n"
           "         [--metrics FILE] [--log-level error|warn|info|debug]";
}
}
