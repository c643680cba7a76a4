#include "sbp/time.hpp"
#include "sbp/error.hpp"
#include <cmath>
#include <cstdio>
#include <vector>

namespace sbp {
namespace {
bool parse_digits(std::string_view s, int64_t& out) {
    if (s.empty() || s.size() > 9) return false;
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

[[noreturn]] void bad_timestamp(std::string_view text, const char* why) {
    throw Error(ErrorKind::ParseError,
                "malformed timestamp '" + std::string(text) + "': " + why);
}
}

Duration parse_timestamp(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t pos = 0;
    while (true) {
        auto colon = text.find(':', pos);
        parts.push_back(text.substr(pos, colon == std::string_view::npos ? colon : colon - pos));
        if (colon == std::string_view::npos) break;
        pos = colon + 1;
    }
    if (parts.size() < 2 || parts.size() > 3) bad_timestamp(text, "expected [hh:]mm:ss.mmm");

    std::string_view sec_part = parts.back();
    auto dot = sec_part.find_first_of(".,");
    if (dot == std::string_view::npos) bad_timestamp(text, "missing milliseconds");
    std::string_view frac = sec_part.substr(dot + 1);
    sec_part = sec_part.substr(0, dot);

    int64_t h = 0, m = 0, s = 0, ms = 0;
    if (parts.size() == 3 && !parse_digits(parts[0], h)) bad_timestamp(text, "bad hours");
    if (!parse_digits(parts[parts.size() - 2], m)) bad_timestamp(text, "bad minutes");
    if (!parse_digits(sec_part, s)) bad_timestamp(text, "bad seconds");
    if (frac.size() != 3 || !parse_digits(frac, ms)) bad_timestamp(text, "bad milliseconds");
    if (m > 59 || s > 59) bad_timestamp(text, "minutes/seconds out of range");

    return std::chrono::hours(h) + std::chrono::minutes(m) + std::chrono::seconds(s) +
           std::chrono::milliseconds(ms);
}

std::string format_hms(Duration d) {
    long long total = d.count() < 0 ? 0 : static_cast<long long>(d.count() / 1000000);
    char buf[32];
    std::snprintf(buf, sizeof buf, "%02lld:%02lld:%02lld", total / 3600, (total / 60) % 60, total % 60);
    return buf;
}

Duration frame_time(int64_t index, double fps) {
    return Duration(std::llround(static_cast<double>(index) * 1e6 / fps));
}

Duration from_seconds(double seconds) { return Duration(std::llround(seconds * 1e6)); }

double to_seconds(Duration d) { return static_cast<double>(d.count()) / 1e6; }
}
