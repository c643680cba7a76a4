#pragma once
#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>
#include <vector>

namespace sbp {
struct Stamp { std::string stage; std::string event; double ms; std::size_t items; };

// Stage timings of one run. Times are milliseconds since construction.
class Metrics {
public:
    using clk = std::chrono::steady_clock;

    Metrics() : origin_(clk::now()) {}

    void mark(const std::string& stage, const std::string& event, std::size_t items = 0) {
        double ms = std::chrono::duration<double, std::milli>(clk::now() - origin_).count();
        stamps_.push_back({stage, event, ms, items});
    }

    // Elapsed milliseconds between the first "in" and the last "out" of a stage, or -1.
    double stage_ms(const std::string& stage) const {
        double in = -1, out = -1;
        for (auto& s : stamps_) {
            if (s.stage != stage) continue;
            if (s.event == "in" && in < 0) in = s.ms;
            if (s.event == "out") out = s.ms;
        }
        return (in < 0 || out < 0) ? -1.0 : out - in;
    }

    const std::vector<Stamp>& stamps() const { return stamps_; }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        f << "stage,event,timestamp_ms,items\n";
        for (auto& s : stamps_) f << s.stage << "," << s.event << "," << s.ms << "," << s.items << "\n";
        return static_cast<bool>(f);
    }

private:
    clk::time_point origin_;
    std::vector<Stamp> stamps_;
};
}   // namespace sbp
