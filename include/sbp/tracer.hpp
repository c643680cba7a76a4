#pragma once
#include "metrics.hpp"
#include <string>
#include <utility>

#define SBP_CONCAT_(a, b) a##b
#define SBP_CONCAT(a, b) SBP_CONCAT_(a, b)

// Marks (stage, "in") now and (stage, "out", items) at scope exit. `metrics` may be null.
#define SBP_TRACE_STAGE(metrics, stage) \
    sbp::ScopeStamp SBP_CONCAT(_scope_stamp_, __LINE__)(metrics, stage)

namespace sbp {
struct ScopeStamp {
    Metrics* m;
    std::string stage;
    std::size_t items = 0;

    ScopeStamp(Metrics* met, std::string s) : m(met), stage(std::move(s)) {
        if (m) m->mark(stage, "in");
    }

    ScopeStamp(const ScopeStamp&) = delete;
    ScopeStamp& operator=(const ScopeStamp&) = delete;

    ~ScopeStamp() { if (m) m->mark(stage, "out", items); }
};
}
