#pragma once
#include <opencv2/core.hpp>
#include <cstdint>
#include <functional>
#include "time.hpp"

namespace sbp {
struct Frame {
    int64_t index{-1};
    Duration timestamp{0};
    cv::Mat bgr;
};

enum class CaptureStatus { Ok, Corrupt, End };

// Pulls the next frame in timestamp order. On Corrupt, `index` identifies the bad frame.
using FrameSource = std::function<CaptureStatus(Frame&)>;
}
