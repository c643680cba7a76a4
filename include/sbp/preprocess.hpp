#pragma once
#include <opencv2/core.hpp>

namespace sbp {
// 8-bit single channel copy of `bgr` at `size` (empty size keeps the native resolution).
cv::Mat to_analysis_gray(const cv::Mat& bgr, cv::Size size);

// Fraction of pixels whose absolute difference is strictly above `tolerance`.
// Both inputs must be 8-bit gray of the same size.
double change_ratio(const cv::Mat& ref_gray, const cv::Mat& cur_gray, int tolerance);
}
