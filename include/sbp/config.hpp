#pragma once
#include <opencv2/core.hpp>
#include <filesystem>
#include <string>
#include "time.hpp"

namespace sbp {
struct DetectorConfig {
    double threshold = 0.01;           // fraction of changed pixels; a change must exceed it
    int pixel_tolerance = 30;          // per-pixel |diff| must exceed this to count
    cv::Size analysis_size{640, 360};  // empty = compare at native resolution
    int sample_stride = 1;             // compare frames whose index % stride == 0
    Duration min_scene_gap{0};         // new scene only when strictly later than last + gap
    int jpeg_quality = 95;
};

struct RunConfig {
    std::filesystem::path video_path;
    std::filesystem::path caption_path;
    std::filesystem::path output_dir;
    DetectorConfig detector;
    std::string title = "Video Storyboard";
    std::string document_name = "storyboard.html";
    std::string frames_subdir = "assets/frames";
};

// Throws Error(InvalidArgument) on out-of-range values.
void validate_config(const DetectorConfig& cfg);
void validate_config(const RunConfig& cfg);
}
