#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "captions.hpp"
#include "config.hpp"
#include "error.hpp"
#include "frame.hpp"
#include "metrics.hpp"

namespace sbp {
// Input stages. The rest of the chain (detect, align, render, publish) is fixed.
struct Pipeline {
    std::function<std::vector<Cue>(const std::filesystem::path&)> load_captions;
    std::function<FrameSource(const std::filesystem::path&)> open_video;
};

// WebVTT/SubRip parser and cv::VideoCapture.
Pipeline default_pipeline();

struct RunResult {
    bool ok{false};
    std::optional<ErrorKind> error;
    std::string message;
    std::vector<Warning> warnings;
    std::size_t cue_count{0};
    std::size_t scene_count{0};
    int64_t frames_seen{0};
    std::filesystem::path document_path;
};

/**
 * Converts one video + caption pair into <output_dir>/storyboard.html and its
 * keyframes. Output is published only when every stage succeeds; on failure
 * the result carries the error kind and the previous output (if any) is left
 * untouched. An output directory holding the inputs or files of its own is
 * refused with InvalidArgument. Every std::exception is reported through the
 * result, classified by the stage it escaped from. Never writes to the console.
 */
RunResult run_storyboard(const RunConfig& cfg, const Pipeline& pl = default_pipeline(),
                         Metrics* metrics = nullptr);
}
