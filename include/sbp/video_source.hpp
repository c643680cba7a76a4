#pragma once
#include <opencv2/videoio.hpp>
#include <filesystem>
#include "frame.hpp"

namespace sbp {
class VideoSource {
public:
    // Throws Error(VideoReadError) when the container cannot be opened.
    explicit VideoSource(const std::filesystem::path& path);

    CaptureStatus read(Frame& f);

    double fps() const { return fps_; }
    int64_t frames_read() const { return next_index_; }

private:
    cv::VideoCapture cap_;
    double fps_{0};
    int64_t next_index_{0};
};
}
