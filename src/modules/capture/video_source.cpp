#include "sbp/video_source.hpp"
#include "sbp/error.hpp"
#include <cmath>

namespace sbp {
VideoSource::VideoSource(const std::filesystem::path& path) {
    if (!cap_.open(path.string())) {
        throw Error(ErrorKind::VideoReadError, "cannot open video: " + path.string());
    }
    fps_ = cap_.get(cv::CAP_PROP_FPS);
    if (!std::isfinite(fps_) || fps_ <= 0) fps_ = 0;
}

CaptureStatus VideoSource::read(Frame& f) {
    if (!cap_.grab()) return CaptureStatus::End;
    f.index = next_index_++;
    // No usable frame rate: fall back to the decoder's own clock.
    f.timestamp = fps_ > 0 ? frame_time(f.index, fps_)
                           : from_seconds(cap_.get(cv::CAP_PROP_POS_MSEC) / 1000.0);
    cv::Mat img;
    if (!cap_.retrieve(img) || img.empty()) return CaptureStatus::Corrupt;
    f.bgr = img;
    return CaptureStatus::Ok;
}
}
