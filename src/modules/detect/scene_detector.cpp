#include "sbp/scene_detector.hpp"
#include "sbp/preprocess.hpp"

namespace sbp {
std::vector<Scene> detect_scenes(const FrameSource& next, const DetectorConfig& cfg,
                                 KeyframeStore& store, std::vector<Warning>& warnings,
                                 DetectionStats* stats) {
    validate_config(cfg);
    DetectionStats local;
    DetectionStats& st = stats ? *stats : local;

    std::vector<Scene> scenes;
    cv::Mat ref;                         // analysis image of the last captured scene
    cv::Size size = cfg.analysis_size;
    Frame f;

    while (true) {
        const CaptureStatus status = next(f);
        if (status == CaptureStatus::End) break;
        ++st.frames_seen;

        if (status == CaptureStatus::Corrupt) {
            ++st.frames_skipped;
            warnings.push_back({WarningKind::FrameDecode, f.index,
                                "frame " + std::to_string(f.index) + " could not be decoded, skipped"});
            continue;
        }

        if (scenes.empty()) {
            // The opening frame is always a scene, pinned to t=0.
            ref = to_analysis_gray(f.bgr, size);
            size = ref.size();
            scenes.push_back({0, Duration::zero(), store.save(0, f.bgr)});
            continue;
        }

        if (f.index % cfg.sample_stride != 0) continue;
        ++st.frames_compared;

        cv::Mat cur = to_analysis_gray(f.bgr, size);
        const double ratio = change_ratio(ref, cur, cfg.pixel_tolerance);
        if (ratio > cfg.threshold && f.timestamp > scenes.back().timestamp + cfg.min_scene_gap) {
            const int idx = static_cast<int>(scenes.size());
            scenes.push_back({idx, f.timestamp, store.save(idx, f.bgr)});
            ref = cur;
        }
    }

    if (scenes.empty()) {
        throw Error(ErrorKind::VideoReadError, st.frames_seen == 0
                                                   ? "video yields no frames"
                                                   : "none of " + std::to_string(st.frames_seen) +
                                                         " frames could be decoded");
    }
    return scenes;
}
}
