#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"
#include "error.hpp"
#include "frame.hpp"
#include "keyframe_store.hpp"

namespace sbp {
struct Scene {
    int index{0};
    Duration timestamp{0};
    std::string image_path;
};

struct DetectionStats {
    int64_t frames_seen = 0;
    int64_t frames_compared = 0;
    int64_t frames_skipped = 0;
};

/**
 * Walks `next` to exhaustion and returns the detected scenes.
 *
 * Scene 0 is always emitted at timestamp 0 from the first decodable frame.
 * Each later sampled frame is compared against the keyframe of the most
 * recent scene; a change ratio strictly above cfg.threshold starts a new scene
 * and becomes the new reference. Undecodable frames are skipped and recorded
 * in `warnings`.
 *
 * Throws Error(VideoReadError) if no frame decodes, Error(WriteError) if a
 * keyframe cannot be saved.
 */
std::vector<Scene> detect_scenes(const FrameSource& next, const DetectorConfig& cfg,
                                 KeyframeStore& store, std::vector<Warning>& warnings,
                                 DetectionStats* stats = nullptr);
}
