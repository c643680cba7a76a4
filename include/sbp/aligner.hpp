#pragma once
#include <vector>
#include "captions.hpp"
#include "scene_detector.hpp"

namespace sbp {
struct SceneRecord {
    Scene scene;
    std::vector<Cue> cues;
};

// Each cue goes to the last scene with timestamp <= cue.start (ties: highest index);
// cues before the first scene go to the first. Both inputs must be time-sorted.
// Returns an empty vector only when `scenes` is empty.
std::vector<SceneRecord> align(const std::vector<Scene>& scenes, const std::vector<Cue>& cues);
}
