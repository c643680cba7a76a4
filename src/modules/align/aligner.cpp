#include "sbp/aligner.hpp"

namespace sbp {
std::vector<SceneRecord> align(const std::vector<Scene>& scenes, const std::vector<Cue>& cues){
  std::vector<SceneRecord> out; out.reserve(scenes.size());
  for(auto& s : scenes) out.push_back({s, {}});
  if(out.empty()) return out;
  size_t cur = 0;
  for(auto& c : cues){
    // `<=` walks through equal timestamps so ties land on the later scene.
    while(cur+1 < scenes.size() && scenes[cur+1].timestamp <= c.start) ++cur;
    out[cur].cues.push_back(c);
  }
  return out;
}
}
