#include <doctest/doctest.h>
#include "sbp/aligner.hpp"

using namespace sbp;
using namespace std::chrono_literals;

namespace {
Scene scene(int idx, Duration t) { return Scene{idx, t, "assets/frames/frame_000" + std::to_string(idx) + ".jpg"}; }
Cue cue(Duration s, Duration e, std::string text) { return Cue{s, e, std::move(text)}; }
}

TEST_CASE("cues land on the last scene that started before them"){
  std::vector<Scene> scenes{scene(0, 0s), scene(1, 10s)};
  std::vector<Cue> cues{cue(2s, 4s, "Intro"), cue(9s, 12s, "Transition")};
  auto recs = align(scenes, cues);
  REQUIRE(recs.size() == 2);
  CHECK(recs[0].scene.timestamp == 0s);
  REQUIRE(recs[0].cues.size() == 1);
  CHECK(recs[0].cues[0].text == "Intro");
  CHECK(recs[1].scene.timestamp == 10s);
  REQUIRE(recs[1].cues.size() == 1);
  CHECK(recs[1].cues[0].text == "Transition");
}

TEST_CASE("a cue starting exactly at a scene belongs to that scene"){
  auto recs = align({scene(0, 0s), scene(1, 5s)}, {cue(4999999us, 5s, "before"), cue(5s, 6s, "edge")});
  REQUIRE(recs.size() == 2);
  REQUIRE(recs[0].cues.size() == 1);
  CHECK(recs[0].cues[0].text == "before");
  REQUIRE(recs[1].cues.size() == 1);
  CHECK(recs[1].cues[0].text == "edge");
}

TEST_CASE("equal scene timestamps resolve to the later detection"){
  auto recs = align({scene(0, 0s), scene(1, 3s), scene(2, 3s)}, {cue(3s, 4s, "tie"), cue(3500ms, 4s, "after")});
  REQUIRE(recs.size() == 3);
  CHECK(recs[1].cues.empty());
  REQUIRE(recs[2].cues.size() == 2);
  CHECK(recs[2].cues[0].text == "tie");
}

TEST_CASE("cues before the first scene go to the first scene"){
  auto recs = align({scene(0, 2s), scene(1, 8s)}, {cue(0s, 1s, "early"), cue(3s, 4s, "mid")});
  REQUIRE(recs[0].cues.size() == 2);
  CHECK(recs[0].cues[0].text == "early");
  CHECK(recs[1].cues.empty());
}

TEST_CASE("silent scenes and empty inputs"){
  auto silent = align({scene(0, 0s), scene(1, 5s), scene(2, 9s)}, {cue(1s, 2s, "a"), cue(10s, 11s, "b")});
  REQUIRE(silent.size() == 3);
  CHECK(silent[0].cues.size() == 1);
  CHECK(silent[1].cues.empty());
  CHECK(silent[2].cues.size() == 1);

  auto no_cues = align({scene(0, 0s)}, {});
  REQUIRE(no_cues.size() == 1);
  CHECK(no_cues[0].cues.empty());

  CHECK(align({}, {cue(0s, 1s, "x")}).empty());
}

TEST_CASE("every cue appears in exactly one record"){
  std::vector<Scene> scenes;
  for(int i=0;i<7;++i) scenes.push_back(scene(i, Duration(i * 4100000LL)));
  std::vector<Cue> cues;
  for(int i=0;i<50;++i) cues.push_back(cue(Duration(i * 613000LL), Duration(i * 613000LL + 500000), "cue " + std::to_string(i)));

  auto recs = align(scenes, cues);
  REQUIRE(recs.size() == scenes.size());
  size_t total = 0, next = 0;
  for(size_t r=0;r<recs.size();++r){
    CHECK(recs[r].scene.index == static_cast<int>(r));
    for(auto& c : recs[r].cues){
      CHECK(c.text == "cue " + std::to_string(next++));
      CHECK(recs[r].scene.timestamp <= c.start);
      if(r+1 < recs.size()) CHECK(c.start < recs[r+1].scene.timestamp);
    }
    total += recs[r].cues.size();
  }
  CHECK(total == cues.size());
}
