#include <doctest/doctest.h>
#include "sbp/error.hpp"
#include "sbp/renderer.hpp"
#include "test_support.hpp"

using namespace sbp;
using namespace std::chrono_literals;

namespace {
std::vector<SceneRecord> sample_records() {
    return {
        {Scene{0, 0s, "assets/frames/frame_0000.jpg"}, {Cue{2s, 4s, "Intro"}, Cue{4s, 5s, "second line"}}},
        {Scene{1, 10s, "assets/frames/frame_0001.jpg"}, {}},
        {Scene{2, 3725500000us, "assets/frames/frame_0002.jpg"},
         {Cue{3726s, 3727s, "<script>alert(\"x\")</script> & 'quotes'"}}},
    };
}
}

TEST_CASE("html_escape covers markup characters"){
  CHECK(html_escape("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&#39;");
  CHECK(html_escape("plain text") == "plain text");
}

TEST_CASE("each record renders time, image and cues in order"){
  const std::string html = render_html(sample_records());
  CHECK(html.rfind("<!DOCTYPE html>", 0) == 0);
  CHECK(html.find("<title>Video Storyboard</title>") != std::string::npos);
  CHECK(html.find("Time: 00:00:00") != std::string::npos);
  CHECK(html.find("Time: 00:00:10") != std::string::npos);
  CHECK(html.find("Time: 01:02:05") != std::string::npos);
  CHECK(html.find("<img src=\"assets/frames/frame_0001.jpg\" alt=\"Scene at 00:00:10\">") != std::string::npos);
  CHECK(html.find(">Intro</p>") < html.find(">second line</p>"));
}

TEST_CASE("cue text cannot inject markup"){
  const std::string html = render_html(sample_records());
  CHECK(html.find("<script>") == std::string::npos);
  CHECK(html.find("&lt;script&gt;alert(&quot;x&quot;)&lt;/script&gt; &amp; &#39;quotes&#39;") != std::string::npos);
}

TEST_CASE("document is self-contained and deterministic"){
  RenderOptions opt;
  opt.title = "Talk <1>";
  const std::string a = render_html(sample_records(), opt);
  const std::string b = render_html(sample_records(), opt);
  CHECK(a == b);
  CHECK(a.find("<h1>Talk &lt;1&gt;</h1>") != std::string::npos);
  CHECK(a.find("http://") == std::string::npos);
  CHECK(a.find("https://") == std::string::npos);
  CHECK(a.find("<link") == std::string::npos);
  CHECK(a.find("<style>") != std::string::npos);
}

TEST_CASE("rendered document reads back to the same records"){
  const auto records = sample_records();
  const auto parsed = sbp_test::parse_storyboard(render_html(records));
  REQUIRE(parsed.size() == records.size());
  for(size_t i=0;i<records.size();++i){
    CAPTURE(i);
    CHECK(parsed[i].index == records[i].scene.index);
    CHECK(parsed[i].start_us == records[i].scene.timestamp.count());
    CHECK(parsed[i].time == format_hms(records[i].scene.timestamp));
    CHECK(parsed[i].image == records[i].scene.image_path);
    REQUIRE(parsed[i].cues.size() == records[i].cues.size());
    for(size_t j=0;j<records[i].cues.size();++j){
      CHECK(parsed[i].cues[j].start_us == records[i].cues[j].start.count());
      CHECK(parsed[i].cues[j].end_us == records[i].cues[j].end.count());
      CHECK(parsed[i].cues[j].text == records[i].cues[j].text);
    }
  }
}

TEST_CASE("write_document reports unwritable locations"){
  sbp_test::TempDir dir("render");
  auto path = write_document(dir.path(), "storyboard.html", "<html></html>\n");
  CHECK(sbp_test::read_file(path) == "<html></html>\n");
  CHECK_THROWS_AS(write_document(dir / "missing/sub", "storyboard.html", "x"), Error);
}
