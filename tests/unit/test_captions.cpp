#include <doctest/doctest.h>
#include <sstream>
#include "sbp/captions.hpp"
#include "sbp/error.hpp"
#include "test_support.hpp"

using namespace sbp;
using namespace std::chrono_literals;

namespace {
std::vector<Cue> parse(const std::string& text) {
    std::istringstream in(text);
    return parse_captions(in, "test.vtt");
}

ErrorKind parse_error_kind(const std::string& text) {
    try { parse(text); }
    catch (const Error& e) { return e.kind(); }
    FAIL("expected parse failure");
    return ErrorKind::InvalidArgument;
}
}

TEST_CASE("WebVTT cues with header, identifiers and settings"){
  auto cues = parse(
      "WEBVTT - lecture\n"
      "Kind: captions\n"
      "\n"
      "intro\n"
      "00:00:02.000 --> 00:00:04.000 align:start position:10%\n"
      "Intro\n"
      "\n"
      "00:00:09.000 --> 00:00:12.000\n"
      "Transition to\n"
      "   the next slide  \n");
  REQUIRE(cues.size() == 2);
  CHECK(cues[0].start == 2s);
  CHECK(cues[0].end == 4s);
  CHECK(cues[0].text == "Intro");
  CHECK(cues[1].start == 9s);
  CHECK(cues[1].end == 12s);
  CHECK(cues[1].text == "Transition to the next slide");
}

TEST_CASE("SubRip input with CRLF and BOM"){
  auto cues = parse(
      "\xEF\xBB\xBF" "1\r\n"
      "00:00:01,000 --> 00:00:02,500\r\n"
      "Hello\r\n"
      "\r\n"
      "2\r\n"
      "00:00:03,000 --> 00:00:04,000\r\n"
      "World\r\n");
  REQUIRE(cues.size() == 2);
  CHECK(cues[0].end == 2500ms);
  CHECK(cues[1].text == "World");
}

TEST_CASE("NOTE, STYLE and REGION blocks carry no cues"){
  auto cues = parse(
      "WEBVTT\n\n"
      "NOTE this is a comment\nspanning lines\n\n"
      "STYLE\n::cue { color: red }\n\n"
      "REGION\nid:fred\n\n"
      "00:01.000 --> 00:02.000\nonly cue\n");
  REQUIRE(cues.size() == 1);
  CHECK(cues[0].start == 1s);
  CHECK(cues[0].text == "only cue");
}

TEST_CASE("inline tags are stripped and entities decoded"){
  auto cues = parse("WEBVTT\n\n00:00:00.000 --> 00:00:01.000\n<v Roger>Fish &amp; chips</v> <i>&lt;3</i>\n");
  REQUIRE(cues.size() == 1);
  CHECK(cues[0].text == "Fish & chips <3");
  CHECK(clean_cue_text("a&nbsp;&nbsp; b\t c") == "a b c");
  CHECK(clean_cue_text("  <b></b>  ").empty());
  CHECK(clean_cue_text("1 < 2") == "1 < 2");
}

TEST_CASE("angle brackets that are not tags stay in the text"){
  CHECK(clean_cue_text("a < b and c > d") == "a < b and c > d");
  CHECK(clean_cue_text("x <= y >= z") == "x <= y >= z");
  CHECK(clean_cue_text("<00:00:01.500>late <c.loud>word</c>") == "late word");
  auto cues = parse("1\n00:00:01,000 --> 00:00:02,000\nif a < b and c > d\n");
  REQUIRE(cues.size() == 1);
  CHECK(cues[0].text == "if a < b and c > d");
}

TEST_CASE("empty cues are dropped and order is restored"){
  auto cues = parse(
      "WEBVTT\n\n"
      "00:00:05.000 --> 00:00:06.000\nlate\n\n"
      "00:00:01.000 --> 00:00:02.000\n<i> </i>\n\n"
      "00:00:01.000 --> 00:00:03.000\nearly a\n\n"
      "00:00:01.000 --> 00:00:04.000\nearly b\n");
  REQUIRE(cues.size() == 3);
  CHECK(cues[0].text == "early a");
  CHECK(cues[1].text == "early b");
  CHECK(cues[2].text == "late");
}

TEST_CASE("timing only block yields no cue"){
  auto cues = parse("WEBVTT\n\n00:00:01.000 --> 00:00:02.000\n");
  CHECK(cues.empty());
}

TEST_CASE("malformed caption sources fail with ParseError"){
  CHECK(parse_error_kind("WEBVTT\n\n00:00:0x.000 --> 00:00:02.000\ntext\n") == ErrorKind::ParseError);
  CHECK(parse_error_kind("WEBVTT\n\n00:00:01.000 --> \ntext\n") == ErrorKind::ParseError);
  CHECK(parse_error_kind("WEBVTT\n\njust some text\nwithout timing\n") == ErrorKind::ParseError);
  CHECK(parse_error_kind("WEBVTT\n\n00:00:05.000 --> 00:00:02.000\nbackwards\n") == ErrorKind::ParseError);
  CHECK(parse_error_kind("WEBVTT\n00:00:01.000 --> 00:00:02.000\nglued to header\n") == ErrorKind::ParseError);
}

TEST_CASE("ParseError names the source line"){
  try {
    parse("WEBVTT\n\n00:00:01.000 --> 00:00:02.000\nok\n\n00:00:xx.000 --> 00:00:04.000\nbad\n");
    FAIL("expected ParseError");
  } catch (const Error& e) {
    CHECK(std::string(e.what()).find("test.vtt:6") != std::string::npos);
  }
}

TEST_CASE("load_captions reports a missing file"){
  sbp_test::TempDir dir("captions");
  try {
    load_captions(dir / "missing.vtt");
    FAIL("expected InputNotFound");
  } catch (const Error& e) {
    CHECK(e.kind() == ErrorKind::InputNotFound);
  }

  sbp_test::write_file(dir / "ok.vtt", "WEBVTT\n\n00:00:00.500 --> 00:00:01.000\nhi\n");
  auto cues = load_captions(dir / "ok.vtt");
  REQUIRE(cues.size() == 1);
  CHECK(cues[0].start == 500ms);
}
