#pragma once
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>
#include "time.hpp"

namespace sbp {
struct Cue {
    Duration start;
    Duration end;
    std::string text;
};

/**
 * Parses a WebVTT (or SubRip) caption track.
 *
 * Cue text lines are joined with single spaces, inline tags are stripped and
 * basic character references decoded. Cues whose text is empty are dropped;
 * the rest are returned stably sorted by start time.
 *
 * Throws Error(ParseError) on a malformed timing line, an end before its start,
 * or a text block with no timing line.
 */
std::vector<Cue> parse_captions(std::istream& in, const std::string& source_name = "<captions>");

// Throws Error(InputNotFound) when the file cannot be opened.
std::vector<Cue> load_captions(const std::filesystem::path& path);

// Removes "<...>" tags and decodes &amp; &lt; &gt; &quot; &#39; &nbsp;.
std::string clean_cue_text(std::string_view raw);
}
