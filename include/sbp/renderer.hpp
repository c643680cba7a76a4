#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "aligner.hpp"

namespace sbp {
struct RenderOptions {
    std::string title = "Video Storyboard";
};

std::string html_escape(std::string_view text);

// Self-contained document; same records and options give the same bytes.
std::string render_html(const std::vector<SceneRecord>& records, const RenderOptions& opt = {});

// Writes `html` to <dir>/<name>. Throws Error(WriteError).
std::filesystem::path write_document(const std::filesystem::path& dir, const std::string& name,
                                     const std::string& html);
}
