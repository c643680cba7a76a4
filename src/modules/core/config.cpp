#include "sbp/config.hpp"
#include "sbp/error.hpp"
#include <cmath>

namespace sbp {
const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InputNotFound: return "InputNotFound";
    case ErrorKind::ParseError: return "ParseError";
    case ErrorKind::VideoReadError: return "VideoReadError";
    case ErrorKind::WriteError: return "WriteError";
    case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

const char* to_string(WarningKind kind) {
    switch (kind) {
    case WarningKind::FrameDecode: return "FrameDecodeWarning";
    case WarningKind::Cleanup: return "CleanupWarning";
    }
    return "Unknown";
}

namespace {
void invalid(const std::string& msg) { throw Error(ErrorKind::InvalidArgument, msg); }

bool is_plain_relative(const std::filesystem::path& p) {
    if (p.empty() || p.is_absolute()) return false;
    for (auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}
}

void validate_config(const DetectorConfig& cfg) {
    if (!std::isfinite(cfg.threshold) || cfg.threshold < 0.0 || cfg.threshold > 1.0)
        invalid("threshold must be within [0, 1]");
    if (cfg.pixel_tolerance < 0 || cfg.pixel_tolerance > 255)
        invalid("pixel tolerance must be within [0, 255]");
    if (cfg.analysis_size.width < 0 || cfg.analysis_size.height < 0)
        invalid("analysis size must not be negative");
    if ((cfg.analysis_size.width == 0) != (cfg.analysis_size.height == 0))
        invalid("analysis size needs both width and height, or neither");
    if (cfg.sample_stride < 1) invalid("sample stride must be >= 1");
    if (cfg.min_scene_gap.count() < 0) invalid("minimum scene gap must not be negative");
    if (cfg.jpeg_quality < 0 || cfg.jpeg_quality > 100) invalid("jpeg quality must be within [0, 100]");
}

void validate_config(const RunConfig& cfg) {
    validate_config(cfg.detector);
    if (cfg.video_path.empty()) invalid("video path is empty");
    if (cfg.caption_path.empty()) invalid("caption path is empty");
    if (cfg.output_dir.empty()) invalid("output directory is empty");
    if (!is_plain_relative(cfg.document_name) ||
        std::filesystem::path(cfg.document_name).has_parent_path())
        invalid("document name must be a plain file name");
    if (!is_plain_relative(cfg.frames_subdir))
        invalid("frames subdirectory must be a relative path inside the output directory");
}
}
