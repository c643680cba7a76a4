#include <string>
#include <vector>
#include "sbp/cli.hpp"
#include "sbp/logger.hpp"
#include "sbp/metrics.hpp"
#include "sbp/pipeline.hpp"

using namespace sbp;

namespace {
int exit_code(ErrorKind k) {
    switch (k) {
    case ErrorKind::InputNotFound: return 3;
    case ErrorKind::ParseError: return 4;
    case ErrorKind::VideoReadError: return 5;
    case ErrorKind::WriteError: return 6;
    case ErrorKind::InvalidArgument: return 7;
    }
    return 1;
}
}

int main(int argc, char** argv) {
    RunConfig cfg;
    cfg.output_dir = "storyboard";
    std::string metrics_path;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        bool ok = true;
        if (arg == "-h" || arg == "--help") { Logger::info("%s", usage_text()); return 0; }
        else if (arg == "--output-dir" && has_value) cfg.output_dir = argv[++i];
        else if (arg == "--threshold" && has_value) ok = parse_double(argv[++i], cfg.detector.threshold);
        else if (arg == "--tolerance" && has_value) ok = parse_int(argv[++i], cfg.detector.pixel_tolerance);
        else if (arg == "--stride" && has_value) ok = parse_int(argv[++i], cfg.detector.sample_stride);
        else if (arg == "--min-gap" && has_value) ok = parse_seconds(argv[++i], cfg.detector.min_scene_gap);
        else if (arg == "--title" && has_value) cfg.title = argv[++i];
        else if (arg == "--metrics" && has_value) metrics_path = argv[++i];
        else if (arg == "--log-level" && has_value) {
            LogLevel lvl;
            ok = parse_level(argv[++i], lvl);
            if (ok) Logger::set_level(lvl);
        }
        else if (!arg.empty() && arg[0] == '-') { Logger::error("unknown option %s", arg.c_str()); Logger::error("%s", usage_text()); return 2; }
        else positional.push_back(arg);

        if (!ok) { Logger::error("bad value for %s: %s", arg.c_str(), argv[i]); return 2; }
    }
    if (positional.size() != 2) { Logger::error("%s", usage_text()); return 2; }
    cfg.video_path = positional[0];
    cfg.caption_path = positional[1];

    Logger::info("processing %s with %s", cfg.video_path.string().c_str(), cfg.caption_path.string().c_str());
    Logger::debug("threshold=%.4f tolerance=%d stride=%d output=%s", cfg.detector.threshold,
                  cfg.detector.pixel_tolerance, cfg.detector.sample_stride, cfg.output_dir.string().c_str());

    Metrics metrics;
    RunResult res = run_storyboard(cfg, default_pipeline(), &metrics);

    for (auto& w : res.warnings) Logger::warn("%s: %s", to_string(w.kind), w.message.c_str());
    if (!metrics_path.empty()) {
        if (metrics.dump_csv(metrics_path)) Logger::info("stage timings saved to %s", metrics_path.c_str());
        else Logger::warn("cannot write stage timings to %s", metrics_path.c_str());
    }

    if (!res.ok) {
        Logger::error("%s: %s", to_string(*res.error), res.message.c_str());
        return exit_code(*res.error);
    }
    Logger::info("%zu cues, %zu scenes from %lld frames (detect %.1f ms)", res.cue_count, res.scene_count,
                 static_cast<long long>(res.frames_seen), metrics.stage_ms("detect"));
    Logger::info("done. open %s to view the storyboard", res.document_path.string().c_str());
    return 0;
}
