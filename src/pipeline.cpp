#include "sbp/pipeline.hpp"
#include "sbp/aligner.hpp"
#include "sbp/keyframe_store.hpp"
#include "sbp/publish.hpp"
#include "sbp/renderer.hpp"
#include "sbp/scene_detector.hpp"
#include "sbp/tracer.hpp"
#include "sbp/video_source.hpp"
#include <opencv2/core.hpp>
#include <fstream>
#include <memory>
#include <system_error>

namespace fs = std::filesystem;

namespace sbp {
Pipeline default_pipeline() {
    Pipeline pl;
    pl.load_captions = [](const fs::path& p) { return load_captions(p); };
    pl.open_video = [](const fs::path& p) -> FrameSource {
        auto src = std::make_shared<VideoSource>(p);
        return [src](Frame& f) { return src->read(f); };
    };
    return pl;
}

namespace {
void require_input(const fs::path& p, const std::string& what) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        throw Error(ErrorKind::InputNotFound, what + " not found: " + p.string());
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) throw Error(ErrorKind::InputNotFound, what + " not readable: " + p.string());
}

RunResult failed(RunResult res, ErrorKind kind, const std::string& msg) {
    res.ok = false;
    res.error = kind;
    res.message = msg;
    res.document_path.clear();
    return res;
}
}

RunResult run_storyboard(const RunConfig& cfg, const Pipeline& pl, Metrics* metrics) {
    RunResult res;
    // Kind reported for OpenCV and other std exceptions escaping the stage in progress.
    ErrorKind stage_kind = ErrorKind::InvalidArgument;
    try {
        {
            SBP_TRACE_STAGE(metrics, "validate");
            validate_config(cfg);
            if (!pl.load_captions || !pl.open_video)
                throw Error(ErrorKind::InvalidArgument, "pipeline stage missing");
            require_input(cfg.video_path, "video");
            require_input(cfg.caption_path, "captions");
            require_outside(cfg.output_dir, cfg.video_path);
            require_outside(cfg.output_dir, cfg.caption_path);
            require_replaceable(cfg.output_dir, cfg.document_name, cfg.frames_subdir);
        }

        stage_kind = ErrorKind::ParseError;
        std::vector<Cue> cues;
        {
            ScopeStamp stamp(metrics, "captions");
            cues = pl.load_captions(cfg.caption_path);
            stamp.items = cues.size();
        }
        res.cue_count = cues.size();

        stage_kind = ErrorKind::WriteError;
        StagingArea staging(cfg.output_dir);
        KeyframeStore store(staging.root(), cfg.frames_subdir, cfg.detector.jpeg_quality);

        stage_kind = ErrorKind::VideoReadError;
        std::vector<Scene> scenes;
        {
            ScopeStamp stamp(metrics, "detect");
            FrameSource source = pl.open_video(cfg.video_path);
            DetectionStats stats;
            scenes = detect_scenes(source, cfg.detector, store, res.warnings, &stats);
            res.frames_seen = stats.frames_seen;
            stamp.items = static_cast<std::size_t>(stats.frames_seen);
        }
        res.scene_count = scenes.size();

        std::vector<SceneRecord> records;
        {
            ScopeStamp stamp(metrics, "align");
            records = align(scenes, cues);
            stamp.items = records.size();
        }

        stage_kind = ErrorKind::WriteError;
        {
            SBP_TRACE_STAGE(metrics, "render");
            RenderOptions opt;
            opt.title = cfg.title;
            write_document(staging.root(), cfg.document_name, render_html(records, opt));
        }
        {
            SBP_TRACE_STAGE(metrics, "publish");
            staging.publish();
        }
        if (!staging.leftover().empty()) {
            res.warnings.push_back({WarningKind::Cleanup, -1,
                                    "replaced output left behind at " + staging.leftover().string()});
        }
        res.document_path = staging.target() / cfg.document_name;
        res.ok = true;
        return res;
    } catch (const Error& e) {
        return failed(std::move(res), e.kind(), e.what());
    } catch (const cv::Exception& e) {
        return failed(std::move(res), stage_kind, std::string("opencv: ") + e.what());
    } catch (const fs::filesystem_error& e) {
        return failed(std::move(res), ErrorKind::WriteError, e.what());
    } catch (const std::exception& e) {
        return failed(std::move(res), stage_kind, e.what());
    }
}
}
