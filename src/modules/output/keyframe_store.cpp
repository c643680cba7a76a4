#include "sbp/keyframe_store.hpp"
#include "sbp/error.hpp"
#include <opencv2/imgcodecs.hpp>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sbp {
KeyframeStore::KeyframeStore(fs::path root, std::string subdir, int jpeg_quality)
    : dir_(std::move(root) / subdir), subdir_(fs::path(subdir).generic_string()), quality_(jpeg_quality) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) throw Error(ErrorKind::WriteError, "cannot create " + dir_.string() + ": " + ec.message());
}

std::string KeyframeStore::file_name(int index) {
    char buf[32];
    std::snprintf(buf, sizeof buf, "frame_%04d.jpg", index);
    return buf;
}

std::string KeyframeStore::save(int index, const cv::Mat& bgr) {
    const std::string name = file_name(index);
    const fs::path dst = dir_ / name;
    if (fs::exists(dst)) throw Error(ErrorKind::WriteError, "keyframe already exists: " + dst.string());

    // Encoded up front, written in one go.
    std::vector<uchar> buf;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, quality_};
    bool encoded = false;
    try {
        encoded = !bgr.empty() && cv::imencode(".jpg", bgr, buf, params);
    } catch (const cv::Exception& e) {
        throw Error(ErrorKind::WriteError, "jpeg encoding failed for " + name + ": " + e.what());
    }
    if (!encoded) throw Error(ErrorKind::WriteError, "jpeg encoding failed for " + name);

    std::ofstream out(dst, std::ios::binary);
    if (!out.is_open()) throw Error(ErrorKind::WriteError, "cannot open " + dst.string());
    out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (!out.good()) throw Error(ErrorKind::WriteError, "short write to " + dst.string());
    return subdir_ + "/" + name;
}
}
