#pragma once
#include <opencv2/core.hpp>
#include <filesystem>
#include <string>

namespace sbp {
// Writes keyframes as JPEG under <root>/<subdir> and hands back document-relative paths.
class KeyframeStore {
public:
    KeyframeStore(std::filesystem::path root, std::string subdir, int jpeg_quality = 95);

    // "frame_0003.jpg" for index 3.
    static std::string file_name(int index);

    // Throws Error(WriteError) if the file exists already or the encoder fails.
    std::string save(int index, const cv::Mat& bgr);

    const std::filesystem::path& directory() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::string subdir_;
    int quality_;
};
}
