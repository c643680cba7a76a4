#pragma once
#include <filesystem>
#include <string>

namespace sbp {
/**
 * Sibling directory that collects a run's output before it becomes visible.
 *
 * For output "/x/out" the staging area is "/x/.out.staging". publish() swaps it
 * into place, replacing any previous "/x/out" in full. An area that was never
 * published is deleted on destruction.
 */
class StagingArea {
public:
    // Throws Error(InvalidArgument) for the working directory or a root,
    // Error(WriteError) if the staging directory cannot be created.
    explicit StagingArea(const std::filesystem::path& output_dir);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::filesystem::path& root() const { return staging_; }
    const std::filesystem::path& target() const { return target_; }
    bool published() const { return published_; }
    // Set when the replaced output could not be removed after a successful publish.
    const std::filesystem::path& leftover() const { return leftover_; }

    // Throws Error(WriteError); the previous output is restored on failure.
    void publish();

    static std::filesystem::path normalize(const std::filesystem::path& output_dir);

private:
    std::filesystem::path target_;
    std::filesystem::path staging_;
    std::filesystem::path previous_;
    std::filesystem::path leftover_;
    bool published_{false};
};

// Throws Error(InvalidArgument) if `input` is `output_dir` or lies inside it.
void require_outside(const std::filesystem::path& output_dir, const std::filesystem::path& input);

/**
 * An existing output directory is replaced in full on publish, so it may only
 * hold what a previous run wrote: the document, the directories leading to the
 * frames subdirectory and frame_NNNN.jpg files inside it. Anything else throws
 * Error(InvalidArgument). A missing directory passes.
 */
void require_replaceable(const std::filesystem::path& output_dir, const std::string& document_name,
                         const std::filesystem::path& frames_subdir);
}
