#include "sbp/publish.hpp"
#include "sbp/error.hpp"
#include <cctype>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace sbp {
namespace {
[[noreturn]] void write_error(const std::string& what, const fs::path& p, const std::error_code& ec) {
    throw Error(ErrorKind::WriteError, what + " " + p.string() + ": " + ec.message());
}

bool inside(const fs::path& dir, const fs::path& p) {
    const fs::path rel = p.lexically_relative(dir);
    return !rel.empty() && *rel.begin() != "..";
}

// frame_ followed by at least four digits and .jpg
bool is_frame_name(const std::string& name) {
    const std::string prefix = "frame_", suffix = ".jpg";
    if (name.size() < prefix.size() + 4 + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    for (std::size_t i = prefix.size(); i < name.size() - suffix.size(); ++i)
        if (!std::isdigit(static_cast<unsigned char>(name[i]))) return false;
    return true;
}
}

fs::path StagingArea::normalize(const fs::path& output_dir) {
    std::error_code ec;
    fs::path abs = fs::absolute(output_dir, ec);
    if (ec) write_error("cannot resolve", output_dir, ec);
    abs = abs.lexically_normal();
    if (abs.filename().empty()) abs = abs.parent_path();  // "out/" or "."
    return abs;
}

StagingArea::StagingArea(const fs::path& output_dir) {
    target_ = normalize(output_dir);
    if (target_ == target_.root_path() || target_.filename().empty())
        throw Error(ErrorKind::InvalidArgument, "output directory cannot be a filesystem root");

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec) write_error("cannot resolve", ".", ec);
    if (inside(target_, cwd.lexically_normal()))
        throw Error(ErrorKind::InvalidArgument,
                    "output directory " + target_.string() + " contains the working directory");

    const std::string name = target_.filename().string();
    staging_ = target_.parent_path() / ("." + name + ".staging");
    previous_ = target_.parent_path() / ("." + name + ".previous");

    fs::create_directories(target_.parent_path(), ec);
    if (ec) write_error("cannot create", target_.parent_path(), ec);
    if (fs::exists(target_, ec) && !fs::is_directory(target_, ec))
        throw Error(ErrorKind::WriteError, target_.string() + " exists and is not a directory");

    fs::remove_all(staging_, ec);
    if (ec) write_error("cannot clear", staging_, ec);
    fs::create_directory(staging_, ec);
    if (ec) write_error("cannot create", staging_, ec);
}

StagingArea::~StagingArea() {
    if (published_) return;
    std::error_code ec;
    fs::remove_all(staging_, ec);  // nothing to report to from a destructor
}

void StagingArea::publish() {
    if (published_) return;
    std::error_code ec;
    fs::remove_all(previous_, ec);
    if (ec) write_error("cannot clear", previous_, ec);

    const bool had_previous = fs::exists(target_, ec);
    if (had_previous) {
        fs::rename(target_, previous_, ec);
        if (ec) write_error("cannot move aside", target_, ec);
    }

    fs::rename(staging_, target_, ec);
    if (ec) {
        std::string msg = "cannot publish " + target_.string() + ": " + ec.message();
        if (had_previous) {
            std::error_code restore_ec;
            fs::rename(previous_, target_, restore_ec);
            if (restore_ec) msg += "; previous output left at " + previous_.string();
        }
        throw Error(ErrorKind::WriteError, msg);
    }
    published_ = true;

    fs::remove_all(previous_, ec);
    if (ec) leftover_ = previous_;
}

void require_outside(const fs::path& output_dir, const fs::path& input) {
    const fs::path target = StagingArea::normalize(output_dir);
    if (inside(target, StagingArea::normalize(input)))
        throw Error(ErrorKind::InvalidArgument,
                    "output directory " + target.string() + " holds the input " + input.string());
}

void require_replaceable(const fs::path& output_dir, const std::string& document_name,
                         const fs::path& frames_subdir) {
    const fs::path target = StagingArea::normalize(output_dir);
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(target, ec))) return;

    fs::path frames = frames_subdir.lexically_normal();
    if (frames.filename().empty()) frames = frames.parent_path();
    fs::recursive_directory_iterator it(target, ec), end;
    if (ec) write_error("cannot list", target, ec);
    for (; it != end; it.increment(ec)) {
        const fs::path rel = it->path().lexically_relative(target);
        const fs::file_status st = it->symlink_status(ec);
        if (ec) write_error("cannot inspect", it->path(), ec);

        bool owned = false;
        if (fs::is_regular_file(st))
            owned = rel == fs::path(document_name) ||
                    (rel.parent_path() == frames && is_frame_name(rel.filename().string()));
        else if (fs::is_directory(st))
            owned = rel == frames || inside(rel, frames);
        if (!owned)
            throw Error(ErrorKind::InvalidArgument, "output directory " + target.string() +
                                                        " holds files this run would delete: " +
                                                        rel.generic_string());
    }
    if (ec) write_error("cannot list", target, ec);
}
}
