#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace sbp {
enum class ErrorKind {
    InputNotFound,
    ParseError,
    VideoReadError,
    WriteError,
    InvalidArgument,
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

enum class WarningKind { FrameDecode, Cleanup };

const char* to_string(WarningKind kind);

// Recoverable condition; collected by the run and never fatal.
struct Warning {
    WarningKind kind{WarningKind::FrameDecode};
    int64_t frame_index{-1};
    std::string message;
};
}
