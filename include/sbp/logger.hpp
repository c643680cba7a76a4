#pragma once
#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>

namespace sbp {
enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

class Logger {
public:
    static void set_level(LogLevel level) { level_.store(static_cast<int>(level)); }
    static LogLevel level() { return static_cast<LogLevel>(level_.load()); }
    static bool enabled(LogLevel l) { return static_cast<int>(l) <= level_.load(); }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) {
        write(LogLevel::Debug, stdout, "[D] ", fmt, args...);
    }

    template <typename... Args>
    static void info(const char* fmt, Args... args) {
        write(LogLevel::Info, stdout, "[I] ", fmt, args...);
    }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) {
        write(LogLevel::Warn, stderr, "[W] ", fmt, args...);
    }

    template <typename... Args>
    static void error(const char* fmt, Args... args) {
        write(LogLevel::Error, stderr, "[E] ", fmt, args...);
    }

private:
    template <typename... Args>
    static void write(LogLevel l, FILE* out, const char* tag, const char* fmt, Args... args) {
        if (!enabled(l)) return;
        std::lock_guard<std::mutex> lk(mu_);
        std::fprintf(out, (std::string(tag) + fmt + "\n").c_str(), args...);
        std::fflush(out);
    }

    static inline std::mutex mu_{};
    static inline std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
};
}
