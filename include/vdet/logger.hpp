#pragma once
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace vdet {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

class Logger {
public:
    template <typename... Args>
    static void debug(const char* fmt, Args... args) { write(LogLevel::Debug, "[D] ", stdout, fmt, args...); }

    template <typename... Args>
    static void info(const char* fmt, Args... args) { write(LogLevel::Info, "[I] ", stdout, fmt, args...); }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) { write(LogLevel::Warn, "[W] ", stdout, fmt, args...); }

    template <typename... Args>
    static void error(const char* fmt, Args... args) { write(LogLevel::Error, "[E] ", stderr, fmt, args...); }

    static void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lk(mu_);
        level_ = level;
        level_set_ = true;
    }

    static LogLevel level() {
        std::lock_guard<std::mutex> lk(mu_);
        return levelLocked();
    }

    // Names the calling thread in every subsequent line it logs.
    static void setThreadName(const std::string& name) {
        std::lock_guard<std::mutex> lk(mu_);
        names_[std::this_thread::get_id()] = name;
    }

    static void clearThreadName() {
        std::lock_guard<std::mutex> lk(mu_);
        names_.erase(std::this_thread::get_id());
    }

    static std::string threadName() {
        std::lock_guard<std::mutex> lk(mu_);
        return threadNameLocked();
    }

private:
    template <typename... Args>
    static void write(LogLevel lvl, const char* tag, FILE* out, const char* fmt, Args... args) {
        std::lock_guard<std::mutex> lk(mu_);
        if (static_cast<int>(lvl) > static_cast<int>(levelLocked())) return;

        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&tt, &tm);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

        std::string thread = threadNameLocked();

        std::fprintf(out, "%s.%03d %s[%s] ", stamp, static_cast<int>(ms), tag, thread.c_str());
        std::fprintf(out, (std::string(fmt) + "\n").c_str(), args...);
        std::fflush(out);
    }

    static std::string threadNameLocked() {
        auto it = names_.find(std::this_thread::get_id());
        return it != names_.end() ? it->second : "main";
    }

    static LogLevel levelLocked() {
        if (!level_set_) {
            level_ = parseEnv();
            level_set_ = true;
        }
        return level_;
    }

    static LogLevel parseEnv() {
        const char* v = std::getenv("VDET_LOG_LEVEL");
        if (!v) return LogLevel::Info;
        std::string s(v);
        if (s == "error") return LogLevel::Error;
        if (s == "warn" || s == "warning") return LogLevel::Warn;
        if (s == "debug") return LogLevel::Debug;
        return LogLevel::Info;
    }

    static inline std::mutex mu_{};
    static inline LogLevel level_{LogLevel::Info};
    static inline bool level_set_{false};
    static inline std::unordered_map<std::thread::id, std::string> names_{};
};

// Names the calling thread for the lifetime of the scope.
class ScopedThreadName {
public:
    explicit ScopedThreadName(const std::string& name) { Logger::setThreadName(name); }
    ~ScopedThreadName() { Logger::clearThreadName(); }
    ScopedThreadName(const ScopedThreadName&) = delete;
    ScopedThreadName& operator=(const ScopedThreadName&) = delete;
};
}  // namespace vdet
