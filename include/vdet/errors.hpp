#pragma once
#include <stdexcept>
#include <string>

namespace vdet {

enum class ErrorKind {
    Config,
    FrameRead,
    InferenceTimeout,
    Inference,
    JobTimeout,
    SourceUnavailable,
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Config: return "ConfigError";
        case ErrorKind::FrameRead: return "FrameReadError";
        case ErrorKind::InferenceTimeout: return "InferenceTimeout";
        case ErrorKind::Inference: return "InferenceError";
        case ErrorKind::JobTimeout: return "JobTimeout";
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
    }
    return "UnknownError";
}

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Invalid submission parameters; raised before a job is created.
struct ConfigError : Error {
    explicit ConfigError(const std::string& msg) : Error(ErrorKind::Config, msg) {}
};

struct FrameReadError : Error {
    FrameReadError(int index, const std::string& msg)
        : Error(ErrorKind::FrameRead, "frame " + std::to_string(index) + ": " + msg), index_(index) {}
    int index() const noexcept { return index_; }

private:
    int index_;
};

struct InferenceTimeout : Error {
    explicit InferenceTimeout(const std::string& msg) : Error(ErrorKind::InferenceTimeout, msg) {}
};

struct InferenceError : Error {
    explicit InferenceError(const std::string& msg) : Error(ErrorKind::Inference, msg) {}
};

struct JobTimeout : Error {
    explicit JobTimeout(const std::string& msg) : Error(ErrorKind::JobTimeout, msg) {}
};

// The video cannot be opened at all; the only job-level failure.
struct SourceUnavailable : Error {
    explicit SourceUnavailable(const std::string& msg) : Error(ErrorKind::SourceUnavailable, msg) {}
};

}  // namespace vdet
