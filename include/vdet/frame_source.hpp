#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace vdet {

// Random-access view of a decoded video.
class IFrameSource {
public:
    virtual ~IFrameSource() = default;
    virtual int frameCount() const = 0;
    virtual double fps() const = 0;
    // Throws FrameReadError when the frame cannot be decoded.
    virtual cv::Mat getFrame(int index) = 0;
};

class VideoFileSource final : public IFrameSource {
public:
    // Throws SourceUnavailable when the file cannot be opened.
    explicit VideoFileSource(const std::string& path);

    int frameCount() const override { return frame_count_; }
    double fps() const override { return fps_; }
    cv::Mat getFrame(int index) override;

private:
    std::string path_;
    cv::VideoCapture cap_;
    std::mutex mu_;
    int frame_count_ = 0;
    double fps_ = 0.0;
    int next_pos_ = 0;
};

using SourceOpener = std::function<std::unique_ptr<IFrameSource>()>;

// What a job is submitted against: a dedup key plus a deferred opener, so that
// an unopenable source surfaces inside the job rather than at submission.
struct SourceHandle {
    std::string key;
    SourceOpener open;

    static SourceHandle file(const std::string& path);
};

}  // namespace vdet
