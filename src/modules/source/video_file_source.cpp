#include "vdet/frame_source.hpp"

#include <cmath>

#include "vdet/errors.hpp"
#include "vdet/logger.hpp"

namespace vdet {

VideoFileSource::VideoFileSource(const std::string& path) : path_(path) {
    if (!cap_.open(path)) throw SourceUnavailable("cannot open " + path);
    frame_count_ = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_COUNT));
    fps_ = cap_.get(cv::CAP_PROP_FPS);
    if (!(fps_ > 0.0 && std::isfinite(fps_))) fps_ = 30.0;
    if (frame_count_ <= 0) throw SourceUnavailable("no frames in " + path);
    Logger::info("opened %s: %d frames @ %.2f fps", path.c_str(), frame_count_, fps_);
}

cv::Mat VideoFileSource::getFrame(int index) {
    if (index < 0 || index >= frame_count_) throw FrameReadError(index, "out of range");

    std::lock_guard<std::mutex> lk(mu_);
    // seek only when the request is not the next frame in decode order
    if (index != next_pos_) {
        if (!cap_.set(cv::CAP_PROP_POS_FRAMES, index)) throw FrameReadError(index, "seek failed in " + path_);
    }
    cv::Mat img;
    if (!cap_.read(img) || img.empty()) {
        next_pos_ = -1;
        throw FrameReadError(index, "decode failed in " + path_);
    }
    next_pos_ = index + 1;
    return img;
}

SourceHandle SourceHandle::file(const std::string& path) {
    return SourceHandle{path, [path]() -> std::unique_ptr<IFrameSource> {
        return std::make_unique<VideoFileSource>(path);
    }};
}

}  // namespace vdet
