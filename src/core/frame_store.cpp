#include "core/frame_store.h"
#include <chrono>

void FrameStore::setFrame(cv::Mat&& frame, long long ts_ms) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) return;
        if (has_frame_) ++dropped_;
        last_ = std::move(frame);
        last_ts_ms_ = ts_ms;
        has_frame_ = true;
    }
    cv_.notify_one();
}

bool FrameStore::waitFrame(cv::Mat& out, long long& ts_ms, int timeout_ms) {
    std::unique_lock<std::mutex> lk(m_);

    if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                      [&] { return has_frame_ || stop_; })) {
        return false;
    }
    if (stop_) return false;

    // Кадр забираем целиком: appsink создаёт новый буфер на каждый sample.
    out = std::move(last_);
    last_ = cv::Mat();
    ts_ms = last_ts_ms_;
    has_frame_ = false;
    return !out.empty();
}

void FrameStore::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
}

void FrameStore::reset() {
    std::lock_guard<std::mutex> lk(m_);
    last_.release();
    has_frame_ = false;
    stop_ = false;
}

uint64_t FrameStore::dropped() const {
    std::lock_guard<std::mutex> lk(m_);
    return dropped_;
}

bool FrameStore::isStopped() const {
    std::lock_guard<std::mutex> lk(m_);
    return stop_;
}
