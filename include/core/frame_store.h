#pragma once
#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>

// Хранит только последний кадр: если потребитель не успел забрать
// предыдущий, он перезаписывается (счётчик dropped()).
class FrameStore {
public:
    FrameStore() = default;

    void setFrame(cv::Mat&& frame, long long ts_ms);   // используется appsink callback
    bool waitFrame(cv::Mat& out, long long& ts_ms, int timeout_ms);

    void stop();
    // Очищает кадр и снимает stop() перед повторным открытием источника.
    void reset();

    uint64_t dropped() const;
    bool isStopped() const;

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    cv::Mat last_;
    long long last_ts_ms_ = 0;
    bool has_frame_ = false;
    bool stop_ = false;
    uint64_t dropped_ = 0;
};
