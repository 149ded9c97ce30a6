#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/errors.h"
#include "detect/detector.h"
#include "io/frame_source.h"
#include "notify/notifier.h"

// Шаг сценария FakeFrameSource.
struct SourceStep {
    enum class Kind { Frame, Timeout, Silence, Transient, Fatal, Eos, Crash };
    Kind kind = Kind::Frame;
    long long ts_ms = 0;   // - для Silence: длительность паузы (мс).

    static SourceStep frame(long long ts) { return SourceStep{Kind::Frame, ts}; }
    static SourceStep timeout() { return SourceStep{Kind::Timeout, 0}; }
    // Источник молчит ms миллисекунд, затем отвечает Timeout.
    static SourceStep silence(int ms) { return SourceStep{Kind::Silence, ms}; }
    static SourceStep transient() { return SourceStep{Kind::Transient, 0}; }
    static SourceStep fatal() { return SourceStep{Kind::Fatal, 0}; }
    static SourceStep eos() { return SourceStep{Kind::Eos, 0}; }
    static SourceStep crash() { return SourceStep{Kind::Crash, 0}; }
};

// Счётчики живут отдельно от источника: воркер владеет источником.
struct SourceCounters {
    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<int> reads{0};
};

// Проигрывает сценарий; после его окончания отвечает Timeout (с ожиданием)
// или EndOfStream.
class FakeFrameSource : public FrameSource {
public:
    FakeFrameSource(std::vector<SourceStep> steps, std::shared_ptr<SourceCounters> counters,
                    bool eos_when_done = true)
            : steps_(steps.begin(), steps.end()),
              counters_(std::move(counters)),
              eos_when_done_(eos_when_done) {}

    // Первые n вызовов open() бросают transient-ошибку, fatal - фатальную.
    void fail_opens(int n) { failing_opens_ = n; }
    void fatal_open() { fatal_open_ = true; }

    void open() override {
        counters_->opens++;
        if (fatal_open_) throw AcquisitionError("no such camera", true);
        if (failing_opens_ > 0) {
            failing_opens_--;
            throw AcquisitionError("connection refused", false);
        }
    }

    ReadStatus read(Frame& out, int timeout_ms) override {
        counters_->reads++;
        if (steps_.empty()) {
            if (eos_when_done_) return ReadStatus::EndOfStream;
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return ReadStatus::Timeout;
        }
        const SourceStep step = steps_.front();
        steps_.pop_front();
        switch (step.kind) {
            case SourceStep::Kind::Frame:
                out.image = cv::Mat(120, 160, CV_8UC3, cv::Scalar(40, 40, 40));
                out.ts_ms = step.ts_ms;
                return ReadStatus::Ok;
            case SourceStep::Kind::Timeout:
                return ReadStatus::Timeout;
            case SourceStep::Kind::Silence:
                std::this_thread::sleep_for(std::chrono::milliseconds(step.ts_ms));
                return ReadStatus::Timeout;
            case SourceStep::Kind::Transient:
                throw AcquisitionError("connection lost", false);
            case SourceStep::Kind::Fatal:
                throw AcquisitionError("decoder missing", true);
            case SourceStep::Kind::Eos:
                return ReadStatus::EndOfStream;
            case SourceStep::Kind::Crash:
                throw std::runtime_error("unexpected failure");
        }
        return ReadStatus::Timeout;
    }

    void close() override { counters_->closes++; }

    std::string describe() const override { return "fake://"; }

private:
    std::deque<SourceStep> steps_;
    std::shared_ptr<SourceCounters> counters_;
    bool eos_when_done_;
    int failing_opens_ = 0;
    bool fatal_open_ = false;
};

// read() блокируется, пока тест не отпустит источник (игнорирует timeout).
class HangingFrameSource : public FrameSource {
public:
    explicit HangingFrameSource(std::shared_ptr<std::atomic<bool>> release)
            : release_(std::move(release)) {}

    void open() override {}
    ReadStatus read(Frame&, int) override {
        while (!release_->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return ReadStatus::EndOfStream;
    }
    void close() override {}
    std::string describe() const override { return "hang://"; }

private:
    std::shared_ptr<std::atomic<bool>> release_;
};

// Детектор по функции от номера вызова (с 0). Функция может бросить DetectionError.
class FakeDetector : public Detector {
public:
    using Script = std::function<std::vector<Detection>(int call)>;

    explicit FakeDetector(Script script) : script_(std::move(script)) {}

    std::vector<Detection> detect(const cv::Mat&, const std::set<std::string>&, float) override {
        const int call = calls_++;
        return script_(call);
    }

    std::string name() const override { return "fake"; }
    int calls() const { return calls_.load(); }

private:
    Script script_;
    std::atomic<int> calls_{0};
};

inline Detection make_detection(float x, float y, float w, float h,
                                const std::string& label = "person", float conf = 0.9f) {
    Detection d;
    d.box = cv::Rect2f(x, y, w, h);
    d.label = label;
    d.confidence = conf;
    return d;
}

class RecordingNotifier : public Notifier {
public:
    bool notify(const AlertEvent& event) override {
        std::lock_guard<std::mutex> lk(m_);
        events_.push_back(event);
        if (throw_on_notify_) throw NotificationError("smtp unreachable");
        return accept_;
    }

    std::vector<AlertEvent> events() const {
        std::lock_guard<std::mutex> lk(m_);
        return events_;
    }

    void set_accept(bool accept) { accept_ = accept; }
    void set_throw(bool t) { throw_on_notify_ = t; }

private:
    mutable std::mutex m_;
    std::vector<AlertEvent> events_;
    bool accept_ = true;
    bool throw_on_notify_ = false;
};

// Ждёт условие не дольше timeout_ms.
inline bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
