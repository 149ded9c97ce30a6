#include "pipeline/camera_worker.h"
#include "core/errors.h"
#include "util/time_util.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <sstream>

long long backoff_ms(int initial_ms, int max_ms, int n) {
    long long delay = std::max(0, initial_ms);
    for (int i = 0; i < n && delay < max_ms; ++i) {
        delay *= 2;
    }
    return std::min<long long>(delay, max_ms);
}

const char* worker_state_name(WorkerState s) {
    switch (s) {
        case WorkerState::Starting: return "starting";
        case WorkerState::Running: return "running";
        case WorkerState::Reconnecting: return "reconnecting";
        case WorkerState::Stopped: return "stopped";
    }
    return "?";
}

const char* exit_reason_name(ExitReason r) {
    switch (r) {
        case ExitReason::None: return "none";
        case ExitReason::Requested: return "requested";
        case ExitReason::EndOfStream: return "eos";
        case ExitReason::Fatal: return "fatal";
        case ExitReason::Crashed: return "crashed";
    }
    return "?";
}

CameraWorker::CameraWorker(const Config& cfg,
                           std::unique_ptr<FrameSource> source,
                           std::shared_ptr<Detector> detector,
                           Outputs outputs)
        : cfg_(cfg),
          source_(std::move(source)),
          detector_(std::move(detector)),
          out_(std::move(outputs)),
          motion_(cfg.motion, cfg.name),
          tracker_(cfg.tracking, cfg.name),
          linger_(cfg.linger, cfg.name),
          alerts_(cfg.alerting, cfg.name) {
    if (!source_) throw ConfigError("camera '" + cfg_.name + "': no frame source");
    if (!detector_) throw ConfigError("camera '" + cfg_.name + "': no detector");
}

CameraWorker::~CameraWorker() {
    request_stop();
    if (th_.joinable()) {
        // Последняя ссылка могла уйти вместе с потоком самого воркера.
        if (th_.get_id() == std::this_thread::get_id()) {
            th_.detach();
        } else {
            th_.join();
        }
    }
}

void CameraWorker::start() {
    if (started_.exchange(true)) return;
    auto self = shared_from_this();
    th_ = std::thread([self] { self->threadMain(); });
}

void CameraWorker::request_stop() {
    {
        std::lock_guard<std::mutex> lk(wait_m_);
        stop_.store(true);
    }
    wait_cv_.notify_all();
}

bool CameraWorker::join_for(int timeout_ms) {
    if (!th_.joinable()) return finished_.load();

    std::unique_lock<std::mutex> lk(wait_m_);
    const auto done = [&] { return finished_.load(); };
    if (timeout_ms < 0) {
        wait_cv_.wait(lk, done);
    } else if (!wait_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), done)) {
        return false;
    }
    lk.unlock();
    th_.join();
    return true;
}

void CameraWorker::abandon() {
    request_stop();
    if (th_.joinable()) th_.detach();
}

WorkerStats CameraWorker::stats() const {
    WorkerStats s;
    s.frames = frames_.load();
    s.detections = detections_.load();
    s.detection_errors = detection_errors_.load();
    s.alerts = alerts_count_.load();
    s.reconnects = reconnects_.load();
    return s;
}

bool CameraWorker::waitStop(int ms) {
    std::unique_lock<std::mutex> lk(wait_m_);
    return wait_cv_.wait_for(lk, std::chrono::milliseconds(std::max(0, ms)),
                             [&] { return stop_.load(); });
}

void CameraWorker::threadMain() {
    if (cfg_.verbose) {
        std::cout << "[CAM:" << cfg_.name << "] worker started: " << source_->describe() << std::endl;
    }

    try {
        runLoop();
    } catch (const std::exception& e) {
        exit_reason_.store(ExitReason::Crashed);
        std::cerr << "[CAM:" << cfg_.name << "] worker crashed: " << e.what() << std::endl;
    }
    source_->close();

    if (exit_reason_.load() == ExitReason::None) {
        exit_reason_.store(ExitReason::Requested);
    }
    state_.store(WorkerState::Stopped);

    std::cout << "[CAM:" << cfg_.name << "] stopped (" << exit_reason_name(exit_reason_.load())
              << ") frames=" << frames_.load()
              << " detections=" << detections_.load()
              << " alerts=" << alerts_count_.load()
              << " reconnects=" << reconnects_.load() << std::endl;

    {
        std::lock_guard<std::mutex> lk(wait_m_);
        finished_.store(true);
    }
    wait_cv_.notify_all();
}

void CameraWorker::runLoop() {
    state_.store(WorkerState::Starting);
    if (!connect(true)) return;

    while (!stopRequested()) {
        Frame frame;
        ReadStatus st;
        try {
            st = source_->read(frame, cfg_.read_timeout_ms);
        } catch (const AcquisitionError& e) {
            if (e.fatal()) {
                std::cerr << "[CAM:" << cfg_.name << "] fatal source error: " << e.what() << std::endl;
                exit_reason_.store(ExitReason::Fatal);
                return;
            }
            std::cerr << "[CAM:" << cfg_.name << "] source error: " << e.what() << std::endl;
            if (!connect(false)) return;
            continue;
        }

        if (st == ReadStatus::EndOfStream) {
            std::cout << "[CAM:" << cfg_.name << "] end of stream" << std::endl;
            exit_reason_.store(ExitReason::EndOfStream);
            return;
        }
        if (st == ReadStatus::Timeout) {
            // Watchdog: источник жив, но кадров нет.
            if (now_steady_ms() - last_frame_ms_ > cfg_.no_frame_timeout_ms) {
                std::cerr << "[CAM:" << cfg_.name << "] no frames for "
                          << cfg_.no_frame_timeout_ms << " ms" << std::endl;
                if (!connect(false)) return;
            }
            continue;
        }

        last_frame_ms_ = now_steady_ms();
        last_image_ms_ = last_frame_ms_;
        processFrame(frame);
    }
}

bool CameraWorker::connect(bool initial) {
    if (!initial) {
        state_.store(WorkerState::Reconnecting);
        source_->close();
    }

    int attempt = 0;
    while (!stopRequested()) {
        // При старте первая попытка без паузы.
        const int waits = initial ? attempt - 1 : attempt;
        if (waits >= 0) {
            const long long delay = backoff_ms(cfg_.reconnect_initial_ms, cfg_.reconnect_max_ms, waits);
            if (cfg_.verbose) {
                std::cout << "[CAM:" << cfg_.name << "] retry in " << delay << " ms" << std::endl;
            }
            if (waitStop(static_cast<int>(delay))) break;
        }

        try {
            source_->open();
        } catch (const AcquisitionError& e) {
            if (e.fatal()) {
                std::cerr << "[CAM:" << cfg_.name << "] fatal: " << e.what() << std::endl;
                exit_reason_.store(ExitReason::Fatal);
                return false;
            }
            std::cerr << "[CAM:" << cfg_.name << "] open failed (attempt " << attempt + 1 << "): "
                      << e.what() << std::endl;
            ++attempt;
            continue;
        }

        if (!initial) {
            // Простой считается от последнего полученного кадра, а не от начала переподключения.
            const long long outage = now_steady_ms() - last_image_ms_;
            reconnects_++;
            if (cfg_.state_grace_ms <= 0 || outage > cfg_.state_grace_ms) {
                resetPipelineState();
                std::cout << "[CAM:" << cfg_.name << "] reconnected, no frames for " << outage
                          << " ms, tracking state reset" << std::endl;
            } else {
                std::cout << "[CAM:" << cfg_.name << "] reconnected, no frames for " << outage
                          << " ms, tracking state kept" << std::endl;
            }
            // Опорный кадр после разрыва всегда устаревший.
            motion_.reset();
        } else {
            last_image_ms_ = now_steady_ms();
            if (cfg_.verbose) {
                std::cout << "[CAM:" << cfg_.name << "] source opened" << std::endl;
            }
        }

        last_frame_ms_ = now_steady_ms();
        state_.store(WorkerState::Running);
        return true;
    }
    return false;
}

void CameraWorker::resetPipelineState() {
    tracker_.reset();
    linger_.reset();
    alerts_.reset();
    objects_.clear();
}

void CameraWorker::processFrame(Frame& frame) {
    frame.seq = ++seq_;
    frames_++;
    const long long now = frame.ts_ms;

    bool ran = false;
    std::vector<Detection> detections;
    if (motion_.should_detect(frame.image, frame.seq)) {
        try {
            detections = detector_->detect(frame.image, cfg_.classes, cfg_.confidence);
            ran = true;
            detections_++;
        } catch (const DetectionError& e) {
            // Цикл пропускается, треки остаются как были.
            detection_errors_++;
            std::cerr << "[CAM:" << cfg_.name << "] detection failed on frame "
                      << frame.seq << ": " << e.what() << std::endl;
        }
    }

    if (ran) {
        objects_ = tracker_.update(detections, frame.seq, now);
    }

    std::vector<AlertEvent> linger_events;
    if (cfg_.linger_enabled) {
        linger_events = linger_.evaluate(objects_, cfg_.roi, now);
        for (int id : linger_.cleared()) {
            std::cout << "[CAM:" << cfg_.name << "] linger cleared id=" << id << std::endl;
        }
    }

    std::vector<AlertEvent> alerts = alerts_.evaluate(detections, ran, std::move(linger_events), now);
    for (auto& alert : alerts) {
        emitAlert(alert, frame);
    }
}

void CameraWorker::emitAlert(AlertEvent& alert, const Frame& frame) {
    alerts_count_++;

    if (alert.kind == AlertKind::Linger) {
        std::cout << "[CAM:" << cfg_.name << "] ALERT linger id=" << alert.track_id
                  << " label=" << alert.label
                  << " dwell=" << alert.dwell_sec << "s" << std::endl;
    } else {
        std::cout << "[CAM:" << cfg_.name << "] ALERT general objects=" << alert.objects.size() << std::endl;
    }

    alert.snapshot = frame.image;
    if (out_.renderer) {
        std::map<int, double> dwell;
        for (const auto& obj : objects_) {
            const double d = linger_.dwell_seconds(obj.id, alert.ts_ms);
            if (d > 0.0) dwell[obj.id] = d;
        }
        std::ostringstream caption;
        caption << cfg_.name << "  " << alert_kind_name(alert.kind) << "  frame " << frame.seq;
        try {
            alert.snapshot = out_.renderer->render(frame.image, objects_,
                                                   cfg_.linger_enabled ? &cfg_.roi : nullptr,
                                                   dwell, caption.str());
        } catch (const RenderError& e) {
            std::cerr << "[CAM:" << cfg_.name << "] overlay failed: " << e.what() << std::endl;
        }
    }

    if (cfg_.save_snapshots && out_.snapshotter) {
        const std::string path = Snapshotter::make_path(cfg_.save_directory, cfg_.name,
                                                        alert_kind_name(alert.kind),
                                                        std::chrono::system_clock::now());
        try {
            out_.snapshotter->save(alert.snapshot, path);
            alert.snapshot_path = path;
        } catch (const RenderError& e) {
            std::cerr << "[CAM:" << cfg_.name << "] snapshot failed: " << e.what() << std::endl;
        }
    }

    if (!out_.notifier) return;
    try {
        if (!out_.notifier->notify(alert)) {
            std::cerr << "[CAM:" << cfg_.name << "] notification not accepted" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[CAM:" << cfg_.name << "] notification failed: " << e.what() << std::endl;
    }
}
