#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "alert/alert_manager.h"
#include "core/types.h"
#include "detect/detector.h"
#include "detect/motion_gate.h"
#include "io/frame_source.h"
#include "linger/linger_monitor.h"
#include "notify/notifier.h"
#include "overlay/overlay_renderer.h"
#include "overlay/snapshotter.h"
#include "tracker/tracker.h"

enum class WorkerState {
    Starting,
    Running,
    Reconnecting,
    Stopped
};

enum class ExitReason {
    None,         // - ещё работает.
    Requested,    // - request_stop().
    EndOfStream,  // - источник закончился.
    Fatal,        // - фатальная ошибка источника, камера деградировала.
    Crashed       // - неожиданное исключение.
};

const char* worker_state_name(WorkerState s);

// initial_ms * 2^n с потолком max_ms.
long long backoff_ms(int initial_ms, int max_ms, int n);
const char* exit_reason_name(ExitReason r);

struct WorkerStats {
    uint64_t frames = 0;
    uint64_t detections = 0;
    uint64_t detection_errors = 0;
    uint64_t alerts = 0;
    uint64_t reconnects = 0;
};

// Конвейер одной камеры в собственном потоке:
// кадр -> MotionGate -> Detector -> Tracker -> LingerMonitor -> AlertManager -> Notifier.
//
// Starting -> Running <-> Reconnecting -> Stopped.
// Объект живёт, пока жив его поток (shared_from_this), поэтому брошенный
// через abandon() воркер безопасно доработает сам.
class CameraWorker : public std::enable_shared_from_this<CameraWorker> {
public:
    struct Config {
        std::string name;
        std::set<std::string> classes;      // - пусто = все классы.
        float confidence = 0.5f;
        bool linger_enabled = true;
        Roi roi;

        MotionGate::Config motion;
        Tracker::Config tracking;
        LingerMonitor::Config linger;
        AlertManager::Config alerting;

        int read_timeout_ms = 200;          // - один опрос источника.
        int no_frame_timeout_ms = 5000;     // - нет кадров дольше -> переподключение.
        int reconnect_initial_ms = 500;     // - первая пауза перед повтором.
        int reconnect_max_ms = 30000;       // - потолок паузы.
        int state_grace_ms = 0;             // - простой дольше -> сброс треков (0 = сбрасывать всегда).

        std::string save_directory = "./detections";
        bool save_snapshots = true;
        bool verbose = false;
    };

    // Необязательные получатели результатов (nullptr = не используется).
    struct Outputs {
        std::shared_ptr<Notifier> notifier;
        std::shared_ptr<const OverlayRenderer> renderer;
        std::shared_ptr<const Snapshotter> snapshotter;
    };

    CameraWorker(const Config& cfg,
                 std::unique_ptr<FrameSource> source,
                 std::shared_ptr<Detector> detector,
                 Outputs outputs);
    ~CameraWorker();

    CameraWorker(const CameraWorker&) = delete;
    CameraWorker& operator=(const CameraWorker&) = delete;

    void start();
    void request_stop();

    // true - поток завершился и присоединён. timeout_ms < 0 = ждать бесконечно.
    bool join_for(int timeout_ms);

    // Отпускает поток, который не уложился в таймаут остановки.
    void abandon();

    const std::string& name() const { return cfg_.name; }
    WorkerState state() const { return state_.load(); }
    ExitReason exit_reason() const { return exit_reason_.load(); }
    bool finished() const { return finished_.load(); }
    WorkerStats stats() const;

private:
    void threadMain();
    void runLoop();

    // Открывает источник с экспоненциальной паузой. false - остановка или фатальная ошибка.
    bool connect(bool initial);
    // Пауза, прерываемая request_stop(). true - пришла остановка.
    bool waitStop(int ms);
    bool stopRequested() const { return stop_.load(); }

    void processFrame(Frame& frame);
    void emitAlert(AlertEvent& alert, const Frame& frame);
    void resetPipelineState();

    Config cfg_;
    std::unique_ptr<FrameSource> source_;
    std::shared_ptr<Detector> detector_;
    Outputs out_;

    MotionGate motion_;
    Tracker tracker_;
    LingerMonitor linger_;
    AlertManager alerts_;
    std::vector<TrackedObject> objects_;   // - набор с последнего цикла детекции.

    long long seq_ = 0;
    long long last_frame_ms_ = 0;          // - для watchdog, сбрасывается после переподключения.
    long long last_image_ms_ = 0;          // - последний реально полученный кадр.

    std::thread th_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stop_{false};
    std::atomic<bool> finished_{false};
    std::atomic<WorkerState> state_{WorkerState::Starting};
    std::atomic<ExitReason> exit_reason_{ExitReason::None};

    std::mutex wait_m_;
    std::condition_variable wait_cv_;

    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> detections_{0};
    std::atomic<uint64_t> detection_errors_{0};
    std::atomic<uint64_t> alerts_count_{0};
    std::atomic<uint64_t> reconnects_{0};
};
