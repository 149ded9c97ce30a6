#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pipeline/camera_worker.h"

// Создаёт свежий воркер (новое состояние конвейера) на каждый запуск.
// Исключение из фабрики считается падением. Вызывается в отдельном потоке,
// без блокировки супервизора: загрузка модели может идти долго.
using WorkerFactory = std::function<std::shared_ptr<CameraWorker>()>;

struct CameraStatus {
    std::string name;
    bool running = false;                        // - есть живой воркер.
    bool launching = false;                      // - фабрика ещё создаёт воркер.
    WorkerState state = WorkerState::Stopped;
    ExitReason last_exit = ExitReason::None;
    bool degraded = false;                       // - фатальная ошибка источника.
    bool finished = false;                       // - перезапусков больше не будет.
    int restarts = 0;
    WorkerStats stats;
};

// Запускает по воркеру на камеру, перезапускает упавшие с паузой,
// останавливает все при shutdown().
class CameraSupervisor {
public:
    struct Config {
        int restart_initial_ms = 1000;      // - первая пауза перед перезапуском упавшего воркера.
        int restart_max_ms = 60000;         // - потолок паузы.
        int shutdown_timeout_ms = 5000;     // - общее ожидание остановки всех воркеров.
        int poll_ms = 100;                  // - период проверки воркеров.
        int status_interval_ms = 30000;     // - период сводки в лог, 0 = выкл.
        int start_stagger_ms = 200;         // - сдвиг запуска соседних камер.
        bool verbose = false;
    };

    explicit CameraSupervisor(const Config& cfg);
    ~CameraSupervisor();

    CameraSupervisor(const CameraSupervisor&) = delete;
    CameraSupervisor& operator=(const CameraSupervisor&) = delete;

    // До start().
    void add_camera(const std::string& name, WorkerFactory factory);

    void start();

    // Останавливает все воркеры. false - кто-то не уложился в таймаут и брошен.
    bool shutdown();

    std::vector<CameraStatus> status() const;

    // Ни одна камера больше не даст кадров.
    bool all_finished() const;

    size_t camera_count() const;

private:
    // Результат фабрики, которую вызывает поток запуска.
    struct PendingLaunch {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        bool cancelled = false;                 // - shutdown не дождался, результат выбрасывается.
        std::shared_ptr<CameraWorker> worker;
        std::string error;
    };

    struct Slot {
        std::string name;
        WorkerFactory factory;
        std::shared_ptr<CameraWorker> worker;
        std::shared_ptr<PendingLaunch> pending;
        long long next_launch_ms = 0;
        int restart_attempt = 0;
        int restarts = 0;
        int launches = 0;
        bool degraded = false;
        bool finished = false;
        ExitReason last_exit = ExitReason::None;
        WorkerStats last_stats;
    };

    void monitorMain();
    void pollSlot(Slot& slot, long long now);
    void beginLaunch(Slot& slot, long long now);
    void finishLaunch(Slot& slot, long long now);
    void scheduleRestart(Slot& slot, long long now);
    void logStatus() const;

    Config cfg_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Slot> slots_;
    std::thread monitor_;
    bool started_ = false;
    bool stopping_ = false;
    bool shut_down_ = false;
    bool shutdown_result_ = true;
};
