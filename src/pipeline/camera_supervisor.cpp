#include "pipeline/camera_supervisor.h"
#include "util/time_util.h"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <stdexcept>
#include <system_error>

CameraSupervisor::CameraSupervisor(const Config& cfg) : cfg_(cfg) {}

CameraSupervisor::~CameraSupervisor() {
    shutdown();
}

void CameraSupervisor::add_camera(const std::string& name, WorkerFactory factory) {
    std::lock_guard<std::mutex> lk(mutex_);
    Slot slot;
    slot.name = name;
    slot.factory = std::move(factory);
    slots_.push_back(std::move(slot));
}

size_t CameraSupervisor::camera_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return slots_.size();
}

void CameraSupervisor::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (started_) return;
    started_ = true;

    // Камеры стартуют со сдвигом, чтобы не открывать все потоки одновременно.
    const long long now = now_steady_ms();
    for (size_t i = 0; i < slots_.size(); ++i) {
        slots_[i].next_launch_ms = now + static_cast<long long>(i) * cfg_.start_stagger_ms;
    }
    std::cout << "[SUP] starting " << slots_.size() << " camera(s)" << std::endl;
    monitor_ = std::thread(&CameraSupervisor::monitorMain, this);
}

void CameraSupervisor::monitorMain() {
    long long last_status = now_steady_ms();

    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopping_) {
        const long long now = now_steady_ms();
        for (auto& slot : slots_) {
            pollSlot(slot, now);
        }

        if (cfg_.status_interval_ms > 0 && now - last_status >= cfg_.status_interval_ms) {
            last_status = now;
            logStatus();
        }
        cv_.wait_for(lk, std::chrono::milliseconds(cfg_.poll_ms), [&] { return stopping_; });
    }
}

void CameraSupervisor::pollSlot(Slot& slot, long long now) {
    if (slot.finished) return;

    if (slot.pending) {
        finishLaunch(slot, now);
        return;
    }
    if (!slot.worker) {
        if (now >= slot.next_launch_ms) beginLaunch(slot, now);
        return;
    }
    if (!slot.worker->finished()) return;

    slot.worker->join_for(0);
    slot.last_exit = slot.worker->exit_reason();
    slot.last_stats = slot.worker->stats();
    slot.worker.reset();

    switch (slot.last_exit) {
        case ExitReason::Crashed:
            // Воркер успел поработать - значит сбой не стартовый, пауза с начала.
            if (slot.last_stats.frames > 0) slot.restart_attempt = 0;
            scheduleRestart(slot, now);
            break;
        case ExitReason::Fatal:
            slot.degraded = true;
            slot.finished = true;
            std::cerr << "[SUP] camera " << slot.name << " degraded (fatal source error)" << std::endl;
            break;
        case ExitReason::EndOfStream:
        case ExitReason::Requested:
        case ExitReason::None:
            slot.finished = true;
            std::cout << "[SUP] camera " << slot.name << " finished ("
                      << exit_reason_name(slot.last_exit) << ")" << std::endl;
            break;
    }
}

void CameraSupervisor::beginLaunch(Slot& slot, long long now) {
    auto pending = std::make_shared<PendingLaunch>();
    WorkerFactory factory = slot.factory;
    try {
        // Поток запуска держит только pending и копию фабрики, поэтому его
        // можно бросить, если фабрика зависла к моменту shutdown().
        std::thread([pending, factory] {
            std::shared_ptr<CameraWorker> worker;
            std::string error;
            try {
                worker = factory();
                if (!worker) error = "factory returned no worker";
            } catch (const std::exception& e) {
                error = e.what();
            }
            {
                std::lock_guard<std::mutex> lk(pending->m);
                pending->done = true;
                if (!pending->cancelled) {
                    pending->worker = std::move(worker);
                    pending->error = std::move(error);
                }
            }
            pending->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "[SUP] camera " << slot.name << " failed to launch: " << e.what() << std::endl;
        slot.last_exit = ExitReason::Crashed;
        scheduleRestart(slot, now);
        return;
    }
    slot.pending = std::move(pending);
}

void CameraSupervisor::finishLaunch(Slot& slot, long long now) {
    std::shared_ptr<CameraWorker> worker;
    std::string error;
    {
        std::lock_guard<std::mutex> lk(slot.pending->m);
        if (!slot.pending->done) return;
        worker = std::move(slot.pending->worker);
        error = std::move(slot.pending->error);
    }
    slot.pending.reset();

    try {
        if (!worker) {
            throw std::runtime_error(error);
        }
        worker->start();
    } catch (const std::exception& e) {
        std::cerr << "[SUP] camera " << slot.name << " failed to launch: " << e.what() << std::endl;
        slot.last_exit = ExitReason::Crashed;
        scheduleRestart(slot, now);
        return;
    }

    slot.worker = std::move(worker);
    if (slot.launches > 0) slot.restarts++;
    slot.launches++;
    if (cfg_.verbose) {
        std::cout << "[SUP] camera " << slot.name << " launched (#" << slot.launches << ")" << std::endl;
    }
}

void CameraSupervisor::scheduleRestart(Slot& slot, long long now) {
    const long long delay = backoff_ms(cfg_.restart_initial_ms, cfg_.restart_max_ms, slot.restart_attempt);
    slot.restart_attempt++;
    slot.next_launch_ms = now + delay;
    std::cerr << "[SUP] camera " << slot.name << " crashed, restart in " << delay << " ms" << std::endl;
}

void CameraSupervisor::logStatus() const {
    for (const auto& slot : slots_) {
        std::cout << "[SUP] " << slot.name << ": ";
        if (slot.worker) {
            const WorkerStats st = slot.worker->stats();
            std::cout << worker_state_name(slot.worker->state())
                      << " frames=" << st.frames
                      << " detections=" << st.detections
                      << " det_errors=" << st.detection_errors
                      << " alerts=" << st.alerts
                      << " reconnects=" << st.reconnects;
        } else if (slot.pending) {
            std::cout << "launching";
        } else if (slot.degraded) {
            std::cout << "degraded";
        } else if (slot.finished) {
            std::cout << "finished (" << exit_reason_name(slot.last_exit) << ")";
        } else {
            std::cout << "waiting for restart";
        }
        std::cout << " restarts=" << slot.restarts << std::endl;
    }
}

std::vector<CameraStatus> CameraSupervisor::status() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<CameraStatus> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        CameraStatus st;
        st.name = slot.name;
        st.running = static_cast<bool>(slot.worker);
        st.launching = static_cast<bool>(slot.pending);
        st.state = slot.worker ? slot.worker->state() : WorkerState::Stopped;
        st.last_exit = slot.last_exit;
        st.degraded = slot.degraded;
        st.finished = slot.finished;
        st.restarts = slot.restarts;
        st.stats = slot.worker ? slot.worker->stats() : slot.last_stats;
        out.push_back(std::move(st));
    }
    return out;
}

bool CameraSupervisor::all_finished() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::all_of(slots_.begin(), slots_.end(), [](const Slot& s) { return s.finished; });
}

bool CameraSupervisor::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (shut_down_) return shutdown_result_;
        shut_down_ = true;
        stopping_ = true;
    }
    cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();

    std::lock_guard<std::mutex> lk(mutex_);
    std::cout << "[SUP] shutting down" << std::endl;
    for (auto& slot : slots_) {
        if (slot.worker) slot.worker->request_stop();
    }

    // Один общий дедлайн на все воркеры.
    const long long deadline = now_steady_ms() + cfg_.shutdown_timeout_ms;
    bool all_joined = true;
    for (auto& slot : slots_) {
        if (slot.pending) {
            std::unique_lock<std::mutex> plk(slot.pending->m);
            const auto until = std::chrono::steady_clock::now() +
                               std::chrono::milliseconds(std::max<long long>(0, deadline - now_steady_ms()));
            if (!slot.pending->cv.wait_until(plk, until, [&] { return slot.pending->done; })) {
                // Поток запуска выбросит воркер сам, когда фабрика вернётся.
                slot.pending->cancelled = true;
                std::cerr << "[SUP] camera " << slot.name << " still launching after "
                          << cfg_.shutdown_timeout_ms << " ms, abandoning launch" << std::endl;
                all_joined = false;
            }
            // Готовый, но не запущенный воркер просто освобождается.
            slot.pending->worker.reset();
            plk.unlock();
            slot.pending.reset();
            slot.finished = true;
        }
        if (!slot.worker) {
            slot.finished = true;
            continue;
        }
        const long long left = std::max<long long>(0, deadline - now_steady_ms());
        if (slot.worker->join_for(static_cast<int>(left))) {
            slot.last_exit = slot.worker->exit_reason();
        } else {
            std::cerr << "[SUP] camera " << slot.name << " did not stop within "
                      << cfg_.shutdown_timeout_ms << " ms, abandoning worker" << std::endl;
            slot.worker->abandon();
            slot.last_exit = ExitReason::None;
            all_joined = false;
        }
        slot.last_stats = slot.worker->stats();
        slot.worker.reset();
        slot.finished = true;
    }
    shutdown_result_ = all_joined;
    std::cout << "[SUP] shutdown " << (all_joined ? "complete" : "incomplete") << std::endl;
    return all_joined;
}
