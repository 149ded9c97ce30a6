#include "notify/notify_dispatcher.h"

#include <iostream>

NotifyDispatcher::NotifyDispatcher(const Config& cfg) : cfg_(cfg), queue_(cfg.queue_size) {}

NotifyDispatcher::~NotifyDispatcher() {
    stop();
}

void NotifyDispatcher::add_sink(std::shared_ptr<Notifier> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void NotifyDispatcher::start() {
    if (running_.exchange(true)) return;
    th_ = std::thread(&NotifyDispatcher::threadMain, this);
}

void NotifyDispatcher::stop() {
    queue_.stop();
    if (th_.joinable()) th_.join();
    running_.store(false);
}

bool NotifyDispatcher::notify(const AlertEvent& event) {
    if (queue_.try_push(event)) return true;

    dropped_++;
    std::cerr << "[NTF] queue full or stopped, dropped " << alert_kind_name(event.kind)
              << " alert from " << event.camera << std::endl;
    return false;
}

void NotifyDispatcher::threadMain() {
    AlertEvent event;
    while (queue_.pop(event)) {
        deliver(event);
    }
    if (cfg_.verbose) {
        std::cout << "[NTF] dispatcher stopped: delivered=" << delivered_.load()
                  << " failed=" << failed_.load()
                  << " dropped=" << dropped_.load() << std::endl;
    }
}

void NotifyDispatcher::deliver(const AlertEvent& event) {
    for (const auto& sink : sinks_) {
        bool ok = false;
        try {
            ok = sink->notify(event);
        } catch (const std::exception& e) {
            std::cerr << "[NTF] sink error: " << e.what() << std::endl;
        }
        if (ok) {
            delivered_++;
        } else {
            failed_++;
            std::cerr << "[NTF] delivery failed: " << alert_kind_name(event.kind)
                      << " camera=" << event.camera << " id=" << event.track_id << std::endl;
        }
    }
    if (cfg_.verbose) {
        std::cout << "[NTF] " << alert_kind_name(event.kind) << " alert camera=" << event.camera
                  << " id=" << event.track_id << " sinks=" << sinks_.size() << std::endl;
    }
}
