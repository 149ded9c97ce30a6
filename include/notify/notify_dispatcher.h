#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "core/blocking_queue.h"
#include "notify/notifier.h"

// Развязывает конвейер камер и доставку: notify() только кладёт событие
// в очередь, отдельный поток раздаёт его всем получателям.
class NotifyDispatcher : public Notifier {
public:
    struct Config {
        size_t queue_size = 64;   // - при переполнении новые события отбрасываются.
        bool verbose = false;
    };

    explicit NotifyDispatcher(const Config& cfg);
    ~NotifyDispatcher() override;

    NotifyDispatcher(const NotifyDispatcher&) = delete;
    NotifyDispatcher& operator=(const NotifyDispatcher&) = delete;

    // До start().
    void add_sink(std::shared_ptr<Notifier> sink);

    void start();
    // Доставляет то, что уже в очереди, и останавливает поток.
    void stop();

    // Никогда не блокирует. false - очередь полна или остановлена.
    bool notify(const AlertEvent& event) override;

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void threadMain();
    void deliver(const AlertEvent& event);

    Config cfg_;
    BlockingQueue<AlertEvent> queue_;
    std::vector<std::shared_ptr<Notifier>> sinks_;
    std::thread th_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};
