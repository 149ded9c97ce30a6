#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

// Ограниченная очередь для worker-потоков.
// try_push() никогда не блокирует: при переполнении возвращает false.
// pop()/pop_for() отдают остаток очереди и после stop().
template<typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(size_t capacity = 0) : capacity_(capacity) {}

    // false: очередь остановлена или заполнена (capacity 0 = без ограничения).
    bool try_push(T&& v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) return false;
            if (capacity_ > 0 && q_.size() >= capacity_) return false;
            q_.emplace_back(std::move(v));
        }
        cv_.notify_one();
        return true;
    }

    bool try_push(const T& v) {
        T copy(v);
        return try_push(std::move(copy));
    }

    // Блокирует поток, пока нет элемента или stop().
    // Возвращает false, если очередь остановлена и пуста.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return stop_ || !q_.empty(); });

        if (q_.empty()) return false;

        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Как pop(), но не дольше timeout_ms.
    bool pop_for(T& out, int timeout_ms) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&]{ return stop_ || !q_.empty(); });

        if (q_.empty()) return false;

        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(m_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lk(m_);
        return stop_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    size_t capacity_;
    bool stop_ = false;
};
