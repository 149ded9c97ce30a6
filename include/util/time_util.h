#pragma once

#include <chrono>

// Текущее время по steady_clock в миллисекундах (монотонное, без скачков времени).
inline long long now_steady_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
}

inline long long seconds_to_ms(double sec) {
    return static_cast<long long>(sec * 1000.0 + (sec >= 0.0 ? 0.5 : -0.5));
}
