#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.h"

// Пропускает linger-алерты и добавляет общий алерт по остальным объектам.
class AlertManager {
public:
    struct Config {
        bool general_alerts = true;            // - включить общие алерты.
        double general_cooldown_sec = 60.0;    // - интервал между общими алертами камеры.
        std::string linger_label = "person";   // - этот класс не попадает в общий алерт, пока идёт linger.
    };

    AlertManager(const Config& cfg, std::string camera);

    // detections пуст, если детектор на этом цикле не запускался.
    std::vector<AlertEvent> evaluate(const std::vector<Detection>& detections,
                                     bool detection_ran,
                                     std::vector<AlertEvent> linger_events,
                                     long long now_ms);

    void reset() { last_general_ms_.reset(); }

private:
    Config cfg_;
    std::string camera_;
    long long cooldown_ms_ = 0;
    std::optional<long long> last_general_ms_;
};
