#include "alert/alert_manager.h"
#include "util/time_util.h"

AlertManager::AlertManager(const Config& cfg, std::string camera)
        : cfg_(cfg),
          camera_(std::move(camera)),
          cooldown_ms_(seconds_to_ms(cfg.general_cooldown_sec)) {}

std::vector<AlertEvent> AlertManager::evaluate(const std::vector<Detection>& detections,
                                               bool detection_ran,
                                               std::vector<AlertEvent> linger_events,
                                               long long now_ms) {
    std::vector<AlertEvent> out = std::move(linger_events);
    if (!cfg_.general_alerts || !detection_ran) return out;

    // Пока человек задерживается, он уже покрыт linger-алертом.
    const bool lingering = !out.empty();
    std::vector<Detection> rest;
    for (const auto& det : detections) {
        if (lingering && det.label == cfg_.linger_label) continue;
        rest.push_back(det);
    }
    if (rest.empty()) return out;

    if (last_general_ms_ && now_ms - *last_general_ms_ < cooldown_ms_) return out;

    AlertEvent ev;
    ev.kind = AlertKind::General;
    ev.camera = camera_;
    ev.label = rest.front().label;
    ev.box = rest.front().box;
    ev.objects = std::move(rest);
    ev.ts_ms = now_ms;
    out.push_back(std::move(ev));
    last_general_ms_ = now_ms;
    return out;
}
