#include "linger/linger_monitor.h"
#include "util/time_util.h"

#include <iostream>
#include <unordered_set>

LingerMonitor::LingerMonitor(const Config& cfg, std::string camera)
        : cfg_(cfg),
          camera_(std::move(camera)),
          linger_ms_(seconds_to_ms(cfg.linger_time_sec)),
          cooldown_ms_(seconds_to_ms(cfg.cooldown_sec)) {}

void LingerMonitor::reset() {
    records_.clear();
    cleared_.clear();
}

double LingerMonitor::dwell_seconds(int id, long long now_ms) const {
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.entered_ms) return 0.0;
    return static_cast<double>(now_ms - *it->second.entered_ms) / 1000.0;
}

std::vector<AlertEvent> LingerMonitor::evaluate(const std::vector<TrackedObject>& objects,
                                                const Roi& roi,
                                                long long now_ms) {
    std::vector<AlertEvent> events;
    std::unordered_set<int> seen;
    cleared_.clear();

    for (const auto& obj : objects) {
        seen.insert(obj.id);
        Record& rec = records_[obj.id];

        // Потерянный трек хранит последний bbox, поэтому окклюзия не сбрасывает таймер.
        if (!roi.contains(obj.centroid)) {
            if (rec.entered_ms) {
                if (cfg_.verbose) {
                    std::cout << "[LNG:" << camera_ << "] id=" << obj.id << " left ROI after "
                              << dwell_seconds(obj.id, now_ms) << "s" << std::endl;
                }
                if (rec.alerted) cleared_.push_back(obj.id);
                rec.entered_ms.reset();
                rec.alerted = false;
            }
            continue;
        }

        if (!rec.entered_ms) {
            rec.entered_ms = now_ms;
            rec.alerted = false;
            if (cfg_.verbose) {
                std::cout << "[LNG:" << camera_ << "] id=" << obj.id << " entered ROI" << std::endl;
            }
        }

        const long long dwell_ms = now_ms - *rec.entered_ms;
        if (dwell_ms < linger_ms_) continue;
        if (rec.last_alert_ms && now_ms - *rec.last_alert_ms < cooldown_ms_) continue;

        AlertEvent ev;
        ev.kind = AlertKind::Linger;
        ev.track_id = obj.id;
        ev.camera = camera_;
        ev.roi = roi;
        ev.dwell_sec = static_cast<double>(dwell_ms) / 1000.0;
        ev.label = obj.label;
        ev.box = obj.box;
        ev.ts_ms = now_ms;
        events.push_back(std::move(ev));

        rec.alerted = true;
        rec.last_alert_ms = now_ms;
        if (cfg_.verbose) {
            std::cout << "[LNG:" << camera_ << "] id=" << obj.id << " lingering "
                      << static_cast<double>(dwell_ms) / 1000.0 << "s -> alert" << std::endl;
        }
    }

    // Записи истёкших треков.
    for (auto it = records_.begin(); it != records_.end();) {
        if (seen.count(it->first)) {
            ++it;
            continue;
        }
        if (it->second.entered_ms && it->second.alerted) cleared_.push_back(it->first);
        it = records_.erase(it);
    }
    return events;
}
