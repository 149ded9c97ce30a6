#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/types.h"

// Время нахождения каждого трека в ROI и алерты с cooldown.
//
// Состояния записи: Outside (entered пуст) -> Entering (entered := now)
// -> Lingering (dwell >= linger_time, алерт не чаще cooldown) -> Outside
// при выходе из ROI или исчезновении трека.
class LingerMonitor {
public:
    struct Config {
        double linger_time_sec = 5.0;  // - порог задержки в ROI (секунды).
        double cooldown_sec = 60.0;    // - минимальный интервал между алертами одного id.
        bool verbose = false;
    };

    LingerMonitor(const Config& cfg, std::string camera);

    // objects - все активные треки (включая временно потерянные).
    // id, отсутствующие в списке, считаются истёкшими, их записи удаляются.
    std::vector<AlertEvent> evaluate(const std::vector<TrackedObject>& objects,
                                     const Roi& roi,
                                     long long now_ms);

    void reset();

    // Сколько секунд id непрерывно находится в ROI (0, если снаружи).
    double dwell_seconds(int id, long long now_ms) const;

    bool has_record(int id) const { return records_.count(id) != 0; }
    size_t record_count() const { return records_.size(); }

    // id, у которых закончилась задержка с алертом (выход или истечение) на последнем evaluate().
    const std::vector<int>& cleared() const { return cleared_; }

private:
    struct Record {
        std::optional<long long> entered_ms;    // - когда вошёл в ROI (пусто = снаружи).
        bool alerted = false;                   // - был ли алерт в текущем заходе.
        std::optional<long long> last_alert_ms; // - время последнего алерта (переживает выход).
    };

    Config cfg_;
    std::string camera_;
    long long linger_ms_ = 0;
    long long cooldown_ms_ = 0;
    std::unordered_map<int, Record> records_;
    std::vector<int> cleared_;
};
