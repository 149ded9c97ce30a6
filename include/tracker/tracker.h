#pragma once

#include <opencv2/opencv.hpp>
#include <map>
#include <string>
#include <vector>

#include "core/types.h"

// Трекер по центроидам: жадная привязка детекций к существующим трекам,
// допускает кратковременную потерю объекта (окклюзию).
class Tracker {
public:
    struct Config {
        float distance_threshold = 75.0f; // - максимальное расстояние центров для привязки (пиксели).
        int max_missing_frames = 5;       // - сколько циклов детекции трек живёт без привязки.
        bool verbose = false;
    };

    explicit Tracker(const Config& cfg, std::string tag = "");

    // Сбрасывает все треки. Счётчик id НЕ сбрасывается: id никогда не выдаются повторно.
    void reset();

    // Вызывается только на кадрах, где реально отработал детектор.
    std::vector<TrackedObject> update(const std::vector<Detection>& detections,
                                      long long frame_index,
                                      long long now_ms = 0);

    const std::vector<TrackedObject>& objects() const { return objects_; }

    // id треков, удалённых последним update().
    const std::vector<int>& expired() const { return expired_; }

    size_t size() const { return tracks_.size(); }

private:
    struct Track {
        int id = -1;                    // - идентификатор трека.
        cv::Rect2f box;                 // - последний bbox.
        cv::Point2f centroid;           // - центр последнего bbox.
        std::string label;              // - класс.
        float confidence = 0.0f;        // - уверенность последней детекции.
        long long last_seen_frame = -1; // - кадр последней привязки.
        int missing = 0;                // - пропущенные циклы детекции.
        long long created_ms = 0;       // - время создания.
    };

    struct Candidate {
        int track_id;
        size_t det_index;
        float iou;
        float dist;
    };

    void rebuild_objects();

    Config cfg_;
    std::string tag_;
    int next_id_ = 1;                   // - счётчик id для новых треков.
    std::map<int, Track> tracks_;       // - активные треки по id.
    std::vector<TrackedObject> objects_;
    std::vector<int> expired_;
};
