#include "tracker/tracker.h"
#include "util/rect_utils.h"

#include <algorithm>
#include <iostream>

/*
  Порядок одного update():
   1) пары (трек, детекция) одного класса с расстоянием центров <= distance_threshold;
   2) сортировка: сначала пересекающиеся bbox по убыванию IoU,
      затем остальные по возрастанию расстояния; stable_sort сохраняет
      порядок детекций при равных ключах;
   3) жадная привязка;
   4) непривязанные детекции -> новые треки;
   5) непривязанные старые треки -> missing++, удаление после max_missing_frames.
 */

Tracker::Tracker(const Config& cfg, std::string tag) : cfg_(cfg), tag_(std::move(tag)) {}

void Tracker::reset() {
    tracks_.clear();
    objects_.clear();
    expired_.clear();
}

std::vector<TrackedObject> Tracker::update(const std::vector<Detection>& detections,
                                           long long frame_index,
                                           long long now_ms) {
    expired_.clear();

    // 1) Кандидаты на привязку.
    std::vector<Candidate> candidates;
    candidates.reserve(detections.size() * tracks_.size());
    for (size_t di = 0; di < detections.size(); ++di) {
        const Detection& det = detections[di];
        const cv::Point2f c = util::centroid(det.box);
        for (const auto& kv : tracks_) {
            const Track& tr = kv.second;
            if (tr.label != det.label) continue;
            const float d = util::distance(c, tr.centroid);
            if (d > cfg_.distance_threshold) continue;
            candidates.push_back(Candidate{tr.id, di, util::iou(tr.box, det.box), d});
        }
    }

    // 2) Детерминированный порядок.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         const bool ao = a.iou > 0.0f;
                         const bool bo = b.iou > 0.0f;
                         if (ao != bo) return ao;
                         if (ao && a.iou != b.iou) return a.iou > b.iou;
                         return a.dist < b.dist;
                     });

    // 3) Жадная привязка.
    std::vector<char> det_used(detections.size(), 0);
    std::map<int, bool> track_used;
    for (const auto& cand : candidates) {
        if (det_used[cand.det_index]) continue;
        if (track_used[cand.track_id]) continue;
        det_used[cand.det_index] = 1;
        track_used[cand.track_id] = true;

        Track& tr = tracks_[cand.track_id];
        const Detection& det = detections[cand.det_index];
        tr.box = det.box;
        tr.centroid = util::centroid(det.box);
        tr.confidence = det.confidence;
        tr.missing = 0;
        tr.last_seen_frame = frame_index;
    }

    // 5) Старые непривязанные треки (до создания новых, чтобы новые не получили missing).
    for (auto it = tracks_.begin(); it != tracks_.end();) {
        if (track_used[it->first]) {
            ++it;
            continue;
        }
        it->second.missing++;
        if (it->second.missing > cfg_.max_missing_frames) {
            if (cfg_.verbose) {
                std::cout << "[TRK:" << tag_ << "] expired id=" << it->first
                          << " missing=" << it->second.missing << std::endl;
            }
            expired_.push_back(it->first);
            it = tracks_.erase(it);
        } else {
            ++it;
        }
    }

    // 4) Новые треки.
    for (size_t di = 0; di < detections.size(); ++di) {
        if (det_used[di]) continue;
        Track t;
        t.id = next_id_++;
        t.box = detections[di].box;
        t.centroid = util::centroid(t.box);
        t.label = detections[di].label;
        t.confidence = detections[di].confidence;
        t.last_seen_frame = frame_index;
        t.missing = 0;
        t.created_ms = now_ms;
        if (cfg_.verbose) {
            std::cout << "[TRK:" << tag_ << "] new id=" << t.id
                      << " label=" << t.label
                      << " at (" << t.centroid.x << "," << t.centroid.y << ")"
                      << std::endl;
        }
        tracks_.emplace(t.id, std::move(t));
    }

    rebuild_objects();

    if (cfg_.verbose) {
        std::cout << "[TRK:" << tag_ << "] frame=" << frame_index
                  << " detections=" << detections.size()
                  << " tracks=" << tracks_.size()
                  << " expired=" << expired_.size()
                  << std::endl;
    }
    return objects_;
}

void Tracker::rebuild_objects() {
    objects_.clear();
    objects_.reserve(tracks_.size());

    for (const auto& kv : tracks_) {
        const Track& tr = kv.second;
        TrackedObject obj;
        obj.id = tr.id;
        obj.box = tr.box;
        obj.centroid = tr.centroid;
        obj.label = tr.label;
        obj.confidence = tr.confidence;
        obj.last_seen_frame = tr.last_seen_frame;
        obj.missing_frames = tr.missing;
        obj.created_ms = tr.created_ms;
        objects_.push_back(std::move(obj));
    }
}
