#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Кадр, прошедший через источник. Владеет изображением только пока идёт цикл
// обработки; дальше живёт лишь если попал в snapshot алерта.
struct Frame {
    long long seq = 0;   // - порядковый номер кадра (назначает CameraWorker, монотонный).
    long long ts_ms = 0; // - момент получения кадра, steady clock (мс).
    cv::Mat image;       // - BGR изображение.
};

// Результат одного вызова детектора.
struct Detection {
    cv::Rect2f box;       // - bbox в координатах кадра (x, y, w, h).
    std::string label;    // - имя класса ("person", ...).
    float confidence = 0.0f; // - уверенность 0..1.
};

struct TrackedObject {
    int id = -1;                          // - постоянный идентификатор трека.
    cv::Rect2f box;                       // - текущий bbox.
    cv::Point2f centroid{0.0f, 0.0f};     // - центр bbox.
    std::string label;                    // - класс объекта.
    float confidence = 0.0f;              // - уверенность последней привязанной детекции.
    long long last_seen_frame = -1;       // - номер кадра последней привязки.
    int missing_frames = 0;               // - сколько циклов детекции подряд объект не найден.
    long long created_ms = 0;             // - когда трек был создан.
};

// Прямоугольная зона интереса. Границы включаются.
struct Roi {
    float x1 = 0.0f;
    float y1 = 0.0f;
    float x2 = 0.0f;
    float y2 = 0.0f;

    bool valid() const { return x2 > x1 && y2 > y1; }

    bool contains(const cv::Point2f& p) const {
        return p.x >= x1 && p.x <= x2 && p.y >= y1 && p.y <= y2;
    }

    cv::Rect2f rect() const { return cv::Rect2f(x1, y1, x2 - x1, y2 - y1); }
};

enum class AlertKind {
    Linger,
    General
};

inline const char* alert_kind_name(AlertKind kind) {
    switch (kind) {
        case AlertKind::Linger: return "linger";
        case AlertKind::General: return "general";
    }
    return "unknown";
}

struct AlertEvent {
    AlertKind kind = AlertKind::Linger;
    int track_id = -1;                 // - id трека (-1 для general).
    std::string camera;                // - имя камеры.
    Roi roi;                           // - зона, в которой задержался объект.
    double dwell_sec = 0.0;            // - время нахождения в зоне на момент алерта.
    std::string label;                 // - класс объекта.
    cv::Rect2f box;                    // - bbox объекта.
    std::vector<Detection> objects;    // - детекции для general алерта.
    long long ts_ms = 0;               // - время алерта (время кадра).
    cv::Mat snapshot;                  // - аннотированный кадр (может быть пустым).
    std::string snapshot_path;         // - куда сохранён snapshot (пусто, если не сохранялся).
};
