#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ

#include "core/errors.h"
#include "detect/detector.h"
#include "io/gst_frame_source.h"
#include "pipeline/camera_supervisor.h"
#include "pipeline/camera_worker.h"

template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw ConfigError("missing key '" + std::string(key) + "'");
    }
    const auto value = node->value<T>();
    if (!value) {
        throw ConfigError("invalid value for '" + std::string(key) + "'");
    }
    return *value;
}

// Ключ необязателен, но если задан - должен иметь правильный тип.
template <typename T>
static void read_optional(const toml::table &tbl, std::string_view key, T &out) {
    const auto *node = tbl.get(key);
    if (!node) return;
    const auto value = node->value<T>();
    if (!value) {
        throw ConfigError("invalid value for '" + std::string(key) + "'");
    }
    out = *value;
}

struct LoggingConfig {
    bool worker = true;         // [CAM:*] подробности цикла камеры
    bool motion = false;        // [MOT:*] решения MotionGate
    bool tracker = false;       // [TRK:*] создание/удаление треков
    bool linger = true;         // [LNG:*] вход/выход из ROI
    bool supervisor = true;     // [SUP] запуски воркеров
    bool detector = false;      // [DET] разбор выхода сети
    bool notify = false;        // [NTF] доставка алертов
    bool gst = false;           // [GST:*] события GStreamer
};

struct AlertingConfig {
    std::string events_jsonl = "./detections/events.jsonl"; // - журнал алертов, пусто = выкл.
    size_t queue_size = 64;                                 // - очередь NotifyDispatcher.
    int jpg_quality = 90;                                   // - качество snapshot.
};

struct CameraConfig {
    std::string name;
    GstFrameSource::Config source;      // - url и параметры rtspsrc.
    CameraWorker::Config worker;        // - конвейер камеры.
};

struct AppConfig {
    LoggingConfig logging;
    DetectorConfig detector;
    AlertingConfig alerting;
    CameraSupervisor::Config supervisor;
    std::vector<CameraConfig> cameras;      // - только прошедшие проверку.
    std::vector<std::string> rejected;      // - отброшенные записи [[cameras]] с причиной.
};

// Ошибки глобальных секций и отсутствие валидных камер -> ConfigError.
// Некорректная камера пропускается и попадает в rejected.
AppConfig parse_app_config(const toml::table &tbl);

// Ошибки чтения и синтаксиса TOML -> ConfigError.
AppConfig load_app_config(const std::string &path);

// Бросает ConfigError с описанием первой найденной проблемы.
void validate_camera(const CameraConfig &cfg);
