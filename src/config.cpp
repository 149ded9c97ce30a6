#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Загрузка config.toml
//
//  - [logging], [detector], [alerting], [supervisor] - глобальные секции;
//    ошибка в них фатальна.
//  - [defaults] (+ motion/tracking/linger/source) - значения для всех камер.
//  - [[cameras]] - те же ключи, переопределяют defaults. Ошибка в записи
//    отбрасывает только эту камеру.
// ============================================================================

namespace {

const toml::table *sub_table(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) return nullptr;
    const auto *t = node->as_table();
    if (!t) {
        throw ConfigError("invalid [" + std::string(key) + "] table");
    }
    return t;
}

void load_logging(const toml::table &tbl, LoggingConfig &cfg) {
    // ----------------------------- [logging] -----------------------------
    const auto *logging = sub_table(tbl, "logging");
    if (!logging) return;
    read_optional(*logging, "worker", cfg.worker);
    read_optional(*logging, "motion", cfg.motion);
    read_optional(*logging, "tracker", cfg.tracker);
    read_optional(*logging, "linger", cfg.linger);
    read_optional(*logging, "supervisor", cfg.supervisor);
    read_optional(*logging, "detector", cfg.detector);
    read_optional(*logging, "notify", cfg.notify);
    read_optional(*logging, "gst", cfg.gst);
}

void load_detector(const toml::table &tbl, DetectorConfig &cfg) {
    // ----------------------------- [detector] ----------------------------
    const auto *detector = sub_table(tbl, "detector");
    if (!detector) {
        throw ConfigError("missing [detector] table");
    }
    read_optional(*detector, "backend", cfg.backend);
    cfg.model_path = read_required<std::string>(*detector, "model_path");
    read_optional(*detector, "class_names_path", cfg.class_names_path);
    read_optional(*detector, "input_size", cfg.input_size);
    read_optional(*detector, "nms_threshold", cfg.nms_threshold);
    read_optional(*detector, "scale", cfg.scale);
    read_optional(*detector, "swap_rb", cfg.swap_rb);
    read_optional(*detector, "shared_instance", cfg.shared_instance);

    if (cfg.backend != "opencv_dnn" && cfg.backend != "rknn") {
        throw ConfigError("detector.backend must be 'opencv_dnn' or 'rknn'");
    }
    if (cfg.input_size <= 0) {
        throw ConfigError("detector.input_size must be > 0");
    }
    if (cfg.nms_threshold < 0.0f || cfg.nms_threshold > 1.0f) {
        throw ConfigError("detector.nms_threshold must be in [0, 1]");
    }
}

void load_alerting(const toml::table &tbl, AlertingConfig &cfg, AlertManager::Config &general) {
    // ----------------------------- [alerting] ----------------------------
    const auto *alerting = sub_table(tbl, "alerting");
    if (!alerting) return;
    read_optional(*alerting, "events_jsonl", cfg.events_jsonl);
    read_optional(*alerting, "queue_size", cfg.queue_size);
    read_optional(*alerting, "jpg_quality", cfg.jpg_quality);
    read_optional(*alerting, "general_alerts", general.general_alerts);
    read_optional(*alerting, "general_cooldown_seconds", general.general_cooldown_sec);

    if (cfg.queue_size == 0) {
        throw ConfigError("alerting.queue_size must be > 0");
    }
    if (cfg.jpg_quality < 1 || cfg.jpg_quality > 100) {
        throw ConfigError("alerting.jpg_quality must be in [1, 100]");
    }
    if (general.general_cooldown_sec < 0.0) {
        throw ConfigError("alerting.general_cooldown_seconds must be >= 0");
    }
}

void load_supervisor(const toml::table &tbl, CameraSupervisor::Config &cfg) {
    // ---------------------------- [supervisor] ---------------------------
    const auto *sup = sub_table(tbl, "supervisor");
    if (!sup) return;
    read_optional(*sup, "restart_initial_ms", cfg.restart_initial_ms);
    read_optional(*sup, "restart_max_ms", cfg.restart_max_ms);
    read_optional(*sup, "shutdown_timeout_ms", cfg.shutdown_timeout_ms);
    read_optional(*sup, "poll_ms", cfg.poll_ms);
    read_optional(*sup, "status_interval_ms", cfg.status_interval_ms);
    read_optional(*sup, "start_stagger_ms", cfg.start_stagger_ms);

    if (cfg.restart_initial_ms < 0 || cfg.restart_max_ms < cfg.restart_initial_ms) {
        throw ConfigError("supervisor: need 0 <= restart_initial_ms <= restart_max_ms");
    }
    if (cfg.shutdown_timeout_ms < 0 || cfg.poll_ms <= 0 || cfg.start_stagger_ms < 0) {
        throw ConfigError("supervisor: invalid timing values");
    }
}

Roi read_roi(const toml::table &tbl) {
    const auto *arr = tbl.get_as<toml::array>("roi");
    if (!arr || arr->size() != 4) {
        throw ConfigError("roi must be an array [x1, y1, x2, y2]");
    }
    float v[4];
    for (size_t i = 0; i < 4; ++i) {
        const auto d = arr->get(i)->value<double>();
        if (!d) {
            throw ConfigError("roi values must be numbers");
        }
        v[i] = static_cast<float>(*d);
    }
    return Roi{v[0], v[1], v[2], v[3]};
}

// Общие ключи для [defaults] и [[cameras]].
void apply_camera_table(const toml::table &tbl, CameraConfig &cam) {
    CameraWorker::Config &w = cam.worker;

    if (const auto *arr = tbl.get("classes")) {
        const auto *classes = arr->as_array();
        if (!classes) {
            throw ConfigError("classes must be an array of strings");
        }
        w.classes.clear();
        for (const auto &node : *classes) {
            const auto s = node.value<std::string>();
            if (!s) {
                throw ConfigError("classes must be an array of strings");
            }
            w.classes.insert(*s);
        }
    }
    read_optional(tbl, "confidence", w.confidence);
    read_optional(tbl, "save_directory", w.save_directory);
    read_optional(tbl, "save_snapshots", w.save_snapshots);

    if (const auto *motion = sub_table(tbl, "motion")) {
        read_optional(*motion, "enabled", w.motion.enabled);
        read_optional(*motion, "threshold", w.motion.threshold);
        read_optional(*motion, "blur_kernel", w.motion.blur_kernel);
        read_optional(*motion, "min_area", w.motion.min_area);
        read_optional(*motion, "skip_frames", w.motion.skip_frames);
        read_optional(*motion, "force_interval", w.motion.force_interval);
    }
    if (const auto *tracking = sub_table(tbl, "tracking")) {
        read_optional(*tracking, "distance_threshold", w.tracking.distance_threshold);
        read_optional(*tracking, "max_missing_frames", w.tracking.max_missing_frames);
    }
    if (const auto *linger = sub_table(tbl, "linger")) {
        read_optional(*linger, "enabled", w.linger_enabled);
        if (linger->contains("roi")) w.roi = read_roi(*linger);
        read_optional(*linger, "linger_time_seconds", w.linger.linger_time_sec);
        read_optional(*linger, "cooldown_seconds", w.linger.cooldown_sec);
    }
    if (const auto *source = sub_table(tbl, "source")) {
        read_optional(*source, "read_timeout_ms", w.read_timeout_ms);
        read_optional(*source, "no_frame_timeout_ms", w.no_frame_timeout_ms);
        read_optional(*source, "reconnect_initial_ms", w.reconnect_initial_ms);
        read_optional(*source, "reconnect_max_ms", w.reconnect_max_ms);
        read_optional(*source, "state_grace_ms", w.state_grace_ms);
        read_optional(*source, "latency_ms", cam.source.latency_ms);
        read_optional(*source, "protocols", cam.source.protocols);
        read_optional(*source, "timeout_us", cam.source.timeout_us);
        read_optional(*source, "start_timeout_ms", cam.source.start_timeout_ms);
    }
}

void apply_logging(const LoggingConfig &log, CameraConfig &cam) {
    cam.worker.verbose = log.worker;
    cam.worker.motion.verbose = log.motion;
    cam.worker.tracking.verbose = log.tracker;
    cam.worker.linger.verbose = log.linger;
    cam.source.verbose = log.gst;
}

} // namespace

void validate_camera(const CameraConfig &cfg) {
    const CameraWorker::Config &w = cfg.worker;
    if (cfg.name.empty()) {
        throw ConfigError("camera name is empty");
    }
    if (cfg.source.url.empty()) {
        throw ConfigError("url is empty");
    }
    if (w.confidence < 0.0f || w.confidence > 1.0f) {
        throw ConfigError("confidence must be in [0, 1]");
    }
    if (w.motion.blur_kernel <= 0) {
        throw ConfigError("motion.blur_kernel must be > 0");
    }
    if (w.motion.min_area < 0.0) {
        throw ConfigError("motion.min_area must be >= 0");
    }
    if (w.motion.enabled && w.motion.force_interval <= 0) {
        throw ConfigError("motion.force_interval must be > 0 while motion gating is enabled");
    }
    if (w.motion.threshold < 0 || w.motion.threshold > 255) {
        throw ConfigError("motion.threshold must be in [0, 255]");
    }
    if (w.tracking.distance_threshold <= 0.0f) {
        throw ConfigError("tracking.distance_threshold must be > 0");
    }
    if (w.tracking.max_missing_frames < 0) {
        throw ConfigError("tracking.max_missing_frames must be >= 0");
    }
    if (w.linger_enabled) {
        if (!w.roi.valid()) {
            throw ConfigError("linger.roi must satisfy x2 > x1 and y2 > y1");
        }
        if (w.linger.linger_time_sec <= 0.0) {
            throw ConfigError("linger.linger_time_seconds must be > 0");
        }
        if (w.linger.cooldown_sec < 0.0) {
            throw ConfigError("linger.cooldown_seconds must be >= 0");
        }
    }
    if (w.read_timeout_ms <= 0 || w.no_frame_timeout_ms <= 0) {
        throw ConfigError("source timeouts must be > 0");
    }
    if (w.reconnect_initial_ms < 0 || w.reconnect_max_ms < w.reconnect_initial_ms) {
        throw ConfigError("source: need 0 <= reconnect_initial_ms <= reconnect_max_ms");
    }
    if (w.state_grace_ms < 0) {
        throw ConfigError("source.state_grace_ms must be >= 0");
    }
}

AppConfig parse_app_config(const toml::table &tbl) {
    AppConfig app;
    load_logging(tbl, app.logging);
    load_detector(tbl, app.detector);
    app.detector.verbose = app.logging.detector;

    CameraConfig defaults;
    load_alerting(tbl, app.alerting, defaults.worker.alerting);
    load_supervisor(tbl, app.supervisor);
    app.supervisor.verbose = app.logging.supervisor;

    // --------------------------- [defaults] ---------------------------
    if (const auto *d = sub_table(tbl, "defaults")) {
        apply_camera_table(*d, defaults);
    }

    // --------------------------- [[cameras]] --------------------------
    const auto *cameras = tbl.get_as<toml::array>("cameras");
    if (!cameras || cameras->empty()) {
        throw ConfigError("no [[cameras]] entries");
    }

    std::set<std::string> names;
    for (size_t i = 0; i < cameras->size(); ++i) {
        std::string label = "#" + std::to_string(i);
        try {
            const auto *t = cameras->get(i)->as_table();
            if (!t) {
                throw ConfigError("entry is not a table");
            }
            CameraConfig cam = defaults;
            cam.name = read_required<std::string>(*t, "name");
            label = cam.name;
            cam.source.url = read_required<std::string>(*t, "url");
            apply_camera_table(*t, cam);
            cam.worker.name = cam.name;
            apply_logging(app.logging, cam);

            validate_camera(cam);
            if (!names.insert(cam.name).second) {
                throw ConfigError("duplicate camera name");
            }
            app.cameras.push_back(std::move(cam));
        } catch (const ConfigError &e) {
            std::cerr << "[CFG] camera " << label << " rejected: " << e.what() << std::endl;
            app.rejected.push_back(label + ": " + e.what());
        }
    }

    if (app.cameras.empty()) {
        throw ConfigError("no valid cameras configured");
    }
    return app;
}

AppConfig load_app_config(const std::string &path) {
    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error &e) {
        std::ostringstream oss;
        oss << "failed to parse " << path << ": " << e.description()
            << " (line " << e.source().begin.line << ")";
        throw ConfigError(oss.str());
    }
    return parse_app_config(tbl);
}
