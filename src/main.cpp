#include <gst/gst.h>
#include <atomic>
#include <chrono>
#include <signal.h>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "config.h"
#include "detect/detector.h"
#include "io/gst_frame_source.h"
#include "notify/event_log_notifier.h"
#include "notify/notify_dispatcher.h"
#include "overlay/overlay_renderer.h"
#include "overlay/snapshotter.h"
#include "pipeline/camera_supervisor.h"
#include "pipeline/camera_worker.h"


static std::atomic<bool> g_running{true};

static void on_terminate(int) {
    g_running.store(false);
}


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    gst_init(&argc, &argv);

    const std::string config_path = argc > 1 ? argv[1] : "config.toml";

    // получаем конфигурацию из config.toml
    AppConfig app;
    try {
        app = load_app_config(config_path);
    } catch (const ConfigError &e) {
        std::cerr << "config error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "loaded " << config_path << ": cameras=" << app.cameras.size()
              << " rejected=" << app.rejected.size() << std::endl;

    // Детектор: один общий экземпляр или по экземпляру на каждый запуск воркера.
    // Без shared_instance модели грузят сами воркеры (ошибка загрузки = падение воркера).
    std::shared_ptr<Detector> shared_detector;
    if (app.detector.shared_instance) {
        try {
            shared_detector = make_detector(app.detector);
        } catch (const std::exception &e) {
            std::cerr << "detector init failed: " << e.what() << std::endl;
            return 1;
        }
    }

    NotifyDispatcher::Config ncfg;
    ncfg.queue_size = app.alerting.queue_size;
    ncfg.verbose = app.logging.notify;
    auto dispatcher = std::make_shared<NotifyDispatcher>(ncfg);
    if (!app.alerting.events_jsonl.empty()) {
        dispatcher->add_sink(std::make_shared<EventLogNotifier>(app.alerting.events_jsonl));
    }
    dispatcher->start();

    auto renderer = std::make_shared<const OverlayRenderer>(OverlayRenderer::Config{});
    Snapshotter::Config scfg;
    scfg.jpg_quality = app.alerting.jpg_quality;
    auto snapshotter = std::make_shared<const Snapshotter>(scfg);

    CameraSupervisor supervisor(app.supervisor);
    for (const auto &cam : app.cameras) {
        const DetectorConfig dcfg = app.detector;
        supervisor.add_camera(cam.name, [cam, dcfg, shared_detector, dispatcher, renderer, snapshotter]() {
            std::shared_ptr<Detector> detector = dcfg.shared_instance ? shared_detector : make_detector(dcfg);
            CameraWorker::Outputs outputs;
            outputs.notifier = dispatcher;
            outputs.renderer = renderer;
            outputs.snapshotter = snapshotter;
            return std::make_shared<CameraWorker>(
                    cam.worker,
                    std::make_unique<GstFrameSource>(cam.source, cam.name),
                    detector,
                    outputs);
        });
    }

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_terminate;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    supervisor.start();

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (supervisor.all_finished()) {
            std::cout << "all cameras finished" << std::endl;
            break;
        }
    }

    const bool clean = supervisor.shutdown();
    dispatcher->stop();
    std::cout << "alerts delivered=" << dispatcher->delivered()
              << " failed=" << dispatcher->failed()
              << " dropped=" << dispatcher->dropped() << std::endl;

    // Брошенные воркеры ещё могут держать пайплайны.
    if (clean) gst_deinit();
    return clean ? 0 : 2;
}
