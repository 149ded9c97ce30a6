#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <atomic>
#include <string>

#include "core/frame_store.h"
#include "io/frame_source.h"

// uridecodebin -> videoconvert -> capsfilter(BGR) -> appsink.
// Кадры из потока appsink попадают в FrameStore, read() их забирает
// и параллельно разбирает сообщения bus (ERROR/EOS).
class GstFrameSource : public FrameSource {
public:
    struct Config {
        std::string url;                // - rtsp://..., http://..., file:///... или путь к файлу.
        int latency_ms = 200;           // - rtspsrc latency.
        std::string protocols = "tcp";  // - rtspsrc protocols ("tcp", "udp", "udp+tcp"), пусто = по умолчанию.
        guint64 timeout_us = 5000000;   // - rtspsrc timeout.
        int start_timeout_ms = 5000;    // - ожидание перехода в PLAYING.
        int stop_timeout_ms = 2000;     // - ожидание перехода в NULL.
        bool verbose = false;
    };

    GstFrameSource(const Config& cfg, std::string tag);
    ~GstFrameSource() override;

    GstFrameSource(const GstFrameSource&) = delete;
    GstFrameSource& operator=(const GstFrameSource&) = delete;

    void open() override;
    ReadStatus read(Frame& out, int timeout_ms) override;
    void close() override;
    std::string describe() const override { return cfg_.url; }

    uint64_t dropped_frames() const { return store_.dropped(); }

    // Путь к файлу -> file:// URI, URI остаётся как есть.
    static std::string to_uri(const std::string& url);

private:
    void buildPipeline();
    void teardownPipeline();
    // false = EOS. Ошибки bus -> AcquisitionError.
    bool drainBus();

    static GstFlowReturn onNewSample(GstAppSink* appsink, gpointer user_data);
    static void onPadAdded(GstElement* src, GstPad* new_pad, gpointer user_data);
    static void onSourceSetup(GstElement* bin, GstElement* source, gpointer user_data);

    Config cfg_;
    std::string tag_;
    FrameStore store_;
    std::atomic<bool> gotFirstSample_{false};

    GstElement* pipeline_{nullptr};
    GstElement* src_{nullptr};
    GstElement* convert_{nullptr};
    GstElement* caps_{nullptr};
    GstElement* sink_{nullptr};
    GstBus* bus_{nullptr};
};
