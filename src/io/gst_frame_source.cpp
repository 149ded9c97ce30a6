#include "io/gst_frame_source.h"
#include "core/errors.h"
#include "util/time_util.h"

#include <opencv2/core.hpp>
#include <cstring>
#include <iostream>

GstFrameSource::GstFrameSource(const Config& cfg, std::string tag)
        : cfg_(cfg), tag_(std::move(tag)) {}

GstFrameSource::~GstFrameSource() {
    close();
}

std::string GstFrameSource::to_uri(const std::string& url) {
    if (gst_uri_is_valid(url.c_str())) return url;

    GError* err = nullptr;
    gchar* uri = gst_filename_to_uri(url.c_str(), &err);
    if (!uri) {
        std::string msg = err ? err->message : "invalid location";
        if (err) g_error_free(err);
        throw AcquisitionError("cannot convert '" + url + "' to URI: " + msg, true);
    }
    std::string out(uri);
    g_free(uri);
    return out;
}

void GstFrameSource::open() {
    if (cfg_.url.empty()) {
        throw AcquisitionError("empty source url", true);
    }
    close();
    store_.reset();
    gotFirstSample_.store(false, std::memory_order_release);

    buildPipeline();

    // Запускаем пайплайн.
    gst_element_set_state(pipeline_, GST_STATE_PLAYING);

    // Ждём перехода в PLAYING ограниченное время. ASYNC/NO_PREROLL для live-источников нормальны.
    GstState cur = GST_STATE_NULL, pending = GST_STATE_NULL;
    const GstStateChangeReturn ret = gst_element_get_state(
            pipeline_, &cur, &pending,
            static_cast<GstClockTime>(cfg_.start_timeout_ms) * GST_MSECOND);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        std::string detail = "state change FAILURE on start";
        // Причина обычно лежит на bus.
        GstMessage* msg = gst_bus_pop_filtered(bus_, GST_MESSAGE_ERROR);
        if (msg) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            if (err) detail = err->message;
            if (err) g_error_free(err);
            if (dbg) g_free(dbg);
            gst_message_unref(msg);
        }
        teardownPipeline();
        throw AcquisitionError("[" + tag_ + "] " + detail, false);
    }

    if (cfg_.verbose) {
        std::cout << "[GST:" << tag_ << "] pipeline started: " << cfg_.url << std::endl;
    }
}

ReadStatus GstFrameSource::read(Frame& out, int timeout_ms) {
    if (!pipeline_) {
        throw AcquisitionError("[" + tag_ + "] source is not open", false);
    }
    if (!drainBus()) return ReadStatus::EndOfStream;

    cv::Mat image;
    long long ts = 0;
    if (!store_.waitFrame(image, ts, timeout_ms)) {
        // EOS мог прийти, пока ждали.
        if (!drainBus()) return ReadStatus::EndOfStream;
        return ReadStatus::Timeout;
    }
    out.image = std::move(image);
    out.ts_ms = ts;
    return ReadStatus::Ok;
}

void GstFrameSource::close() {
    store_.stop();
    teardownPipeline();
}

bool GstFrameSource::drainBus() {
    while (GstMessage* msg = gst_bus_pop_filtered(
            bus_, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS))) {
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS) {
            gst_message_unref(msg);
            if (cfg_.verbose) {
                std::cout << "[GST:" << tag_ << "] EOS" << std::endl;
            }
            return false;
        }

        GError* err = nullptr;
        gchar* dbg = nullptr;
        gst_message_parse_error(msg, &err, &dbg);
        const std::string text = err ? err->message : "(null)";
        if (cfg_.verbose && dbg) {
            std::cerr << "[GST:" << tag_ << "] debug: " << dbg << std::endl;
        }
        if (err) g_error_free(err);
        if (dbg) g_free(dbg);
        gst_message_unref(msg);
        throw AcquisitionError("[" + tag_ + "] " + text, false);
    }
    return true;
}

void GstFrameSource::buildPipeline() {
    // uridecodebin даёт динамический src pad -> подключаем в onPadAdded().
    pipeline_ = gst_pipeline_new(("src-" + tag_).c_str());
    src_      = gst_element_factory_make("uridecodebin", nullptr);
    convert_  = gst_element_factory_make("videoconvert", nullptr);
    caps_     = gst_element_factory_make("capsfilter", nullptr);
    sink_     = gst_element_factory_make("appsink", nullptr);

    if (!pipeline_ || !src_ || !convert_ || !caps_ || !sink_) {
        // Элементы, не попавшие в bin, освобождаем сами.
        for (GstElement* e : {src_, convert_, caps_, sink_}) {
            if (e) gst_object_unref(e);
        }
        if (pipeline_) gst_object_unref(pipeline_);
        pipeline_ = src_ = convert_ = caps_ = sink_ = nullptr;
        throw AcquisitionError("[" + tag_ + "] failed to create GStreamer elements "
                               "(uridecodebin/videoconvert/capsfilter/appsink)", true);
    }

    const std::string uri = to_uri(cfg_.url);
    g_object_set(G_OBJECT(src_), "uri", uri.c_str(), nullptr);

    GstCaps* caps = gst_caps_from_string("video/x-raw,format=BGR");
    g_object_set(G_OBJECT(caps_), "caps", caps, nullptr);
    gst_caps_unref(caps);

    // appsink: минимальная задержка, отдаём только последний кадр.
    g_object_set(G_OBJECT(sink_), "emit-signals", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "sync", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "max-buffers", 1, nullptr);
    g_object_set(G_OBJECT(sink_), "drop", TRUE, nullptr);

    GstAppSinkCallbacks cbs{};
    cbs.new_sample = &GstFrameSource::onNewSample;
    gst_app_sink_set_callbacks(GST_APP_SINK(sink_), &cbs, this, nullptr);

    g_signal_connect(src_, "pad-added", G_CALLBACK(&GstFrameSource::onPadAdded), this);
    g_signal_connect(src_, "source-setup", G_CALLBACK(&GstFrameSource::onSourceSetup), this);

    gst_bin_add_many(GST_BIN(pipeline_), src_, convert_, caps_, sink_, nullptr);

    if (!gst_element_link_many(convert_, caps_, sink_, nullptr)) {
        teardownPipeline();
        throw AcquisitionError("[" + tag_ + "] failed to link videoconvert->capsfilter->appsink", true);
    }

    bus_ = gst_element_get_bus(pipeline_);
}

void GstFrameSource::teardownPipeline() {
    if (!pipeline_) return;

    gst_element_set_state(pipeline_, GST_STATE_NULL);
    GstState cur = GST_STATE_NULL, pending = GST_STATE_NULL;
    gst_element_get_state(pipeline_, &cur, &pending,
                          static_cast<GstClockTime>(cfg_.stop_timeout_ms) * GST_MSECOND);

    if (bus_) {
        gst_object_unref(bus_);
        bus_ = nullptr;
    }
    // unref pipeline освобождает всё дерево элементов.
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;
    src_ = convert_ = caps_ = sink_ = nullptr;
}

GstFlowReturn GstFrameSource::onNewSample(GstAppSink* sink, gpointer user_data) {
    auto* self = static_cast<GstFrameSource*>(user_data);
    if (!self) return GST_FLOW_ERROR;

    GstSample* sample = gst_app_sink_pull_sample(sink);
    if (!sample) return GST_FLOW_ERROR;

    GstBuffer* buffer = gst_sample_get_buffer(sample);
    GstCaps* caps = gst_sample_get_caps(sample);
    if (!buffer || !caps) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    GstStructure* s = gst_caps_get_structure(caps, 0);
    int width = 0, height = 0;
    gst_structure_get_int(s, "width", &width);
    gst_structure_get_int(s, "height", &height);
    if (width <= 0 || height <= 0) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    GstMapInfo map{};
    if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }

    // BGR: строки выровнены по 4 байта.
    const size_t stride = (static_cast<size_t>(width) * 3 + 3) & ~static_cast<size_t>(3);
    if (map.size < stride * static_cast<size_t>(height)) {
        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return GST_FLOW_ERROR;
    }
    cv::Mat bgr = cv::Mat(height, width, CV_8UC3, static_cast<void*>(map.data), stride).clone();

    gst_buffer_unmap(buffer, &map);
    gst_sample_unref(sample);

    if (!self->gotFirstSample_.exchange(true, std::memory_order_acq_rel) && self->cfg_.verbose) {
        std::cout << "[GST:" << self->tag_ << "] first sample " << width << "x" << height << std::endl;
    }

    self->store_.setFrame(std::move(bgr), now_steady_ms());
    return GST_FLOW_OK;
}

void GstFrameSource::onPadAdded(GstElement*, GstPad* new_pad, gpointer user_data) {
    auto* self = static_cast<GstFrameSource*>(user_data);
    if (!self || !self->convert_) return;

    GstCaps* caps = gst_pad_get_current_caps(new_pad);
    if (!caps) caps = gst_pad_query_caps(new_pad, nullptr);
    if (!caps) return;

    // Аудио и прочие потоки не подключаем.
    GstStructure* str = gst_caps_get_structure(caps, 0);
    const char* name = gst_structure_get_name(str);
    if (!name || std::strncmp(name, "video/x-raw", 11) != 0) {
        gst_caps_unref(caps);
        return;
    }

    GstPad* sinkpad = gst_element_get_static_pad(self->convert_, "sink");
    if (!sinkpad) {
        gst_caps_unref(caps);
        return;
    }
    if (!gst_pad_is_linked(sinkpad)) {
        const GstPadLinkReturn ret = gst_pad_link(new_pad, sinkpad);
        if (ret != GST_PAD_LINK_OK) {
            std::cerr << "[GST:" << self->tag_ << "] pad link failed: " << ret << std::endl;
        } else if (self->cfg_.verbose) {
            std::cout << "[GST:" << self->tag_ << "] linked " << name << std::endl;
        }
    }
    gst_object_unref(sinkpad);
    gst_caps_unref(caps);
}

void GstFrameSource::onSourceSetup(GstElement*, GstElement* source, gpointer user_data) {
    auto* self = static_cast<GstFrameSource*>(user_data);
    if (!self || !source) return;

    // Свойства есть только у rtspsrc; для файлов/http пропускаем.
    GObjectClass* klass = G_OBJECT_GET_CLASS(source);
    GParamSpec* latency = g_object_class_find_property(klass, "latency");
    if (latency && G_PARAM_SPEC_VALUE_TYPE(latency) == G_TYPE_UINT) {
        g_object_set(G_OBJECT(source), "latency", static_cast<guint>(self->cfg_.latency_ms), nullptr);
    }
    if (!self->cfg_.protocols.empty() && g_object_class_find_property(klass, "protocols")) {
        gst_util_set_object_arg(G_OBJECT(source), "protocols", self->cfg_.protocols.c_str());
    }
    GParamSpec* timeout = g_object_class_find_property(klass, "timeout");
    if (timeout && G_PARAM_SPEC_VALUE_TYPE(timeout) == G_TYPE_UINT64) {
        g_object_set(G_OBJECT(source), "timeout", self->cfg_.timeout_us, nullptr);
    }
    if (self->cfg_.verbose) {
        std::cout << "[GST:" << self->tag_ << "] source-setup: " << G_OBJECT_TYPE_NAME(source) << std::endl;
    }
}
