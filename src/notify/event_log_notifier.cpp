#include "notify/event_log_notifier.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {
    std::string escape(const std::string& s) {
        std::ostringstream oss;
        for (char c : s) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(static_cast<unsigned char>(c))
                            << std::dec << std::setfill(' ');
                    } else {
                        oss << c;
                    }
            }
        }
        return oss.str();
    }

    void write_box(std::ostringstream& oss, const cv::Rect2f& b) {
        oss << "[" << b.x << "," << b.y << "," << (b.x + b.width) << "," << (b.y + b.height) << "]";
    }
}

EventLogNotifier::EventLogNotifier(std::string path) : path_(std::move(path)) {}

std::string EventLogNotifier::to_json(const AlertEvent& event) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "{";
    oss << "\"type\":\"" << alert_kind_name(event.kind) << "\",";
    oss << "\"camera\":\"" << escape(event.camera) << "\",";
    oss << "\"ts_ms\":" << event.ts_ms << ",";
    if (event.kind == AlertKind::Linger) {
        oss << "\"track_id\":" << event.track_id << ",";
        oss << "\"dwell_sec\":" << event.dwell_sec << ",";
        oss << "\"roi\":[" << event.roi.x1 << "," << event.roi.y1 << ","
            << event.roi.x2 << "," << event.roi.y2 << "],";
    }
    oss << "\"label\":\"" << escape(event.label) << "\",";
    oss << "\"box\":";
    write_box(oss, event.box);
    oss << ",\"objects\":[";
    bool first = true;
    for (const auto& d : event.objects) {
        if (!first) oss << ",";
        first = false;
        oss << "{\"label\":\"" << escape(d.label) << "\",\"confidence\":" << d.confidence << ",\"box\":";
        write_box(oss, d.box);
        oss << "}";
    }
    oss << "],";
    oss << "\"snapshot\":\"" << escape(event.snapshot_path) << "\"";
    oss << "}";
    return oss.str();
}

bool EventLogNotifier::notify(const AlertEvent& event) {
    const std::string line = to_json(event);

    std::lock_guard<std::mutex> lock(mu_);
    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[NTF] cannot create " << parent.string() << ": " << ec.message() << std::endl;
            return false;
        }
    }
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        std::cerr << "[NTF] unable to open events file: " << path_ << std::endl;
        return false;
    }
    f << line << '\n';
    return static_cast<bool>(f);
}
