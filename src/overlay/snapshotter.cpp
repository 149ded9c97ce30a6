#include "overlay/snapshotter.h"
#include "core/errors.h"

#include <opencv2/imgcodecs.hpp>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace {
    // Имя камеры попадает в имя файла.
    std::string sanitize(const std::string& s) {
        std::string out = s;
        for (char& c : out) {
            if (c == '/' || c == '\\' || c == ' ' || c == ':') c = '_';
        }
        return out;
    }
}

Snapshotter::Snapshotter(const Config& cfg) : cfg_(cfg) {}

void Snapshotter::save(const cv::Mat& frame, const std::string& path) const {
    if (frame.empty()) {
        throw RenderError("empty snapshot frame");
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw RenderError("cannot create " + parent.string() + ": " + ec.message());
        }
    }

    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, cfg_.jpg_quality};
    bool ok = false;
    try {
        ok = cv::imwrite(path, frame, params);
    } catch (const cv::Exception& e) {
        throw RenderError("imwrite " + path + ": " + e.what());
    }
    if (!ok) {
        throw RenderError("imwrite failed: " + path);
    }
}

std::string Snapshotter::make_path(const std::string& dir,
                                   const std::string& camera,
                                   const std::string& kind,
                                   std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            when.time_since_epoch()).count() % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream name;
    name << sanitize(camera) << "_" << kind << "_"
         << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_"
         << std::setw(3) << std::setfill('0') << ms << ".jpg";
    return (std::filesystem::path(dir) / name.str()).string();
}
