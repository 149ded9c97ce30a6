#pragma once

#include <opencv2/core.hpp>
#include <chrono>
#include <string>

// Сохраняет аннотированные кадры алертов в JPEG.
class Snapshotter {
public:
    struct Config {
        int jpg_quality = 90;
    };

    explicit Snapshotter(const Config& cfg);

    // Создаёт каталог при необходимости. Бросает RenderError.
    void save(const cv::Mat& frame, const std::string& path) const;

    // <dir>/<camera>_<kind>_<YYYYmmdd_HHMMSS>_<ms>.jpg, время локальное.
    static std::string make_path(const std::string& dir,
                                 const std::string& camera,
                                 const std::string& kind,
                                 std::chrono::system_clock::time_point when);

private:
    Config cfg_;
};
