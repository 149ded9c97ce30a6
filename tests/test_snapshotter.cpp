#include <gtest/gtest.h>

#include <ctime>
#include <filesystem>

#include "core/errors.h"
#include "overlay/overlay_renderer.h"
#include "overlay/snapshotter.h"

namespace fs = std::filesystem;

TEST(Snapshotter, PathCarriesCameraKindAndLocalTime) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 5;
    tm.tm_hour = 14;
    tm.tm_min = 7;
    tm.tm_sec = 9;
    tm.tm_isdst = -1;
    const auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm)) +
                      std::chrono::milliseconds(42);

    const std::string path = Snapshotter::make_path("/tmp/snaps", "front door", "linger", when);
    EXPECT_EQ(path, "/tmp/snaps/front_door_linger_20240305_140709_042.jpg");
}

TEST(Snapshotter, SaveCreatesDirectoryAndFile) {
    const fs::path dir = fs::path(::testing::TempDir()) / "linger_snapshot_test";
    fs::remove_all(dir);
    const std::string path = (dir / "a" / "shot.jpg").string();

    Snapshotter snap(Snapshotter::Config{});
    snap.save(cv::Mat(48, 64, CV_8UC3, cv::Scalar(0, 128, 255)), path);

    ASSERT_TRUE(fs::exists(path));
    EXPECT_GT(fs::file_size(path), 0u);
    fs::remove_all(dir);
}

TEST(Snapshotter, EmptyFrameThrows) {
    Snapshotter snap(Snapshotter::Config{});
    EXPECT_THROW(snap.save(cv::Mat(), ::testing::TempDir() + "never.jpg"), RenderError);
}

TEST(OverlayRenderer, DrawsOnCopy) {
    const cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(0, 0, 0));
    TrackedObject obj;
    obj.id = 4;
    obj.label = "person";
    obj.box = cv::Rect2f(20, 20, 40, 60);
    obj.centroid = cv::Point2f(40, 50);
    const Roi roi{10, 10, 100, 100};

    OverlayRenderer renderer(OverlayRenderer::Config{});
    const cv::Mat out = renderer.render(frame, {obj}, &roi, {{4, 6.5}}, "cam");

    ASSERT_EQ(out.size(), frame.size());
    EXPECT_EQ(cv::countNonZero(frame.reshape(1)), 0);
    EXPECT_GT(cv::countNonZero(out.reshape(1)), 0);
}

TEST(OverlayRenderer, EmptyFrameThrows) {
    OverlayRenderer renderer(OverlayRenderer::Config{});
    EXPECT_THROW(renderer.render(cv::Mat(), {}, nullptr, {}, ""), RenderError);
}
