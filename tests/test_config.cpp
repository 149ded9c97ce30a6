#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string_view>

#include "config.h"

using namespace std::string_view_literals;

namespace {

constexpr std::string_view kBase = R"(
[logging]
worker = false
tracker = true

[detector]
model_path = "model.onnx"

[alerting]
general_cooldown_seconds = 30

[supervisor]
restart_initial_ms = 250

[defaults]
classes = ["person", "car"]
confidence = 0.6

[defaults.linger]
roi = [10, 20, 300, 400]
linger_time_seconds = 4

[defaults.source]
state_grace_ms = 1500
)"sv;

AppConfig parse(std::string_view cameras) {
    std::string doc(kBase);
    doc += cameras;
    return parse_app_config(toml::parse(doc));
}

} // namespace

TEST(Config, DefaultsApplyToEveryCamera) {
    const AppConfig app = parse(R"(
[[cameras]]
name = "a"
url = "rtsp://a"

[[cameras]]
name = "b"
url = "rtsp://b"
confidence = 0.3
linger.linger_time_seconds = 9
source.latency_ms = 50
)"sv);

    ASSERT_EQ(app.cameras.size(), 2u);
    EXPECT_TRUE(app.rejected.empty());
    EXPECT_EQ(app.detector.model_path, "model.onnx");
    EXPECT_EQ(app.detector.backend, "opencv_dnn");
    EXPECT_EQ(app.supervisor.restart_initial_ms, 250);

    const CameraConfig &a = app.cameras[0];
    EXPECT_EQ(a.name, "a");
    EXPECT_EQ(a.worker.name, "a");
    EXPECT_EQ(a.source.url, "rtsp://a");
    EXPECT_FLOAT_EQ(a.worker.confidence, 0.6f);
    EXPECT_EQ(a.worker.classes, (std::set<std::string>{"person", "car"}));
    EXPECT_FLOAT_EQ(a.worker.roi.x1, 10.0f);
    EXPECT_FLOAT_EQ(a.worker.roi.y2, 400.0f);
    EXPECT_DOUBLE_EQ(a.worker.linger.linger_time_sec, 4.0);
    EXPECT_EQ(a.worker.state_grace_ms, 1500);
    EXPECT_DOUBLE_EQ(a.worker.alerting.general_cooldown_sec, 30.0);

    const CameraConfig &b = app.cameras[1];
    EXPECT_FLOAT_EQ(b.worker.confidence, 0.3f);
    EXPECT_DOUBLE_EQ(b.worker.linger.linger_time_sec, 9.0);
    EXPECT_EQ(b.source.latency_ms, 50);
    EXPECT_FLOAT_EQ(b.worker.roi.x1, 10.0f);
}

TEST(Config, LoggingFlagsReachComponents) {
    const AppConfig app = parse(R"(
[[cameras]]
name = "a"
url = "rtsp://a"
)"sv);
    ASSERT_EQ(app.cameras.size(), 1u);
    EXPECT_FALSE(app.cameras[0].worker.verbose);
    EXPECT_TRUE(app.cameras[0].worker.tracking.verbose);
    EXPECT_TRUE(app.cameras[0].worker.linger.verbose);
    EXPECT_FALSE(app.cameras[0].worker.motion.verbose);
}

TEST(Config, InvalidCameraIsRejectedOthersKept) {
    const AppConfig app = parse(R"(
[[cameras]]
name = "good"
url = "rtsp://good"

[[cameras]]
name = "bad_conf"
url = "rtsp://x"
confidence = 1.5

[[cameras]]
name = "bad_roi"
url = "rtsp://y"
linger.roi = [300, 20, 10, 400]

[[cameras]]
name = "good"
url = "rtsp://dup"

[[cameras]]
name = "no_url"

[[cameras]]
name = "bad_type"
url = "rtsp://z"
confidence = "high"
)"sv);

    ASSERT_EQ(app.cameras.size(), 1u);
    EXPECT_EQ(app.cameras[0].source.url, "rtsp://good");
    EXPECT_EQ(app.rejected.size(), 5u);
}

TEST(Config, ForcedCheckIntervalRequiredWhileGateEnabled) {
    const AppConfig app = parse(R"(
[[cameras]]
name = "no_guard"
url = "rtsp://a"
motion.force_interval = 0

[[cameras]]
name = "negative"
url = "rtsp://b"
motion.force_interval = -5

[[cameras]]
name = "gate_off"
url = "rtsp://c"
motion.enabled = false
motion.force_interval = 0

[[cameras]]
name = "default"
url = "rtsp://d"
)"sv);

    ASSERT_EQ(app.cameras.size(), 2u);
    EXPECT_EQ(app.cameras[0].name, "gate_off");
    EXPECT_FALSE(app.cameras[0].worker.motion.enabled);
    EXPECT_EQ(app.cameras[1].name, "default");
    EXPECT_GT(app.cameras[1].worker.motion.force_interval, 0);
    EXPECT_EQ(app.rejected.size(), 2u);
}

TEST(Config, PerWorkerDetectorMode) {
    const std::string doc = R"(
[detector]
model_path = "m.onnx"
shared_instance = false

[[cameras]]
name = "a"
url = "rtsp://a"
linger.enabled = false
)";
    const AppConfig app = parse_app_config(toml::parse(doc));
    EXPECT_FALSE(app.detector.shared_instance);

    const AppConfig def = parse(R"(
[[cameras]]
name = "a"
url = "rtsp://a"
)"sv);
    EXPECT_TRUE(def.detector.shared_instance);
}

TEST(Config, LingerDisabledNeedsNoRoi) {
    const std::string doc = R"(
[detector]
model_path = "m.onnx"

[[cameras]]
name = "a"
url = "rtsp://a"
linger.enabled = false
)";
    const AppConfig app = parse_app_config(toml::parse(doc));
    ASSERT_EQ(app.cameras.size(), 1u);
    EXPECT_FALSE(app.cameras[0].worker.linger_enabled);
}

TEST(Config, MissingDetectorTableIsFatal) {
    const std::string doc = R"(
[[cameras]]
name = "a"
url = "rtsp://a"
linger.enabled = false
)";
    EXPECT_THROW(parse_app_config(toml::parse(doc)), ConfigError);
}

TEST(Config, UnknownBackendIsFatal) {
    const std::string doc = R"(
[detector]
model_path = "m.onnx"
backend = "tensorrt"

[[cameras]]
name = "a"
url = "rtsp://a"
linger.enabled = false
)";
    EXPECT_THROW(parse_app_config(toml::parse(doc)), ConfigError);
}

TEST(Config, NoValidCamerasIsFatal) {
    EXPECT_THROW(parse(""sv), ConfigError);
    EXPECT_THROW(parse(R"(
[[cameras]]
name = "a"
url = ""
)"sv),
                 ConfigError);
}

TEST(Config, SyntaxErrorBecomesConfigError) {
    const std::string path = ::testing::TempDir() + "linger_bad_config.toml";
    {
        std::ofstream f(path);
        f << "[detector\nmodel_path = \n";
    }
    EXPECT_THROW(load_app_config(path), ConfigError);
    std::remove(path.c_str());

    EXPECT_THROW(load_app_config("/nonexistent/dir/config.toml"), ConfigError);
}
