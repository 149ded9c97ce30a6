#include <gtest/gtest.h>

#include "linger/linger_monitor.h"

namespace {

const Roi kRoi{100.0f, 100.0f, 300.0f, 300.0f};

TrackedObject object_at(int id, float cx, float cy, int missing = 0) {
    TrackedObject o;
    o.id = id;
    o.box = cv::Rect2f(cx - 10.0f, cy - 20.0f, 20.0f, 40.0f);
    o.centroid = cv::Point2f(cx, cy);
    o.label = "person";
    o.missing_frames = missing;
    return o;
}

TrackedObject inside(int id, int missing = 0) { return object_at(id, 200.0f, 200.0f, missing); }
TrackedObject outside(int id) { return object_at(id, 500.0f, 500.0f); }

LingerMonitor::Config make_config(double linger = 5.0, double cooldown = 60.0) {
    LingerMonitor::Config cfg;
    cfg.linger_time_sec = linger;
    cfg.cooldown_sec = cooldown;
    return cfg;
}

} // namespace

// Один объект внутри с t=0 по t=6, детекция раз в секунду.
TEST(LingerMonitor, SingleAlertAtThreshold) {
    LingerMonitor mon(make_config(), "cam");
    std::vector<long long> fired_at;
    for (long long t = 0; t <= 6000; t += 1000) {
        const auto events = mon.evaluate({inside(1)}, kRoi, t);
        for (const auto& e : events) {
            fired_at.push_back(e.ts_ms);
            EXPECT_EQ(e.kind, AlertKind::Linger);
            EXPECT_EQ(e.track_id, 1);
            EXPECT_EQ(e.camera, "cam");
            EXPECT_DOUBLE_EQ(e.dwell_sec, 5.0);
        }
    }
    EXPECT_EQ(fired_at, std::vector<long long>{5000});
}

TEST(LingerMonitor, NoAlertBeforeThreshold) {
    LingerMonitor mon(make_config(), "cam");
    EXPECT_TRUE(mon.evaluate({inside(1)}, kRoi, 0).empty());
    EXPECT_TRUE(mon.evaluate({inside(1)}, kRoi, 4999).empty());
    EXPECT_EQ(mon.evaluate({inside(1)}, kRoi, 5000).size(), 1u);
}

// Выход в t=3, возврат в t=4: алерт только после t=9.
TEST(LingerMonitor, ReentryRestartsTimer) {
    LingerMonitor mon(make_config(), "cam");
    std::vector<long long> fired_at;
    for (long long t = 0; t <= 10000; t += 1000) {
        const TrackedObject obj = (t == 3000) ? outside(1) : inside(1);
        for (const auto& e : mon.evaluate({obj}, kRoi, t)) fired_at.push_back(e.ts_ms);
    }
    EXPECT_EQ(fired_at, std::vector<long long>{9000});
}

TEST(LingerMonitor, CooldownSuppressesRepeatAlerts) {
    LingerMonitor mon(make_config(5.0, 10.0), "cam");
    std::vector<long long> fired_at;
    for (long long t = 0; t <= 26000; t += 1000) {
        for (const auto& e : mon.evaluate({inside(1)}, kRoi, t)) fired_at.push_back(e.ts_ms);
    }
    EXPECT_EQ(fired_at, (std::vector<long long>{5000, 15000, 25000}));
}

TEST(LingerMonitor, CooldownSurvivesExit) {
    LingerMonitor mon(make_config(2.0, 60.0), "cam");
    mon.evaluate({inside(1)}, kRoi, 0);
    EXPECT_EQ(mon.evaluate({inside(1)}, kRoi, 2000).size(), 1u);
    mon.evaluate({outside(1)}, kRoi, 3000);
    mon.evaluate({inside(1)}, kRoi, 4000);
    // Задержка снова набрана, но cooldown ещё идёт.
    EXPECT_TRUE(mon.evaluate({inside(1)}, kRoi, 7000).empty());
    EXPECT_EQ(mon.evaluate({inside(1)}, kRoi, 62000).size(), 1u);
}

TEST(LingerMonitor, OcclusionDoesNotResetTimer) {
    LingerMonitor mon(make_config(), "cam");
    mon.evaluate({inside(1)}, kRoi, 0);
    mon.evaluate({inside(1)}, kRoi, 1000);
    mon.evaluate({inside(1, 1)}, kRoi, 2000);
    mon.evaluate({inside(1, 2)}, kRoi, 3000);
    EXPECT_DOUBLE_EQ(mon.dwell_seconds(1, 3000), 3.0);
    mon.evaluate({inside(1)}, kRoi, 4000);
    EXPECT_EQ(mon.evaluate({inside(1)}, kRoi, 5000).size(), 1u);
}

// Детектор пропустил цикл: тот же набор объектов, время идёт.
TEST(LingerMonitor, SkippedDetectionCycleKeepsRecord) {
    LingerMonitor mon(make_config(), "cam");
    const std::vector<TrackedObject> objs = {inside(1)};
    mon.evaluate(objs, kRoi, 0);
    mon.evaluate(objs, kRoi, 2000);
    ASSERT_TRUE(mon.has_record(1));
    EXPECT_DOUBLE_EQ(mon.dwell_seconds(1, 2500), 2.5);
    EXPECT_TRUE(mon.evaluate(objs, kRoi, 4000).empty());
    EXPECT_EQ(mon.evaluate(objs, kRoi, 5000).size(), 1u);
}

TEST(LingerMonitor, ExpiredIdentityRecordIsRemoved) {
    LingerMonitor mon(make_config(1.0, 60.0), "cam");
    mon.evaluate({inside(1), inside(2)}, kRoi, 0);
    mon.evaluate({inside(1), inside(2)}, kRoi, 1000);
    EXPECT_EQ(mon.record_count(), 2u);

    mon.evaluate({inside(2)}, kRoi, 2000);
    EXPECT_FALSE(mon.has_record(1));
    EXPECT_TRUE(mon.has_record(2));
    EXPECT_EQ(mon.cleared(), std::vector<int>{1});
}

TEST(LingerMonitor, ExitAfterAlertIsReportedAsCleared) {
    LingerMonitor mon(make_config(1.0, 60.0), "cam");
    mon.evaluate({inside(1)}, kRoi, 0);
    mon.evaluate({inside(1)}, kRoi, 1000);
    mon.evaluate({outside(1)}, kRoi, 2000);
    EXPECT_EQ(mon.cleared(), std::vector<int>{1});
    mon.evaluate({outside(1)}, kRoi, 3000);
    EXPECT_TRUE(mon.cleared().empty());
    EXPECT_DOUBLE_EQ(mon.dwell_seconds(1, 3000), 0.0);
}

TEST(LingerMonitor, IdentitiesAreIndependent) {
    LingerMonitor mon(make_config(), "cam");
    mon.evaluate({inside(1)}, kRoi, 0);
    mon.evaluate({inside(1), inside(2)}, kRoi, 2000);

    auto events = mon.evaluate({inside(1), inside(2)}, kRoi, 5000);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].track_id, 1);

    events = mon.evaluate({inside(1), inside(2)}, kRoi, 7000);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].track_id, 2);
}

TEST(LingerMonitor, SeveralAlertsInOneFrame) {
    LingerMonitor mon(make_config(), "cam");
    mon.evaluate({inside(1), inside(2), outside(3)}, kRoi, 0);
    const auto events = mon.evaluate({inside(1), inside(2), outside(3)}, kRoi, 5000);
    EXPECT_EQ(events.size(), 2u);
}

TEST(LingerMonitor, RoiEdgeCountsAsInside) {
    LingerMonitor mon(make_config(1.0, 60.0), "cam");
    mon.evaluate({object_at(1, 100.0f, 300.0f)}, kRoi, 0);
    EXPECT_EQ(mon.evaluate({object_at(1, 100.0f, 300.0f)}, kRoi, 1000).size(), 1u);
}
