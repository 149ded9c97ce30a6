#include <gtest/gtest.h>

#include "test_fakes.h"
#include "tracker/tracker.h"

namespace {

Tracker::Config make_config(float dist = 75.0f, int max_missing = 5) {
    Tracker::Config cfg;
    cfg.distance_threshold = dist;
    cfg.max_missing_frames = max_missing;
    return cfg;
}

const TrackedObject* find_id(const std::vector<TrackedObject>& objs, int id) {
    for (const auto& o : objs) {
        if (o.id == id) return &o;
    }
    return nullptr;
}

} // namespace

TEST(Tracker, IdentityPersistsForSmallMovements) {
    Tracker tracker(make_config());
    for (int i = 0; i < 20; ++i) {
        const auto objs = tracker.update({make_detection(10.0f + 10.0f * i, 50, 40, 80)}, i + 1);
        ASSERT_EQ(objs.size(), 1u);
        EXPECT_EQ(objs[0].id, 1);
        EXPECT_EQ(objs[0].missing_frames, 0);
        EXPECT_EQ(objs[0].last_seen_frame, i + 1);
    }
}

TEST(Tracker, FarDetectionBecomesNewIdentity) {
    Tracker tracker(make_config());
    tracker.update({make_detection(0, 0, 40, 40)}, 1);
    const auto objs = tracker.update({make_detection(300, 300, 40, 40)}, 2);

    ASSERT_EQ(objs.size(), 2u);
    EXPECT_EQ(objs[0].id, 1);
    EXPECT_EQ(objs[0].missing_frames, 1);
    EXPECT_EQ(objs[1].id, 2);
    EXPECT_EQ(objs[1].missing_frames, 0);
}

TEST(Tracker, DifferentLabelsNeverMatch) {
    Tracker tracker(make_config());
    tracker.update({make_detection(0, 0, 40, 40, "person")}, 1);
    const auto objs = tracker.update({make_detection(2, 2, 40, 40, "car")}, 2);
    ASSERT_EQ(objs.size(), 2u);
    EXPECT_EQ(objs[1].id, 2);
    EXPECT_EQ(objs[1].label, "car");
}

TEST(Tracker, ExpiresAfterMaxMissingFrames) {
    Tracker tracker(make_config(75.0f, 2));
    tracker.update({make_detection(0, 0, 40, 40)}, 1);

    EXPECT_EQ(tracker.update({}, 2).size(), 1u);
    EXPECT_EQ(tracker.update({}, 3).size(), 1u);
    EXPECT_TRUE(tracker.expired().empty());

    EXPECT_TRUE(tracker.update({}, 4).empty());
    EXPECT_EQ(tracker.expired(), std::vector<int>{1});
}

TEST(Tracker, OcclusionKeepsIdentity) {
    Tracker tracker(make_config(75.0f, 5));
    tracker.update({make_detection(100, 100, 40, 80)}, 1);
    tracker.update({}, 2);
    const auto hidden = tracker.update({}, 3);
    ASSERT_EQ(hidden.size(), 1u);
    EXPECT_EQ(hidden[0].missing_frames, 2);
    // Потерянный трек хранит последний bbox.
    EXPECT_FLOAT_EQ(hidden[0].box.x, 100.0f);

    const auto objs = tracker.update({make_detection(110, 105, 40, 80)}, 4);
    ASSERT_EQ(objs.size(), 1u);
    EXPECT_EQ(objs[0].id, 1);
    EXPECT_EQ(objs[0].missing_frames, 0);
}

TEST(Tracker, IdentitiesAreNeverReused) {
    Tracker tracker(make_config(75.0f, 0));
    tracker.update({make_detection(0, 0, 40, 40)}, 1);
    tracker.update({}, 2);
    ASSERT_EQ(tracker.size(), 0u);

    auto objs = tracker.update({make_detection(0, 0, 40, 40)}, 3);
    ASSERT_EQ(objs.size(), 1u);
    EXPECT_EQ(objs[0].id, 2);

    tracker.reset();
    objs = tracker.update({make_detection(0, 0, 40, 40)}, 4);
    ASSERT_EQ(objs.size(), 1u);
    EXPECT_EQ(objs[0].id, 3);
}

TEST(Tracker, EqualDistanceTieGoesToFirstDetection) {
    Tracker tracker(make_config());
    tracker.update({make_detection(0, 0, 10, 10)}, 1);

    // Обе детекции на расстоянии 40 от трека и не пересекаются с ним.
    const auto objs = tracker.update({make_detection(0, 40, 10, 10), make_detection(40, 0, 10, 10)}, 2);
    ASSERT_EQ(objs.size(), 2u);
    EXPECT_EQ(objs[0].id, 1);
    EXPECT_FLOAT_EQ(objs[0].box.y, 40.0f);
    EXPECT_EQ(objs[1].id, 2);
    EXPECT_FLOAT_EQ(objs[1].box.x, 40.0f);
}

TEST(Tracker, OverlapWinsOverCloserCentroid) {
    Tracker tracker(make_config());
    tracker.update({make_detection(0, 0, 20, 20), make_detection(30, 0, 100, 20)}, 1);

    // Центр ближе к треку 1, но bbox пересекается только с треком 2.
    const auto objs = tracker.update({make_detection(22, 0, 20, 20)}, 2);
    ASSERT_EQ(objs.size(), 2u);
    const TrackedObject* t1 = find_id(objs, 1);
    const TrackedObject* t2 = find_id(objs, 2);
    ASSERT_NE(t1, nullptr);
    ASSERT_NE(t2, nullptr);
    EXPECT_EQ(t1->missing_frames, 1);
    EXPECT_EQ(t2->missing_frames, 0);
    EXPECT_FLOAT_EQ(t2->box.x, 22.0f);
}

TEST(Tracker, SameInputGivesSameAssignment) {
    const std::vector<std::vector<Detection>> frames = {
            {make_detection(0, 0, 30, 30), make_detection(50, 0, 30, 30)},
            {make_detection(25, 0, 30, 30), make_detection(5, 0, 30, 30)},
            {make_detection(30, 5, 30, 30)},
            {make_detection(60, 0, 30, 30), make_detection(20, 0, 30, 30)},
    };

    Tracker a(make_config());
    Tracker b(make_config());
    for (size_t i = 0; i < frames.size(); ++i) {
        const auto oa = a.update(frames[i], static_cast<long long>(i + 1));
        const auto ob = b.update(frames[i], static_cast<long long>(i + 1));
        ASSERT_EQ(oa.size(), ob.size());
        for (size_t k = 0; k < oa.size(); ++k) {
            EXPECT_EQ(oa[k].id, ob[k].id);
            EXPECT_EQ(oa[k].box, ob[k].box);
        }
    }
}

TEST(Tracker, ObjectsAreOrderedByIdentity) {
    Tracker tracker(make_config());
    const auto objs = tracker.update({make_detection(300, 0, 20, 20),
                                      make_detection(0, 0, 20, 20),
                                      make_detection(150, 0, 20, 20)}, 1);
    ASSERT_EQ(objs.size(), 3u);
    EXPECT_EQ(objs[0].id, 1);
    EXPECT_EQ(objs[1].id, 2);
    EXPECT_EQ(objs[2].id, 3);
    EXPECT_FLOAT_EQ(objs[0].box.x, 300.0f);
}
