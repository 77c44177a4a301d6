#include <gtest/gtest.h>

#include "Association.hpp"

namespace {

TrackCandidate candidate(int id, int hit_streak, float x, float y, float w = 50.f, float h = 100.f) {
    return {id, hit_streak, cv::Rect2f(x, y, w, h)};
}

Detection detection(float x, float y, float confidence, float w = 50.f, float h = 100.f) {
    return {cv::Rect2f(x, y, w, h), confidence, 0};
}

}  // namespace

TEST(AssociationTest, NoTracksLeavesAllDetectionsUnmatched) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<Detection> dets = {detection(0.f, 0.f, 0.9f), detection(200.f, 0.f, 0.2f)};

    AssociationResult result = engine.associate({}, dets);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_TRUE(result.unmatched_tracks.empty());
    EXPECT_EQ(result.unmatched_detections, (std::vector<int>{0, 1}));
}

TEST(AssociationTest, NoDetectionsLeavesAllTracksUnmatched) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 3, 0.f, 0.f), candidate(2, 1, 100.f, 0.f)};

    AssociationResult result = engine.associate(tracks, {});
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.unmatched_tracks, (std::vector<int>{0, 1}));
    EXPECT_TRUE(result.unmatched_detections.empty());
}

TEST(AssociationTest, HighConfidenceMatchesInFirstStage) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 3, 0.f, 0.f), candidate(2, 3, 300.f, 0.f)};
    std::vector<Detection> dets = {detection(302.f, 0.f, 0.9f), detection(2.f, 1.f, 0.8f)};

    AssociationResult result = engine.associate(tracks, dets);
    ASSERT_EQ(result.matches.size(), 2u);
    for (const auto& match : result.matches) {
        EXPECT_EQ(match.stage, MatchStage::HighConfidence);
        EXPECT_EQ(match.track, match.detection == 0 ? 1 : 0);
        EXPECT_LE(match.cost, TrackerConfig().max_iou_distance);
    }
    EXPECT_TRUE(result.unmatched_tracks.empty());
    EXPECT_TRUE(result.unmatched_detections.empty());
}

TEST(AssociationTest, LowConfidenceDetectionRecoversTrackInSecondStage) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 5, 100.f, 100.f)};
    std::vector<Detection> dets = {detection(102.f, 100.f, 0.3f)};

    AssociationResult result = engine.associate(tracks, dets);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].track, 0);
    EXPECT_EQ(result.matches[0].detection, 0);
    EXPECT_EQ(result.matches[0].stage, MatchStage::LowConfidence);
}

TEST(AssociationTest, HighConfidenceDetectionWinsOverLowConfidence) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 5, 100.f, 100.f)};
    // 低置信度的框重叠更好，但第一阶段已经把轨迹分给了高置信度检测
    std::vector<Detection> dets = {detection(100.f, 100.f, 0.3f), detection(110.f, 100.f, 0.9f)};

    AssociationResult result = engine.associate(tracks, dets);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].detection, 1);
    EXPECT_EQ(result.matches[0].stage, MatchStage::HighConfidence);
    EXPECT_EQ(result.unmatched_detections, (std::vector<int>{0}));
}

TEST(AssociationTest, MatchesBeyondThresholdAreRejected) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 5, 0.f, 0.f)};
    // 水平偏移 40：交集 10x100，并集 9000，IoU ~0.11
    std::vector<Detection> dets = {detection(40.f, 0.f, 0.9f)};

    AssociationResult result = engine.associate(tracks, dets);
    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.unmatched_tracks, (std::vector<int>{0}));
    EXPECT_EQ(result.unmatched_detections, (std::vector<int>{0}));
}

TEST(AssociationTest, SecondStageUsesItsOwnThreshold) {
    TrackerConfig config;
    config.max_iou_distance = 0.7;
    config.low_confidence_max_iou_distance = 0.5;
    AssociationEngine engine(config);

    // 水平偏移 20：交集 30x100，并集 7000，IoU ~0.43，距离 ~0.57
    std::vector<TrackCandidate> tracks = {candidate(1, 5, 0.f, 0.f)};

    AssociationResult low = engine.associate(tracks, {detection(20.f, 0.f, 0.3f)});
    EXPECT_TRUE(low.matches.empty());

    AssociationResult high = engine.associate(tracks, {detection(20.f, 0.f, 0.9f)});
    ASSERT_EQ(high.matches.size(), 1u);
}

TEST(AssociationTest, TieGoesToLongerHitStreak) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(1, 1, 0.f, 0.f), candidate(2, 6, 0.f, 0.f)};
    std::vector<Detection> dets = {detection(0.f, 0.f, 0.9f)};

    AssociationResult result = engine.associate(tracks, dets);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].track, 1);
    EXPECT_EQ(result.unmatched_tracks, (std::vector<int>{0}));
}

TEST(AssociationTest, EqualStreakTieGoesToOlderTrack) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks = {candidate(7, 2, 0.f, 0.f), candidate(3, 2, 0.f, 0.f)};
    std::vector<Detection> dets = {detection(0.f, 0.f, 0.9f)};

    AssociationResult result = engine.associate(tracks, dets);
    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(tracks[result.matches[0].track].track_id, 3);
}

TEST(AssociationTest, DetectionsBelowFloorAreIgnored) {
    TrackerConfig config;
    config.low_confidence_floor = 0.1;
    AssociationEngine engine(config);

    std::vector<TrackCandidate> tracks = {candidate(1, 5, 0.f, 0.f)};
    AssociationResult result = engine.associate(tracks, {detection(0.f, 0.f, 0.05f)});
    EXPECT_TRUE(result.matches.empty());
    EXPECT_TRUE(result.unmatched_detections.empty());
    EXPECT_EQ(result.ignored_detections, (std::vector<int>{0}));
    EXPECT_EQ(result.unmatched_tracks, (std::vector<int>{0}));
}

TEST(AssociationTest, EveryDetectionAndTrackAppearsExactlyOnce) {
    AssociationEngine engine{TrackerConfig()};
    std::vector<TrackCandidate> tracks;
    std::vector<Detection> dets;
    for (int i = 0; i < 6; ++i) {
        tracks.push_back(candidate(i + 1, i % 3, 60.f * i, 0.f));
    }
    for (int j = 0; j < 8; ++j) {
        dets.push_back(detection(45.f * j, 3.f, j % 2 == 0 ? 0.9f : 0.3f));
    }

    AssociationResult result = engine.associate(tracks, dets);

    std::vector<int> track_seen(tracks.size(), 0);
    std::vector<int> det_seen(dets.size(), 0);
    for (const auto& match : result.matches) {
        ++track_seen[match.track];
        ++det_seen[match.detection];
        double limit = match.stage == MatchStage::HighConfidence ? 0.7 : 0.5;
        EXPECT_LE(match.cost, limit);
    }
    for (int t : result.unmatched_tracks) ++track_seen[t];
    for (int d : result.unmatched_detections) ++det_seen[d];

    for (int count : track_seen) EXPECT_EQ(count, 1);
    for (int count : det_seen) EXPECT_EQ(count, 1);
}
