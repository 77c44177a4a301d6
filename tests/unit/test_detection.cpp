#include <gtest/gtest.h>

#include "Detector.hpp"

#include <limits>

TEST(DetectionTest, MakeDetectionFromCorners) {
    Detection det = make_detection(10.f, 20.f, 50.f, 80.f, 0.75f, 3);
    EXPECT_FLOAT_EQ(det.box.x, 10.f);
    EXPECT_FLOAT_EQ(det.box.y, 20.f);
    EXPECT_FLOAT_EQ(det.box.width, 40.f);
    EXPECT_FLOAT_EQ(det.box.height, 60.f);
    EXPECT_FLOAT_EQ(det.confidence, 0.75f);
    EXPECT_EQ(det.class_id, 3);

    EXPECT_EQ(make_detection(0.f, 0.f, 1.f, 1.f, 0.5f).class_id, -1);
}

TEST(DetectionTest, ValidDetectionPasses) {
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, 1.f, 1.f, 0.f)), DetectionIssue::None);
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, 1.f, 1.f, 1.f)), DetectionIssue::None);
    // 负坐标（部分在画面外）是合法的
    EXPECT_EQ(validate_detection(make_detection(-5.f, -5.f, 1.f, 1.f, 0.5f)), DetectionIssue::None);
}

TEST(DetectionTest, InvertedOrEmptyBoxRejected) {
    EXPECT_EQ(validate_detection(make_detection(10.f, 0.f, 5.f, 10.f, 0.5f)), DetectionIssue::EmptyBox);
    EXPECT_EQ(validate_detection(make_detection(0.f, 10.f, 10.f, 5.f, 0.5f)), DetectionIssue::EmptyBox);
    EXPECT_EQ(validate_detection(make_detection(5.f, 0.f, 5.f, 10.f, 0.5f)), DetectionIssue::EmptyBox);
}

TEST(DetectionTest, ConfidenceOutOfRangeRejected) {
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, 1.f, 1.f, 1.5f)),
              DetectionIssue::ConfidenceOutOfRange);
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, 1.f, 1.f, -0.1f)),
              DetectionIssue::ConfidenceOutOfRange);
}

TEST(DetectionTest, NonFiniteRejected) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float inf = std::numeric_limits<float>::infinity();
    EXPECT_EQ(validate_detection(make_detection(nan, 0.f, 1.f, 1.f, 0.5f)), DetectionIssue::NonFinite);
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, inf, 1.f, 0.5f)), DetectionIssue::NonFinite);
    EXPECT_EQ(validate_detection(make_detection(0.f, 0.f, 1.f, 1.f, nan)), DetectionIssue::NonFinite);
}

TEST(DetectionTest, OverflowingCornerRejected) {
    Detection wide{cv::Rect2f(3e38f, 0.f, 3e38f, 10.f), 0.5f, -1};
    EXPECT_EQ(validate_detection(wide), DetectionIssue::NonFinite);

    Detection tall{cv::Rect2f(0.f, 3e38f, 10.f, 3e38f), 0.5f, -1};
    EXPECT_EQ(validate_detection(tall), DetectionIssue::NonFinite);

    // 很大但不溢出的坐标仍然合法
    Detection far{cv::Rect2f(1e30f, 1e30f, 10.f, 10.f), 0.5f, -1};
    EXPECT_EQ(validate_detection(far), DetectionIssue::None);
}

TEST(DetectionTest, IssueNames) {
    EXPECT_STREQ(to_string(DetectionIssue::None), "ok");
    EXPECT_STREQ(to_string(DetectionIssue::EmptyBox), "empty or inverted box");
}
