#include <gtest/gtest.h>

#include "MotionModel.hpp"

namespace {

cv::Point2f center(const cv::Rect2f& box) {
    return cv::Point2f(box.x + box.width / 2.f, box.y + box.height / 2.f);
}

void expect_box_near(const cv::Rect2f& actual, const cv::Rect2f& expected, float tolerance) {
    EXPECT_NEAR(actual.x, expected.x, tolerance);
    EXPECT_NEAR(actual.y, expected.y, tolerance);
    EXPECT_NEAR(actual.width, expected.width, tolerance);
    EXPECT_NEAR(actual.height, expected.height, tolerance);
}

}  // namespace

TEST(MotionModelTest, InitialStateMatchesDetection) {
    cv::Rect2f box(100.f, 50.f, 40.f, 80.f);
    MotionModel model(box);

    expect_box_near(model.box(), box, 1e-3f);
    EXPECT_FLOAT_EQ(model.velocity().x, 0.f);
    EXPECT_FLOAT_EQ(model.velocity().y, 0.f);
}

TEST(MotionModelTest, PredictDoesNotChangeCommittedState) {
    MotionModel model(cv::Rect2f(0.f, 0.f, 20.f, 40.f));
    model.update(cv::Rect2f(10.f, 0.f, 20.f, 40.f));

    cv::Rect2f before = model.box();
    cv::Point2f velocity_before = model.velocity();

    cv::Rect2f predicted = model.predict();
    EXPECT_GT(center(predicted).x, center(before).x);

    EXPECT_FLOAT_EQ(model.box().x, before.x);
    EXPECT_FLOAT_EQ(model.box().y, before.y);
    EXPECT_FLOAT_EQ(model.velocity().x, velocity_before.x);
    EXPECT_FLOAT_EQ(model.velocity().y, velocity_before.y);

    // 同一帧内重复预测结果相同
    cv::Rect2f again = model.predict();
    EXPECT_FLOAT_EQ(again.x, predicted.x);
    EXPECT_FLOAT_EQ(again.y, predicted.y);
}

TEST(MotionModelTest, StaticObjectStaysPut) {
    cv::Rect2f box(200.f, 100.f, 50.f, 100.f);
    MotionModel model(box);

    for (int i = 0; i < 5; ++i) {
        expect_box_near(model.predict(), box, 1e-3f);
        model.update(box);
    }
    expect_box_near(model.box(), box, 1e-3f);
    EXPECT_NEAR(model.velocity().x, 0.f, 1e-4f);
    EXPECT_NEAR(model.velocity().y, 0.f, 1e-4f);
}

TEST(MotionModelTest, FirstUpdateVelocityFollowsDisplacement) {
    MotionModel model(cv::Rect2f(0.f, 0.f, 20.f, 40.f));
    model.predict();
    model.update(cv::Rect2f(4.f, 0.f, 20.f, 40.f));

    // 平滑后的位移介于 0 和观测位移之间
    EXPECT_GT(model.velocity().x, 3.f);
    EXPECT_LE(model.velocity().x, 4.f);
    EXPECT_NEAR(model.velocity().y, 0.f, 1e-3f);
}

TEST(MotionModelTest, ConstantVelocityIsLearned) {
    const float step = 5.f;
    MotionModel model(cv::Rect2f(0.f, 0.f, 30.f, 60.f));

    for (int i = 1; i <= 15; ++i) {
        model.predict();
        model.update(cv::Rect2f(step * i, 0.f, 30.f, 60.f));
    }

    EXPECT_NEAR(model.velocity().x, step, 0.5f);

    cv::Rect2f predicted = model.predict();
    EXPECT_NEAR(center(predicted).x, step * 16 + 15.f, 2.f);
}

TEST(MotionModelTest, FilterVelocityDrivesPrediction) {
    const float step = 5.f;
    MotionModel model(cv::Rect2f(0.f, 0.f, 30.f, 60.f));
    EXPECT_FLOAT_EQ(model.filter_velocity().x, 0.f);

    for (int i = 1; i <= 15; ++i) {
        model.predict();
        model.update(cv::Rect2f(step * i, 0.f, 30.f, 60.f));
    }

    cv::Point2f filter_velocity = model.filter_velocity();
    EXPECT_NEAR(filter_velocity.x, step, 1.f);
    EXPECT_NEAR(filter_velocity.x, model.velocity().x, 1.f);

    cv::Rect2f before = model.box();
    cv::Rect2f predicted = model.predict();
    EXPECT_NEAR(center(predicted).x - center(before).x, filter_velocity.x, 1e-3f);
}

TEST(MotionModelTest, CoastCommitsPrediction) {
    const float step = 5.f;
    MotionModel model(cv::Rect2f(0.f, 0.f, 30.f, 60.f));
    for (int i = 1; i <= 15; ++i) {
        model.predict();
        model.update(cv::Rect2f(step * i, 0.f, 30.f, 60.f));
    }

    cv::Rect2f before = model.box();
    cv::Rect2f predicted = model.predict();
    model.coast();

    EXPECT_FLOAT_EQ(model.box().x, predicted.x);
    EXPECT_NEAR(model.box().x - before.x, step, 1.f);
}

TEST(MotionModelTest, VelocityAveragedOverCoastedFrames) {
    MotionModel model(cv::Rect2f(0.f, 0.f, 20.f, 20.f));
    for (int i = 0; i < 3; ++i) {
        model.predict();
        model.update(cv::Rect2f(0.f, 0.f, 20.f, 20.f));
    }

    // 两帧没有检测，第三帧出现在 30 像素之外
    model.predict();
    model.coast();
    model.predict();
    model.coast();
    model.predict();
    model.update(cv::Rect2f(30.f, 0.f, 20.f, 20.f));

    EXPECT_GT(model.velocity().x, 0.f);
    EXPECT_LE(model.velocity().x, 10.f + 1e-3f);
}

TEST(MotionModelTest, StateToBoxIsAlwaysWellFormed) {
    cv::Mat state = cv::Mat::zeros(8, 1, CV_32F);
    state.at<float>(0) = 10.f;
    state.at<float>(1) = 10.f;
    state.at<float>(2) = -0.5f;
    state.at<float>(3) = -3.f;

    cv::Rect2f box = state_to_box(state);
    EXPECT_GT(box.width, 0.f);
    EXPECT_GT(box.height, 0.f);
}

TEST(MotionModelTest, MeasurementRoundTrip) {
    cv::Rect2f box(12.f, 34.f, 56.f, 78.f);
    cv::Mat measurement = box_to_measurement(box);
    EXPECT_FLOAT_EQ(measurement.at<float>(0), 40.f);
    EXPECT_FLOAT_EQ(measurement.at<float>(1), 73.f);
    EXPECT_NEAR(measurement.at<float>(2), 56.f / 78.f, 1e-6f);
    EXPECT_FLOAT_EQ(measurement.at<float>(3), 78.f);

    cv::Mat state = cv::Mat::zeros(8, 1, CV_32F);
    for (int i = 0; i < 4; ++i) {
        state.at<float>(i) = measurement.at<float>(i);
    }
    expect_box_near(state_to_box(state), box, 1e-3f);
}
