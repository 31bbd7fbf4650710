#include <gtest/gtest.h>
#include "gesture_classifier.hpp"
#include "hand_fixtures.hpp"
#include <limits>

using namespace hand_detector;
using test_support::make_hand;
using test_support::make_pointing_hand;

class GestureClassifierTest : public ::testing::Test {
protected:
    // 640x480 camera shown on a 1280x960 display
    CoordinateMapper mapper{640, 480, 1280, 960};
    GestureConfig config;
};

TEST_F(GestureClassifierTest, NoHandsIsNoHand) {
    PoseClassification c = classify({}, mapper, config);
    EXPECT_EQ(c.pose, Pose::NO_HAND);
    EXPECT_FALSE(c.fingertip.has_value());
}

TEST_F(GestureClassifierTest, PointingReportsMappedFingertip) {
    PoseClassification c = classify({make_pointing_hand(Point(100, 150))}, mapper, config);
    ASSERT_EQ(c.pose, Pose::POINTING);
    ASSERT_TRUE(c.fingertip.has_value());
    EXPECT_FLOAT_EQ(c.fingertip->x, 200.0f);
    EXPECT_FLOAT_EQ(c.fingertip->y, 300.0f);
}

TEST_F(GestureClassifierTest, OpenHandIsOther) {
    PoseClassification c = classify({test_support::make_open_hand(Point(100, 150))}, mapper, config);
    EXPECT_EQ(c.pose, Pose::OTHER);
    EXPECT_FALSE(c.fingertip.has_value());
}

TEST_F(GestureClassifierTest, FistIsOther) {
    PoseClassification c = classify({test_support::make_fist(Point(100, 150))}, mapper, config);
    EXPECT_EQ(c.pose, Pose::OTHER);
    EXPECT_FALSE(c.fingertip.has_value());
}

TEST_F(GestureClassifierTest, TwoFingersIsOther) {
    test_support::FingerState peace{true, true, false, false, false};
    EXPECT_EQ(classify({make_hand(Point(100, 150), peace)}, mapper, config).pose, Pose::OTHER);
}

TEST_F(GestureClassifierTest, ThumbDoesNotMatter) {
    test_support::FingerState pointing_thumb_out{true, false, false, false, true};
    EXPECT_EQ(classify({make_hand(Point(100, 150), pointing_thumb_out)}, mapper, config).pose,
              Pose::POINTING);
}

TEST_F(GestureClassifierTest, LowConfidenceIsNoHand) {
    PoseClassification c = classify({make_pointing_hand(Point(100, 150), 0.2f)}, mapper, config);
    EXPECT_EQ(c.pose, Pose::NO_HAND);
    EXPECT_FALSE(c.fingertip.has_value());
}

TEST_F(GestureClassifierTest, NonFiniteLandmarkIsNoHand) {
    HandLandmarks hand = make_pointing_hand(Point(100, 150));
    hand.at(HandLandmark::RING_FINGER_DIP).x = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(classify({hand}, mapper, config).pose, Pose::NO_HAND);

    hand = make_pointing_hand(Point(100, 150));
    hand.at(HandLandmark::WRIST).y = std::numeric_limits<float>::infinity();
    EXPECT_EQ(classify({hand}, mapper, config).pose, Pose::NO_HAND);
}

TEST_F(GestureClassifierTest, NonFiniteConfidenceIsNoHand) {
    HandLandmarks hand = make_pointing_hand(Point(100, 150));
    hand.confidence = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(classify({hand}, mapper, config).pose, Pose::NO_HAND);
}

TEST_F(GestureClassifierTest, MostConfidentHandWins) {
    HandLandmarks pointing = make_pointing_hand(Point(100, 150), 0.6f);
    HandLandmarks fist = test_support::make_fist(Point(300, 150));
    fist.confidence = 0.95f;
    EXPECT_EQ(classify({pointing, fist}, mapper, config).pose, Pose::OTHER);

    fist.confidence = 0.55f;
    EXPECT_EQ(classify({pointing, fist}, mapper, config).pose, Pose::POINTING);
}

TEST_F(GestureClassifierTest, FingertipPresentOnlyWhenPointing) {
    std::vector<std::vector<HandLandmarks>> inputs = {
        {},
        {make_pointing_hand(Point(50, 60))},
        {test_support::make_open_hand(Point(50, 60))},
        {test_support::make_fist(Point(50, 60))},
        {make_pointing_hand(Point(50, 60), 0.1f)},
    };
    for (const auto& hands : inputs) {
        PoseClassification c = classify(hands, mapper, config);
        EXPECT_EQ(c.fingertip.has_value(), c.pose == Pose::POINTING);
    }
}

TEST(FingerExtensionTest, MarginIsRelativeToPipDistance) {
    HandLandmarks hand = make_pointing_hand(Point(100, 150));
    // PIP is ~82.5 px from the wrist; put the tip ~87.3 px away
    const Point& wrist = hand.at(HandLandmark::WRIST);
    hand.at(HandLandmark::INDEX_FINGER_TIP) = Point(wrist.x - 20.0f, wrist.y - 85.0f);
    EXPECT_TRUE(is_finger_extended(hand, Finger::INDEX, 0.0f));
    EXPECT_FALSE(is_finger_extended(hand, Finger::INDEX, 0.10f));
}

TEST(FingerExtensionTest, CurledFingers) {
    HandLandmarks fist = test_support::make_fist(Point(100, 150));
    for (Finger f : {Finger::INDEX, Finger::MIDDLE, Finger::RING, Finger::PINKY}) {
        EXPECT_FALSE(is_finger_extended(fist, f, 0.1f));
    }
    HandLandmarks open = test_support::make_open_hand(Point(100, 150));
    for (Finger f : {Finger::INDEX, Finger::MIDDLE, Finger::RING, Finger::PINKY}) {
        EXPECT_TRUE(is_finger_extended(open, f, 0.1f));
    }
}

TEST(CoordinateMapperTest, ScalesToDisplay) {
    CoordinateMapper m(640, 480, 1920, 1080);
    Point p = m.map(Point(320, 240));
    EXPECT_FLOAT_EQ(p.x, 960.0f);
    EXPECT_FLOAT_EQ(p.y, 540.0f);
}

TEST(CoordinateMapperTest, MirrorFlipsX) {
    CoordinateMapper m(100, 100, 200, 200, true);
    Point p = m.map(Point(10, 20));
    EXPECT_FLOAT_EQ(p.x, 180.0f);
    EXPECT_FLOAT_EQ(p.y, 40.0f);
}

TEST(CoordinateMapperTest, ZeroFrameSizeKeepsCoordinates) {
    CoordinateMapper m(0, 0, 800, 600);
    Point p = m.map(Point(12, 34));
    EXPECT_FLOAT_EQ(p.x, 12.0f);
    EXPECT_FLOAT_EQ(p.y, 34.0f);
}

TEST(GestureStabilizerTest, WindowOfOnePassesThrough) {
    GestureStabilizer s(1);
    EXPECT_EQ(s.push(PoseClassification::other()).pose, Pose::OTHER);
    EXPECT_EQ(s.push(PoseClassification::no_hand()).pose, Pose::NO_HAND);
    EXPECT_EQ(s.size(), 1u);
}

TEST(GestureStabilizerTest, MajorityVote) {
    GestureStabilizer s(3);
    EXPECT_EQ(s.push(PoseClassification::pointing(Point(1, 1))).pose, Pose::POINTING);
    // Tie: the newest entry wins
    EXPECT_EQ(s.push(PoseClassification::other()).pose, Pose::OTHER);

    PoseClassification voted = s.push(PoseClassification::pointing(Point(5, 6)));
    ASSERT_EQ(voted.pose, Pose::POINTING);
    EXPECT_FLOAT_EQ(voted.fingertip->x, 5.0f);
    EXPECT_FLOAT_EQ(voted.fingertip->y, 6.0f);

    // Window is now [OTHER, POINTING, NO_HAND]
    PoseClassification tie = s.push(PoseClassification::no_hand());
    EXPECT_EQ(tie.pose, Pose::NO_HAND);
    EXPECT_FALSE(tie.fingertip.has_value());
}

TEST(GestureStabilizerTest, PointingVoteNeedsPointingFrame) {
    GestureStabilizer s(3);
    s.push(PoseClassification::pointing(Point(10, 10)));
    s.push(PoseClassification::pointing(Point(20, 30)));
    PoseClassification voted = s.push(PoseClassification::other());
    EXPECT_EQ(voted.pose, Pose::OTHER);
    EXPECT_FALSE(voted.fingertip.has_value());
}

TEST(GestureStabilizerTest, NoHandIsNotSmoothed) {
    GestureStabilizer s(3);
    s.push(PoseClassification::pointing(Point(10, 10)));
    s.push(PoseClassification::pointing(Point(20, 30)));
    PoseClassification voted = s.push(PoseClassification::no_hand());
    EXPECT_EQ(voted.pose, Pose::NO_HAND);
    EXPECT_FALSE(voted.fingertip.has_value());
}

TEST(GestureStabilizerTest, PointingUsesCurrentFingertip) {
    GestureStabilizer s(3);
    s.push(PoseClassification::pointing(Point(10, 10)));
    s.push(PoseClassification::other());
    PoseClassification voted = s.push(PoseClassification::pointing(Point(40, 50)));
    ASSERT_EQ(voted.pose, Pose::POINTING);
    ASSERT_TRUE(voted.fingertip.has_value());
    EXPECT_FLOAT_EQ(voted.fingertip->x, 40.0f);
    EXPECT_FLOAT_EQ(voted.fingertip->y, 50.0f);
}

TEST(GestureStabilizerTest, SinglePointingFrameAmongOthersIsSuppressed) {
    GestureStabilizer s(3);
    s.push(PoseClassification::other());
    s.push(PoseClassification::other());
    PoseClassification voted = s.push(PoseClassification::pointing(Point(5, 5)));
    EXPECT_EQ(voted.pose, Pose::OTHER);
    EXPECT_FALSE(voted.fingertip.has_value());
}

TEST(GestureStabilizerTest, ResetClearsWindow) {
    GestureStabilizer s(3);
    s.push(PoseClassification::other());
    s.push(PoseClassification::other());
    s.reset();
    EXPECT_EQ(s.size(), 0u);
    EXPECT_EQ(s.push(PoseClassification::no_hand()).pose, Pose::NO_HAND);
}

TEST(GestureConfigTest, Validate) {
    GestureConfig c;
    EXPECT_TRUE(c.validate());
    c.gesture_history = 0;
    EXPECT_FALSE(c.validate());
    c = GestureConfig{};
    c.min_confidence = 1.5f;
    EXPECT_FALSE(c.validate());
}

TEST(GestureClassifierNames, PoseToString) {
    EXPECT_STREQ(pose_to_string(Pose::POINTING), "POINTING");
    EXPECT_STREQ(pose_to_string(Pose::OTHER), "OTHER");
    EXPECT_STREQ(pose_to_string(Pose::NO_HAND), "NO_HAND");
}
