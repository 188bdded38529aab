#include <gtest/gtest.h>
#include "hand_landmarks.hpp"
#include <stdexcept>

using namespace hand_tracking;

// Build a hand whose non-thumb fingers follow `up`; the thumb is set separately
static HandLandmarks make_hand(const FingerState& up) {
    HandLandmarks hand;
    for (int id = 0; id < kNumLandmarks; ++id) {
        hand.set(id, 400, 400);
    }
    for (int finger = INDEX; finger <= PINKY; ++finger) {
        int tip = kTipIds[finger];
        hand.set(tip - 2, 300 + finger * 40, 200);
        hand.set(tip, 300 + finger * 40, up[finger] ? 100 : 300);
    }
    // Thumb in left orientation: tip left of the pinky tip
    hand.set(THUMB_TIP, 50, 250);
    hand.set(THUMB_IP, up[THUMB] ? 60 : 40, 250);
    return hand;
}

TEST(PointTest, Distance) {
    Point p1(0, 0);
    Point p2(3, 4);

    EXPECT_DOUBLE_EQ(p1.distance(p2), 5.0);
    EXPECT_DOUBLE_EQ(p2.distance(p1), 5.0);
}

TEST(HandLandmarksTest, DefaultSnapshotIsNotDetected) {
    HandLandmarks hand;
    Point p(7, 7);

    EXPECT_FALSE(hand.detected());
    EXPECT_FALSE(hand.position_of(INDEX_FINGER_TIP, p));
    // Output untouched on failure
    EXPECT_EQ(p, Point(7, 7));
}

TEST(HandLandmarksTest, PositionOfReturnsCoordinates) {
    HandLandmarks hand;
    hand.set(INDEX_FINGER_TIP, 123, 45);

    Point p;
    ASSERT_TRUE(hand.position_of(INDEX_FINGER_TIP, p));
    EXPECT_EQ(p.x, 123);
    EXPECT_EQ(p.y, 45);
    EXPECT_EQ(hand.landmarks()[INDEX_FINGER_TIP].id, INDEX_FINGER_TIP);
}

TEST(HandLandmarksTest, OutOfRangeIdThrows) {
    HandLandmarks hand;
    hand.set(WRIST, 1, 1);
    Point p;

    EXPECT_THROW(hand.position_of(21, p), std::out_of_range);
    EXPECT_THROW(hand.position_of(-1, p), std::out_of_range);
    EXPECT_THROW(hand.set(21, 0, 0), std::out_of_range);
}

TEST(HandLandmarksTest, ConstructFromArray) {
    std::array<Landmark, kNumLandmarks> lms;
    for (int i = 0; i < kNumLandmarks; ++i) {
        lms[i] = Landmark(i, i * 10, i * 20);
    }
    HandLandmarks hand(lms);

    Point p;
    ASSERT_TRUE(hand.position_of(PINKY_TIP, p));
    EXPECT_EQ(p, Point(200, 400));
}

TEST(FingerClassifierTest, NoHandIsNotDetected) {
    HandLandmarks hand;
    FingerState state{};
    EXPECT_FALSE(classify_fingers(hand, state));
}

TEST(FingerClassifierTest, ThumbLeftOrientationUp) {
    HandLandmarks hand = make_hand({false, false, false, false, false});
    hand.set(THUMB_TIP, 50, 250);
    hand.set(PINKY_TIP, 200, 300);
    hand.set(THUMB_IP, 60, 250);

    FingerState state{};
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_TRUE(state[THUMB]); // 50 < 60
}

TEST(FingerClassifierTest, ThumbLeftOrientationDown) {
    HandLandmarks hand = make_hand({false, false, false, false, false});
    hand.set(THUMB_TIP, 50, 250);
    hand.set(PINKY_TIP, 200, 300);
    hand.set(THUMB_IP, 40, 250);

    FingerState state{};
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_FALSE(state[THUMB]);
}

TEST(FingerClassifierTest, ThumbRightOrientation) {
    HandLandmarks hand = make_hand({false, false, false, false, false});
    hand.set(THUMB_TIP, 300, 250);
    hand.set(PINKY_TIP, 100, 300);

    FingerState state{};
    hand.set(THUMB_IP, 290, 250);
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_TRUE(state[THUMB]); // 300 > 290

    hand.set(THUMB_IP, 310, 250);
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_FALSE(state[THUMB]);
}

TEST(FingerClassifierTest, ThumbLevelWithPinkyUsesRightBranch) {
    HandLandmarks hand = make_hand({false, false, false, false, false});
    hand.set(THUMB_TIP, 200, 250);
    hand.set(PINKY_TIP, 200, 300);
    hand.set(THUMB_IP, 210, 250);

    FingerState state{};
    ASSERT_TRUE(classify_fingers(hand, state));
    // Right branch: 200 > 210 is false; the left branch would have said true
    EXPECT_FALSE(state[THUMB]);
}

TEST(FingerClassifierTest, FingersFollowTipAboveJoint) {
    HandLandmarks hand = make_hand({false, true, false, true, false});

    FingerState state{};
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_TRUE(state[INDEX]);
    EXPECT_FALSE(state[MIDDLE]);
    EXPECT_TRUE(state[RING]);
    EXPECT_FALSE(state[PINKY]);
}

TEST(FingerClassifierTest, AllFingersUp) {
    HandLandmarks hand = make_hand({true, true, true, true, true});

    FingerState state{};
    ASSERT_TRUE(classify_fingers(hand, state));
    EXPECT_EQ(count_up(state), 5);
    EXPECT_EQ(finger_state_to_string(state), "11111");
}

TEST(FingerClassifierTest, DegenerateInputIsStrictAndNeverThrows) {
    HandLandmarks hand;
    for (int id = 0; id < kNumLandmarks; ++id) {
        hand.set(id, 100, 100);
    }

    FingerState state{};
    EXPECT_NO_THROW(classify_fingers(hand, state));
    ASSERT_TRUE(classify_fingers(hand, state));
    // Equal coordinates never count as "up" with strict comparisons
    EXPECT_EQ(finger_state_to_string(state), "00000");
}

TEST(FingerStateTest, StringAndCount) {
    FingerState state = {false, true, true, false, false};
    EXPECT_EQ(finger_state_to_string(state), "01100");
    EXPECT_EQ(count_up(state), 2);
}
