#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace hand_tracking {

// Represents a 2D point in frame pixels
struct Point {
    int x;
    int y;

    Point() : x(0), y(0) {}
    Point(int x_, int y_) : x(x_), y(y_) {}

    // Distance to another point
    double distance(const Point& other) const;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Hand landmark indices (21 landmarks per hand, MediaPipe standard)
enum HandLandmark {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_FINGER_MCP = 5,
    INDEX_FINGER_PIP = 6,
    INDEX_FINGER_DIP = 7,
    INDEX_FINGER_TIP = 8,
    MIDDLE_FINGER_MCP = 9,
    MIDDLE_FINGER_PIP = 10,
    MIDDLE_FINGER_DIP = 11,
    MIDDLE_FINGER_TIP = 12,
    RING_FINGER_MCP = 13,
    RING_FINGER_PIP = 14,
    RING_FINGER_DIP = 15,
    RING_FINGER_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

constexpr int kNumLandmarks = 21;
constexpr int kNumFingers = 5;

// Fingertip landmark for thumb, index, middle, ring, pinky
constexpr std::array<int, kNumFingers> kTipIds = {
    THUMB_TIP, INDEX_FINGER_TIP, MIDDLE_FINGER_TIP, RING_FINGER_TIP, PINKY_TIP};

// Positions in a FingerState
enum Finger {
    THUMB = 0,
    INDEX = 1,
    MIDDLE = 2,
    RING = 3,
    PINKY = 4
};

// One tracked point of a hand, in frame pixels
struct Landmark {
    int id;
    int x;
    int y;

    Landmark() : id(0), x(0), y(0) {}
    Landmark(int id_, int x_, int y_) : id(id_), x(x_), y(y_) {}
};

// Which fingers are extended: thumb, index, middle, ring, pinky
using FingerState = std::array<bool, kNumFingers>;

// Per-frame landmark snapshot for a single hand.
// A default-constructed snapshot represents "no hand tracked".
class HandLandmarks {
public:
    HandLandmarks();

    // Build a detected snapshot; landmark i is expected to carry id i
    explicit HandLandmarks(const std::array<Landmark, kNumLandmarks>& landmarks);

    bool detected() const { return detected_; }

    // Position of a landmark. Returns false when no hand is tracked.
    // Throws std::out_of_range for ids outside [0, 20].
    bool position_of(int landmark_id, Point& out) const;

    // Replace one landmark; marks the snapshot as detected
    void set(int landmark_id, int x, int y);

    const std::array<Landmark, kNumLandmarks>& landmarks() const { return landmarks_; }

    // Handedness as reported by the estimator (0.0 = left, 1.0 = right)
    float handedness{0.0f};
    float score{0.0f};

private:
    std::array<Landmark, kNumLandmarks> landmarks_;
    bool detected_;
};

// Classify raised fingers. Returns false (no gesture this frame) when
// the snapshot holds no hand.
bool classify_fingers(const HandLandmarks& hand, FingerState& out);

// Number of raised fingers
int count_up(const FingerState& state);

// "01100" style rendering for logs
std::string finger_state_to_string(const FingerState& state);

} // namespace hand_tracking
