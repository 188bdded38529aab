#include "hand_landmarks.hpp"
#include <cmath>
#include <stdexcept>

namespace hand_tracking {

double Point::distance(const Point& other) const {
    double dx = x - other.x;
    double dy = y - other.y;
    return std::sqrt(dx * dx + dy * dy);
}

HandLandmarks::HandLandmarks() : detected_(false) {
    for (int i = 0; i < kNumLandmarks; ++i) {
        landmarks_[i] = Landmark(i, 0, 0);
    }
}

HandLandmarks::HandLandmarks(const std::array<Landmark, kNumLandmarks>& landmarks)
    : landmarks_(landmarks), detected_(true) {}

bool HandLandmarks::position_of(int landmark_id, Point& out) const {
    if (landmark_id < 0 || landmark_id >= kNumLandmarks) {
        throw std::out_of_range("landmark id " + std::to_string(landmark_id) + " outside [0, 20]");
    }
    if (!detected_) return false;

    const Landmark& lm = landmarks_[landmark_id];
    out = Point(lm.x, lm.y);
    return true;
}

void HandLandmarks::set(int landmark_id, int x, int y) {
    landmarks_.at(landmark_id) = Landmark(landmark_id, x, y);
    detected_ = true;
}

bool classify_fingers(const HandLandmarks& hand, FingerState& out) {
    if (!hand.detected()) return false;

    Point thumb_tip, thumb_ip, pinky_tip;
    hand.position_of(THUMB_TIP, thumb_tip);
    hand.position_of(THUMB_TIP - 1, thumb_ip);
    hand.position_of(PINKY_TIP, pinky_tip);

    // Thumb folds sideways, so the test depends on which way the hand faces
    // in the mirrored view.
    if (thumb_tip.x < pinky_tip.x) {
        // Left-hand orientation
        out[THUMB] = thumb_tip.x < thumb_ip.x;
    } else {
        // Right-hand orientation
        out[THUMB] = thumb_tip.x > thumb_ip.x;
    }

    // Other fingers: tip above the PIP joint (smaller y is higher on screen)
    for (int finger = INDEX; finger <= PINKY; ++finger) {
        Point tip, pip;
        hand.position_of(kTipIds[finger], tip);
        hand.position_of(kTipIds[finger] - 2, pip);
        out[finger] = tip.y < pip.y;
    }
    return true;
}

int count_up(const FingerState& state) {
    int n = 0;
    for (bool up : state) {
        if (up) ++n;
    }
    return n;
}

std::string finger_state_to_string(const FingerState& state) {
    std::string s;
    s.reserve(kNumFingers);
    for (bool up : state) {
        s.push_back(up ? '1' : '0');
    }
    return s;
}

} // namespace hand_tracking
