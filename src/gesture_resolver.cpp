#include "gesture_resolver.hpp"

namespace gesture {

std::array<HeaderRegion, kNumHeaderRegions> ResolverConfig::default_regions() {
    return {{
        HeaderRegion(60, 230, 0, 0x00FF0000),   // red
        HeaderRegion(380, 550, 1, 0x000000FF),  // blue
        HeaderRegion(700, 870, 2, 0x0000FF00),  // green
        HeaderRegion(1030, 1250, 3, 0x00000000) // black, paints background
    }};
}

bool ResolverConfig::validate() const noexcept {
    if (toolbar_band < 0) return false;
    if (brush_thickness < 1) return false;
    if (pointer_radius < 0 || selection_padding < 0) return false;
    for (const auto& region : regions) {
        if (region.x_min >= region.x_max) return false;
        if (region.header_index < 0) return false;
        if (region.color > 0x00FFFFFF) return false;
    }
    return true;
}

PaintSession::PaintSession(uint32_t width, uint32_t height, const ResolverConfig& config)
    : config_(config),
      canvas_(width, height),
      active_color_(config.default_color),
      active_header_index_(0),
      last_mode_(GestureMode::IDLE) {}

int PaintSession::hit_region(const Point& tip) const {
    if (tip.y >= config_.toolbar_band) return -1;
    for (size_t i = 0; i < config_.regions.size(); ++i) {
        if (config_.regions[i].contains_x(tip.x)) return static_cast<int>(i);
    }
    return -1;
}

FrameGesture PaintSession::resolve(const FingerState& fingers, const Point& index_tip,
                                   const Point& middle_tip) {
    using hand_tracking::INDEX;
    using hand_tracking::MIDDLE;

    FrameGesture result;
    result.fingers = fingers;
    result.index_tip = index_tip;
    result.middle_tip = middle_tip;

    if (fingers[INDEX] && fingers[MIDDLE]) {
        result.mode = GestureMode::SELECTING;
        canvas_.reset_last_point();

        int region = hit_region(index_tip);
        if (region >= 0) {
            active_header_index_ = config_.regions[region].header_index;
            active_color_ = config_.regions[region].color;
            result.selected_region = region;
        }

        result.overlay.kind = OverlayKind::SELECTION_BOX;
        result.overlay.a = Point(index_tip.x, index_tip.y - config_.selection_padding);
        result.overlay.b = Point(middle_tip.x, middle_tip.y + config_.selection_padding);
        result.overlay.color = active_color_;
    } else if (fingers[INDEX] && !fingers[MIDDLE]) {
        result.mode = GestureMode::DRAWING;
        result.segment_drawn = canvas_.continue_stroke(index_tip, active_color_, config_.brush_thickness);

        result.overlay.kind = OverlayKind::POINTER;
        result.overlay.a = index_tip;
        result.overlay.radius = config_.pointer_radius;
        result.overlay.color = active_color_;
    } else {
        result.mode = GestureMode::IDLE;
        canvas_.reset_last_point();
    }

    // Checked after select/draw: an open palm also matches the selection
    // pattern and both apply in the same frame.
    if (hand_tracking::count_up(fingers) == hand_tracking::kNumFingers) {
        canvas_.clear();
        result.mode = GestureMode::CLEARING;
    }

    last_mode_ = result.mode;
    return result;
}

bool PaintSession::process(const hand_tracking::HandLandmarks& hand, FrameGesture& out) {
    FingerState fingers{};
    if (!hand_tracking::classify_fingers(hand, fingers)) return false;

    Point index_tip, middle_tip;
    hand.position_of(hand_tracking::INDEX_FINGER_TIP, index_tip);
    hand.position_of(hand_tracking::MIDDLE_FINGER_TIP, middle_tip);

    out = resolve(fingers, index_tip, middle_tip);
    return true;
}

std::string mode_to_string(GestureMode mode) {
    switch (mode) {
    case GestureMode::IDLE:
        return "Idle";
    case GestureMode::SELECTING:
        return "Selecting";
    case GestureMode::DRAWING:
        return "Drawing";
    case GestureMode::CLEARING:
        return "Clearing";
    default:
        return "Unknown";
    }
}

} // namespace gesture
