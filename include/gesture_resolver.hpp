#pragma once

#include "hand_landmarks.hpp"
#include "stroke_canvas.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace gesture {

using hand_tracking::FingerState;
using hand_tracking::Point;

// Exactly one mode is active per frame
enum class GestureMode {
    IDLE,       // Pen lifted
    SELECTING,  // Index and middle up: pick a toolbar entry
    DRAWING,    // Index up, middle down: paint
    CLEARING    // All five up: wipe the canvas
};

constexpr int kNumHeaderRegions = 4;

// Toolbar hit-region. The x bounds are exclusive; y is the toolbar band.
struct HeaderRegion {
    int x_min;
    int x_max;
    int header_index;
    uint32_t color; // 0x00RRGGBB

    HeaderRegion() : x_min(0), x_max(0), header_index(0), color(0) {}
    HeaderRegion(int x_min_, int x_max_, int index_, uint32_t color_)
        : x_min(x_min_), x_max(x_max_), header_index(index_), color(color_) {}

    bool contains_x(int x) const { return x_min < x && x < x_max; }
};

// Static parameters of the resolver
struct ResolverConfig {
    std::array<HeaderRegion, kNumHeaderRegions> regions{default_regions()};
    int toolbar_band{100};       // Fingertip y below this is on the toolbar
    int brush_thickness{20};     // Stroke width in pixels
    int pointer_radius{20};      // Drawing cursor radius (cosmetic)
    int selection_padding{25};   // Vertical padding of the selection box (cosmetic)
    uint32_t default_color{0x00FF0000};

    // Red, blue, green, black (eraser) across a 1280 px toolbar
    static std::array<HeaderRegion, kNumHeaderRegions> default_regions();

    [[nodiscard]] bool validate() const noexcept;
};

// Cosmetic feedback drawn on the live frame; the canvas is not touched
enum class OverlayKind {
    NONE,
    SELECTION_BOX, // Filled box spanning index and middle tips
    POINTER        // Filled disc at the index tip
};

struct OverlayRequest {
    OverlayKind kind{OverlayKind::NONE};
    Point a;
    Point b;
    int radius{0};
    uint32_t color{0};
};

// Outcome of one resolved frame
struct FrameGesture {
    GestureMode mode{GestureMode::IDLE};
    FingerState fingers{};
    Point index_tip;
    Point middle_tip;
    int selected_region{-1};  // Region hit this frame, -1 when none
    bool segment_drawn{false};
    OverlayRequest overlay;
};

// Mutable drawing state of one painting session: the canvas, the active
// color and the selected toolbar image. Owned by the frame loop.
class PaintSession {
public:
    PaintSession(uint32_t width, uint32_t height, const ResolverConfig& config = ResolverConfig());

    // Apply the gesture rules for one frame.
    // Select/draw/idle are decided first; the all-fingers clear check runs
    // afterwards on every frame and overrides the reported mode.
    FrameGesture resolve(const FingerState& fingers, const Point& index_tip, const Point& middle_tip);

    // Classify and resolve a landmark snapshot. Returns false, leaving all
    // state untouched, when no hand is tracked.
    bool process(const hand_tracking::HandLandmarks& hand, FrameGesture& out);

    uint32_t active_color() const { return active_color_; }
    int active_header_index() const { return active_header_index_; }
    GestureMode last_mode() const { return last_mode_; }

    canvas::StrokeCanvas& canvas() { return canvas_; }
    const canvas::StrokeCanvas& canvas() const { return canvas_; }
    const ResolverConfig& config() const { return config_; }

private:
    ResolverConfig config_;
    canvas::StrokeCanvas canvas_;
    uint32_t active_color_;
    int active_header_index_;
    GestureMode last_mode_;

    // Index of the region under a toolbar fingertip, -1 when none
    int hit_region(const Point& tip) const;
};

std::string mode_to_string(GestureMode mode);

} // namespace gesture
