#pragma once

#include "camera.hpp"
#include "hand_landmarks.hpp"
#include <cstdint>

namespace canvas
{

    using hand_tracking::Point;

    // Colors are 0x00RRGGBB
    constexpr uint32_t kBackground = 0x00000000;

    inline uint8_t red_of(uint32_t color) { return (color >> 16) & 0xFF; }
    inline uint8_t green_of(uint32_t color) { return (color >> 8) & 0xFF; }
    inline uint8_t blue_of(uint32_t color) { return color & 0xFF; }
    inline uint32_t make_color(uint8_t r, uint8_t g, uint8_t b)
    {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    // Persistent freehand paint layer. Strokes accumulate across frames until
    // a full clear; the "last point" links consecutive samples of one stroke.
    class StrokeCanvas
    {
    public:
        StrokeCanvas(uint32_t width, uint32_t height);

        // Continue the current stroke to `point`.
        // The first sample of a stroke only anchors the pen and returns false;
        // every later sample draws one round-capped segment from the previous
        // sample and returns true.
        bool continue_stroke(const Point &point, uint32_t color, int thickness);

        // Reset every pixel to background and lift the pen. Idempotent.
        void clear();

        // Lift the pen so the next sample starts a new stroke
        void reset_last_point() { has_last_point_ = false; }

        bool has_last_point() const { return has_last_point_; }
        const Point &last_point() const { return last_point_; }

        const camera::Frame &buffer() const { return buffer_; }
        uint32_t width() const { return buffer_.width; }
        uint32_t height() const { return buffer_.height; }

        // Pixel as 0x00RRGGBB; background outside the canvas
        uint32_t pixel(int x, int y) const;

        // Number of non-background pixels
        size_t painted_pixel_count() const;

        // Segments drawn since the last clear
        uint64_t segment_count() const { return segment_count_; }

    private:
        camera::Frame buffer_;
        Point last_point_;
        bool has_last_point_;
        uint64_t segment_count_;

        void stamp_disc(int cx, int cy, int radius, uint32_t color);
        void draw_segment(const Point &p0, const Point &p1, uint32_t color, int thickness);
    };

} // namespace canvas
