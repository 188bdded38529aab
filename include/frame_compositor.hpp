#pragma once

#include "camera.hpp"
#include "gesture_resolver.hpp"
#include "hand_landmarks.hpp"
#include <cstdint>
#include <vector>

namespace compositor
{

    constexpr int kDefaultMaskThreshold = 50;

    // Merges the stroke canvas and the toolbar header onto live frames
    class FrameCompositor
    {
    public:
        explicit FrameCompositor(int mask_threshold = kDefaultMaskThreshold);

        // out = (frame AND mask) OR canvas, where mask is 0 on painted canvas
        // pixels (luma > threshold) and 255 elsewhere, then the header is pasted
        // at the top-left corner, clipped to the frame.
        // Returns false and leaves the frame untouched when the canvas size
        // differs from the frame size.
        bool composite(camera::Frame &frame, const camera::Frame &canvas,
                       const camera::Frame *header);

        // Inverse paint mask for a canvas: one byte per pixel, 0 or 255
        void build_inverse_mask(const camera::Frame &canvas, std::vector<uint8_t> &mask);

        int mask_threshold() const { return mask_threshold_; }
        void set_mask_threshold(int threshold) { mask_threshold_ = threshold; }

    private:
        int mask_threshold_;

        // Internal processing buffers
        std::vector<uint8_t> gray_buffer_;
        std::vector<uint8_t> mask_buffer_;

        // Disable copy
        FrameCompositor(const FrameCompositor &) = delete;
        FrameCompositor &operator=(const FrameCompositor &) = delete;
    };

    // Copy `header` into the top-left corner of `frame`, clipped to the frame
    void paste_header(camera::Frame &frame, const camera::Frame &header);

    // Cosmetic drawing on the live frame
    namespace overlay
    {
        // Filled axis-aligned box between two corners (any order)
        void fill_rect(camera::Frame &frame, const hand_tracking::Point &a,
                       const hand_tracking::Point &b, uint32_t color);

        // Filled disc
        void fill_disc(camera::Frame &frame, const hand_tracking::Point &center,
                       int radius, uint32_t color);

        // Ring of the given thickness
        void draw_ring(camera::Frame &frame, const hand_tracking::Point &center,
                       int radius, int thickness, uint32_t color);

        // Render the resolver's selection box or pointer
        void draw_request(camera::Frame &frame, const gesture::OverlayRequest &request);

        // Circle every landmark of a tracked hand
        void draw_landmarks(camera::Frame &frame, const hand_tracking::HandLandmarks &hand,
                            int radius, uint32_t color);
    }

} // namespace compositor
