#include "frame_compositor.hpp"
#include <algorithm>
#include <iostream>

namespace compositor
{

    FrameCompositor::FrameCompositor(int mask_threshold)
        : mask_threshold_(mask_threshold)
    {
    }

    void FrameCompositor::build_inverse_mask(const camera::Frame &canvas, std::vector<uint8_t> &mask)
    {
        size_t pixels = static_cast<size_t>(canvas.width) * canvas.height;
        gray_buffer_.resize(pixels);
        mask.resize(pixels);
        if (pixels == 0)
            return;

        camera::utils::rgb_to_gray(canvas.data.data(), gray_buffer_.data(), canvas.width, canvas.height);
        for (size_t i = 0; i < pixels; ++i)
        {
            mask[i] = gray_buffer_[i] > mask_threshold_ ? 0 : 255;
        }
    }

    bool FrameCompositor::composite(camera::Frame &frame, const camera::Frame &canvas,
                                    const camera::Frame *header)
    {
        if (frame.width != canvas.width || frame.height != canvas.height ||
            frame.data.size() != canvas.data.size())
        {
            std::cerr << "[Compositor][ERROR] Canvas " << canvas.width << "x" << canvas.height
                      << " does not match frame " << frame.width << "x" << frame.height << "\n";
            return false;
        }

        build_inverse_mask(canvas, mask_buffer_);

        uint8_t *out = frame.data.data();
        const uint8_t *paint = canvas.data.data();
        size_t pixels = mask_buffer_.size();
        for (size_t i = 0; i < pixels; ++i)
        {
            uint8_t m = mask_buffer_[i];
            size_t idx = i * 3;
            out[idx] = (out[idx] & m) | paint[idx];
            out[idx + 1] = (out[idx + 1] & m) | paint[idx + 1];
            out[idx + 2] = (out[idx + 2] & m) | paint[idx + 2];
        }

        if (header)
            paste_header(frame, *header);
        return true;
    }

    void paste_header(camera::Frame &frame, const camera::Frame &header)
    {
        if (frame.empty() || header.empty())
            return;

        uint32_t rows = std::min(frame.height, header.height);
        uint32_t cols = std::min(frame.width, header.width);
        for (uint32_t y = 0; y < rows; ++y)
        {
            const uint8_t *src = header.data.data() + static_cast<size_t>(y) * header.stride;
            uint8_t *dst = frame.data.data() + static_cast<size_t>(y) * frame.stride;
            std::copy(src, src + cols * 3, dst);
        }
    }

    namespace overlay
    {

        void fill_rect(camera::Frame &frame, const hand_tracking::Point &a,
                       const hand_tracking::Point &b, uint32_t color)
        {
            int x0 = std::max(0, std::min(a.x, b.x));
            int x1 = std::min(static_cast<int>(frame.width) - 1, std::max(a.x, b.x));
            int y0 = std::max(0, std::min(a.y, b.y));
            int y1 = std::min(static_cast<int>(frame.height) - 1, std::max(a.y, b.y));

            for (int y = y0; y <= y1; ++y)
            {
                for (int x = x0; x <= x1; ++x)
                {
                    frame.set_rgb(x, y, canvas::red_of(color), canvas::green_of(color), canvas::blue_of(color));
                }
            }
        }

        void fill_disc(camera::Frame &frame, const hand_tracking::Point &center,
                       int radius, uint32_t color)
        {
            for (int dy = -radius; dy <= radius; dy++)
            {
                for (int dx = -radius; dx <= radius; dx++)
                {
                    if (dx * dx + dy * dy <= radius * radius)
                    {
                        frame.set_rgb(center.x + dx, center.y + dy,
                                      canvas::red_of(color), canvas::green_of(color), canvas::blue_of(color));
                    }
                }
            }
        }

        void draw_ring(camera::Frame &frame, const hand_tracking::Point &center,
                       int radius, int thickness, uint32_t color)
        {
            int inner = std::max(0, radius - thickness);
            for (int dy = -radius; dy <= radius; dy++)
            {
                for (int dx = -radius; dx <= radius; dx++)
                {
                    int d2 = dx * dx + dy * dy;
                    if (d2 <= radius * radius && d2 > inner * inner)
                    {
                        frame.set_rgb(center.x + dx, center.y + dy,
                                      canvas::red_of(color), canvas::green_of(color), canvas::blue_of(color));
                    }
                }
            }
        }

        void draw_request(camera::Frame &frame, const gesture::OverlayRequest &request)
        {
            switch (request.kind)
            {
            case gesture::OverlayKind::SELECTION_BOX:
                fill_rect(frame, request.a, request.b, request.color);
                break;
            case gesture::OverlayKind::POINTER:
                fill_disc(frame, request.a, request.radius, request.color);
                break;
            case gesture::OverlayKind::NONE:
                break;
            }
        }

        void draw_landmarks(camera::Frame &frame, const hand_tracking::HandLandmarks &hand,
                            int radius, uint32_t color)
        {
            if (!hand.detected())
                return;
            for (const auto &lm : hand.landmarks())
            {
                draw_ring(frame, hand_tracking::Point(lm.x, lm.y), radius, 2, color);
            }
        }

    } // namespace overlay

} // namespace compositor
