#include "stroke_canvas.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace canvas
{

    StrokeCanvas::StrokeCanvas(uint32_t width, uint32_t height)
        : buffer_(width, height),
          has_last_point_(false),
          segment_count_(0)
    {
    }

    bool StrokeCanvas::continue_stroke(const Point &point, uint32_t color, int thickness)
    {
        if (!has_last_point_)
        {
            // Anchor only; connecting to a stale or origin point would leave a long chord
            last_point_ = point;
            has_last_point_ = true;
            return false;
        }

        draw_segment(last_point_, point, color, thickness);
        last_point_ = point;
        segment_count_++;
        return true;
    }

    void StrokeCanvas::clear()
    {
        std::fill(buffer_.data.begin(), buffer_.data.end(), 0);
        has_last_point_ = false;
        segment_count_ = 0;
    }

    uint32_t StrokeCanvas::pixel(int x, int y) const
    {
        uint8_t r = 0, g = 0, b = 0;
        if (x < 0 || y < 0 || !buffer_.get_rgb(x, y, r, g, b))
            return kBackground;
        return make_color(r, g, b);
    }

    size_t StrokeCanvas::painted_pixel_count() const
    {
        size_t count = 0;
        for (size_t i = 0; i + 2 < buffer_.data.size(); i += 3)
        {
            if (buffer_.data[i] || buffer_.data[i + 1] || buffer_.data[i + 2])
                count++;
        }
        return count;
    }

    void StrokeCanvas::stamp_disc(int cx, int cy, int radius, uint32_t color)
    {
        uint8_t r = red_of(color);
        uint8_t g = green_of(color);
        uint8_t b = blue_of(color);

        // Clip the bounding square once, then test the disc equation per pixel
        int x_min = std::max(0, cx - radius);
        int x_max = std::min(static_cast<int>(buffer_.width) - 1, cx + radius);
        int y_min = std::max(0, cy - radius);
        int y_max = std::min(static_cast<int>(buffer_.height) - 1, cy + radius);

        for (int y = y_min; y <= y_max; ++y)
        {
            int dy = y - cy;
            for (int x = x_min; x <= x_max; ++x)
            {
                int dx = x - cx;
                if (dx * dx + dy * dy <= radius * radius)
                    buffer_.set_rgb(x, y, r, g, b);
            }
        }
    }

    // Liang-Barsky clip of p0-p1 against [x_min, x_max] x [y_min, y_max].
    // Returns false when the segment misses the box entirely.
    static bool clip_segment(int64_t &x0, int64_t &y0, int64_t &x1, int64_t &y1,
                             int64_t x_min, int64_t y_min, int64_t x_max, int64_t y_max)
    {
        double dx = static_cast<double>(x1 - x0);
        double dy = static_cast<double>(y1 - y0);
        double p[4] = {-dx, dx, -dy, dy};
        double q[4] = {static_cast<double>(x0 - x_min), static_cast<double>(x_max - x0),
                       static_cast<double>(y0 - y_min), static_cast<double>(y_max - y0)};
        double t0 = 0.0, t1 = 1.0;

        for (int i = 0; i < 4; ++i)
        {
            if (p[i] == 0.0)
            {
                if (q[i] < 0.0)
                    return false;
                continue;
            }
            double t = q[i] / p[i];
            if (p[i] < 0.0)
            {
                if (t > t1)
                    return false;
                t0 = std::max(t0, t);
            }
            else
            {
                if (t < t0)
                    return false;
                t1 = std::min(t1, t);
            }
        }

        int64_t cx0 = std::llround(static_cast<double>(x0) + t0 * dx);
        int64_t cy0 = std::llround(static_cast<double>(y0) + t0 * dy);
        int64_t cx1 = std::llround(static_cast<double>(x0) + t1 * dx);
        int64_t cy1 = std::llround(static_cast<double>(y0) + t1 * dy);
        x0 = std::min(std::max(cx0, x_min), x_max);
        y0 = std::min(std::max(cy0, y_min), y_max);
        x1 = std::min(std::max(cx1, x_min), x_max);
        y1 = std::min(std::max(cy1, y_min), y_max);
        return true;
    }

    // Bresenham walk stamping a disc at each step, which yields round caps
    // and a constant width of `thickness` regardless of direction.
    // Only the part of the segment within `radius` of the canvas is walked.
    void StrokeCanvas::draw_segment(const Point &p0, const Point &p1, uint32_t color, int thickness)
    {
        int radius = std::max(0, thickness / 2);
        int64_t x0 = p0.x, y0 = p0.y;
        int64_t x1 = p1.x, y1 = p1.y;

        if (!clip_segment(x0, y0, x1, y1, -radius, -radius,
                          static_cast<int64_t>(buffer_.width) - 1 + radius,
                          static_cast<int64_t>(buffer_.height) - 1 + radius))
            return;

        int64_t dx = x1 > x0 ? x1 - x0 : x0 - x1;
        int64_t sx = x0 < x1 ? 1 : -1;
        int64_t dy = -(y1 > y0 ? y1 - y0 : y0 - y1);
        int64_t sy = y0 < y1 ? 1 : -1;
        int64_t err = dx + dy;

        while (true)
        {
            stamp_disc(static_cast<int>(x0), static_cast<int>(y0), radius, color);
            if (x0 == x1 && y0 == y1)
                break;
            int64_t e2 = 2 * err;
            if (e2 >= dy)
            {
                err += dy;
                x0 += sx;
            }
            if (e2 <= dx)
            {
                err += dx;
                y0 += sy;
            }
        }
    }

} // namespace canvas
