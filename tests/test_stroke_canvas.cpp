#include <gtest/gtest.h>
#include "stroke_canvas.hpp"
#include <vector>

using namespace canvas;

class StrokeCanvasTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_width = 320;
        test_height = 240;
    }

    uint32_t test_width;
    uint32_t test_height;
};

TEST_F(StrokeCanvasTest, StartsAsBackground) {
    StrokeCanvas pad(test_width, test_height);

    EXPECT_EQ(pad.width(), test_width);
    EXPECT_EQ(pad.height(), test_height);
    EXPECT_EQ(pad.buffer().size(), test_width * test_height * 3);
    EXPECT_EQ(pad.painted_pixel_count(), 0u);
    EXPECT_FALSE(pad.has_last_point());
    EXPECT_EQ(pad.segment_count(), 0u);
}

TEST_F(StrokeCanvasTest, FirstSampleOnlyAnchors) {
    StrokeCanvas pad(test_width, test_height);

    EXPECT_FALSE(pad.continue_stroke(Point(100, 100), 0x00FF0000, 20));
    EXPECT_TRUE(pad.has_last_point());
    EXPECT_EQ(pad.last_point(), Point(100, 100));
    EXPECT_EQ(pad.painted_pixel_count(), 0u);
    EXPECT_EQ(pad.segment_count(), 0u);
}

TEST_F(StrokeCanvasTest, SecondSampleDrawsOneSegment) {
    StrokeCanvas pad(test_width, test_height);
    const uint32_t red = 0x00FF0000;

    pad.continue_stroke(Point(100, 100), red, 20);
    EXPECT_TRUE(pad.continue_stroke(Point(110, 105), red, 20));

    EXPECT_EQ(pad.segment_count(), 1u);
    EXPECT_EQ(pad.last_point(), Point(110, 105));

    // Endpoints and midpoint are painted in the stroke color
    EXPECT_EQ(pad.pixel(100, 100), red);
    EXPECT_EQ(pad.pixel(110, 105), red);
    EXPECT_EQ(pad.pixel(105, 102), red);

    // Round cap: radius 10 reaches (100, 90) but not the square corner (91, 91)
    EXPECT_EQ(pad.pixel(100, 90), red);
    EXPECT_EQ(pad.pixel(91, 91), kBackground);

    // Far away stays untouched
    EXPECT_EQ(pad.pixel(200, 200), kBackground);
}

TEST_F(StrokeCanvasTest, SameSampleTwiceDrawsADot) {
    StrokeCanvas pad(test_width, test_height);

    pad.continue_stroke(Point(50, 50), 0x0000FF00, 10);
    EXPECT_TRUE(pad.continue_stroke(Point(50, 50), 0x0000FF00, 10));

    EXPECT_EQ(pad.segment_count(), 1u);
    EXPECT_EQ(pad.pixel(50, 50), 0x0000FF00u);
    EXPECT_GT(pad.painted_pixel_count(), 0u);
}

TEST_F(StrokeCanvasTest, ResetLastPointStartsNewStroke) {
    StrokeCanvas pad(test_width, test_height);

    pad.continue_stroke(Point(20, 20), 0x000000FF, 4);
    pad.reset_last_point();
    EXPECT_FALSE(pad.has_last_point());

    // No chord back to (20, 20)
    EXPECT_FALSE(pad.continue_stroke(Point(200, 200), 0x000000FF, 4));
    EXPECT_EQ(pad.painted_pixel_count(), 0u);
}

TEST_F(StrokeCanvasTest, ClearIsIdempotent) {
    StrokeCanvas pad(test_width, test_height);
    pad.continue_stroke(Point(10, 10), 0x00FFFFFF, 6);
    pad.continue_stroke(Point(100, 80), 0x00FFFFFF, 6);
    ASSERT_GT(pad.painted_pixel_count(), 0u);

    pad.clear();
    std::vector<uint8_t> once = pad.buffer().data;
    EXPECT_FALSE(pad.has_last_point());
    EXPECT_EQ(pad.painted_pixel_count(), 0u);

    pad.clear();
    EXPECT_EQ(pad.buffer().data, once);
    EXPECT_FALSE(pad.has_last_point());
    EXPECT_EQ(pad.segment_count(), 0u);
}

TEST_F(StrokeCanvasTest, StrokesAccumulate) {
    StrokeCanvas pad(test_width, test_height);
    pad.continue_stroke(Point(10, 10), 0x00FF0000, 4);
    pad.continue_stroke(Point(60, 10), 0x00FF0000, 4);
    size_t after_first = pad.painted_pixel_count();

    pad.reset_last_point();
    pad.continue_stroke(Point(10, 100), 0x000000FF, 4);
    pad.continue_stroke(Point(60, 100), 0x000000FF, 4);

    EXPECT_GT(pad.painted_pixel_count(), after_first);
    EXPECT_EQ(pad.pixel(30, 10), 0x00FF0000u);
    EXPECT_EQ(pad.pixel(30, 100), 0x000000FFu);
}

TEST_F(StrokeCanvasTest, SegmentsClipAtEdges) {
    StrokeCanvas pad(test_width, test_height);

    pad.continue_stroke(Point(-50, -50), 0x00FF0000, 20);
    EXPECT_NO_THROW(pad.continue_stroke(Point(static_cast<int>(test_width) + 50, 10), 0x00FF0000, 20));
    EXPECT_EQ(pad.buffer().size(), test_width * test_height * 3);
    EXPECT_EQ(pad.pixel(-1, -1), kBackground);
}

TEST_F(StrokeCanvasTest, HugeSegmentIsClippedToCanvas) {
    StrokeCanvas pad(test_width, test_height);
    const uint32_t red = 0x00FF0000;

    pad.continue_stroke(Point(-2000000000, 100), red, 10);
    EXPECT_TRUE(pad.continue_stroke(Point(2000000000, 100), red, 10));

    EXPECT_EQ(pad.segment_count(), 1u);
    EXPECT_EQ(pad.last_point(), Point(2000000000, 100));
    EXPECT_EQ(pad.pixel(0, 100), red);
    EXPECT_EQ(pad.pixel(160, 100), red);
    EXPECT_EQ(pad.pixel(static_cast<int>(test_width) - 1, 100), red);
    EXPECT_EQ(pad.pixel(160, 120), kBackground);
}

TEST_F(StrokeCanvasTest, SegmentMissingCanvasPaintsNothing) {
    StrokeCanvas pad(test_width, test_height);

    // Both ends far off the left edge
    pad.continue_stroke(Point(-2000000000, -2000000000), 0x00FF0000, 10);
    EXPECT_TRUE(pad.continue_stroke(Point(-1000000000, 2000000000), 0x00FF0000, 10));
    EXPECT_EQ(pad.painted_pixel_count(), 0u);

    // Passes just outside the stroke radius of the top edge
    pad.reset_last_point();
    pad.continue_stroke(Point(-100, -6), 0x00FF0000, 10);
    EXPECT_TRUE(pad.continue_stroke(Point(500, -6), 0x00FF0000, 10));
    EXPECT_EQ(pad.painted_pixel_count(), 0u);
}

TEST_F(StrokeCanvasTest, DiagonalThroughCornerKeepsItsSlope) {
    StrokeCanvas pad(test_width, test_height);
    const uint32_t green = 0x0000FF00;

    pad.continue_stroke(Point(-1000, -1000), green, 2);
    pad.continue_stroke(Point(1000, 1000), green, 2);

    EXPECT_EQ(pad.pixel(0, 0), green);
    EXPECT_EQ(pad.pixel(100, 100), green);
    EXPECT_EQ(pad.pixel(239, 239), green);
    EXPECT_EQ(pad.pixel(100, 50), kBackground);
}

TEST_F(StrokeCanvasTest, BlackStrokePaintsBackground) {
    StrokeCanvas pad(test_width, test_height);
    pad.continue_stroke(Point(40, 40), 0x00FF0000, 10);
    pad.continue_stroke(Point(80, 40), 0x00FF0000, 10);
    ASSERT_EQ(pad.pixel(60, 40), 0x00FF0000u);

    pad.reset_last_point();
    pad.continue_stroke(Point(40, 40), 0x00000000, 10);
    pad.continue_stroke(Point(80, 40), 0x00000000, 10);
    EXPECT_EQ(pad.pixel(60, 40), kBackground);
}

TEST(ColorTest, ChannelHelpers) {
    uint32_t c = make_color(0x12, 0x34, 0x56);
    EXPECT_EQ(c, 0x00123456u);
    EXPECT_EQ(red_of(c), 0x12);
    EXPECT_EQ(green_of(c), 0x34);
    EXPECT_EQ(blue_of(c), 0x56);
}
