#include <gtest/gtest.h>
#include "frame_compositor.hpp"
#include "stroke_canvas.hpp"

using namespace compositor;
using camera::Frame;
using hand_tracking::Point;

// Uniformly colored RGB888 frame
static Frame make_frame(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b) {
    Frame frame(w, h);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            frame.set_rgb(x, y, r, g, b);
        }
    }
    return frame;
}

static void expect_pixel(const Frame& frame, uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b) {
    uint8_t pr = 0, pg = 0, pb = 0;
    ASSERT_TRUE(frame.get_rgb(x, y, pr, pg, pb));
    EXPECT_EQ(pr, r) << "at (" << x << "," << y << ")";
    EXPECT_EQ(pg, g) << "at (" << x << "," << y << ")";
    EXPECT_EQ(pb, b) << "at (" << x << "," << y << ")";
}

class FrameCompositorTest : public ::testing::Test {
protected:
    void SetUp() override {
        live = make_frame(64, 48, 0x80, 0x90, 0xA0);
        paint = Frame(64, 48);
    }

    FrameCompositor compositor;
    Frame live;
    Frame paint;
};

TEST_F(FrameCompositorTest, EmptyCanvasLeavesFrameUnchanged) {
    std::vector<uint8_t> before = live.data;

    ASSERT_TRUE(compositor.composite(live, paint, nullptr));
    EXPECT_EQ(live.data, before);
}

TEST_F(FrameCompositorTest, PaintedPixelsReplaceLiveFrame) {
    paint.set_rgb(10, 10, 0xFF, 0x00, 0x00);
    paint.set_rgb(11, 10, 0x00, 0xFF, 0x00);

    ASSERT_TRUE(compositor.composite(live, paint, nullptr));

    expect_pixel(live, 10, 10, 0xFF, 0x00, 0x00);
    expect_pixel(live, 11, 10, 0x00, 0xFF, 0x00);
    expect_pixel(live, 12, 10, 0x80, 0x90, 0xA0);
}

TEST_F(FrameCompositorTest, DarkPaintIsMergedOverLiveFrame) {
    // Pure blue has luma 29, below the threshold: the live pixel survives the
    // mask and the paint is OR-ed on top
    live = make_frame(64, 48, 0x10, 0x20, 0x30);
    paint.set_rgb(5, 5, 0x00, 0x00, 0xFF);

    ASSERT_TRUE(compositor.composite(live, paint, nullptr));
    expect_pixel(live, 5, 5, 0x10, 0x20, 0xFF);
}

TEST_F(FrameCompositorTest, InverseMaskFollowsThreshold) {
    paint.set_rgb(0, 0, 200, 0, 0);    // luma 60
    paint.set_rgb(1, 0, 40, 40, 40);   // luma 40
    paint.set_rgb(2, 0, 255, 255, 255);

    std::vector<uint8_t> mask;
    compositor.build_inverse_mask(paint, mask);

    ASSERT_EQ(mask.size(), 64u * 48u);
    EXPECT_EQ(mask[0], 0);
    EXPECT_EQ(mask[1], 255);
    EXPECT_EQ(mask[2], 0);
    EXPECT_EQ(mask[3], 255);
}

TEST_F(FrameCompositorTest, MaskThresholdUsesRoundedLuma) {
    paint.set_rgb(0, 0, 169, 0, 0); // luma 50.53, rounds to 51
    paint.set_rgb(1, 0, 168, 0, 0); // luma 50.23, rounds to 50

    ASSERT_TRUE(compositor.composite(live, paint, nullptr));

    // Above the threshold the paint replaces the live pixel
    expect_pixel(live, 0, 0, 169, 0, 0);
    // At the threshold the live pixel survives and the paint is OR-ed on top
    expect_pixel(live, 1, 0, 0x80 | 168, 0x90, 0xA0);
}

TEST_F(FrameCompositorTest, ThresholdIsConfigurable) {
    FrameCompositor strict(100);
    EXPECT_EQ(strict.mask_threshold(), 100);

    paint.set_rgb(0, 0, 200, 0, 0); // luma 60
    std::vector<uint8_t> mask;
    strict.build_inverse_mask(paint, mask);
    EXPECT_EQ(mask[0], 255);

    strict.set_mask_threshold(kDefaultMaskThreshold);
    strict.build_inverse_mask(paint, mask);
    EXPECT_EQ(mask[0], 0);
}

TEST_F(FrameCompositorTest, HeaderIsPastedLast) {
    paint.set_rgb(2, 2, 0xFF, 0xFF, 0xFF);
    Frame header = make_frame(64, 8, 0x30, 0x30, 0x30);

    ASSERT_TRUE(compositor.composite(live, paint, &header));

    // Header wins over paint inside its band
    expect_pixel(live, 2, 2, 0x30, 0x30, 0x30);
    expect_pixel(live, 63, 7, 0x30, 0x30, 0x30);
    expect_pixel(live, 0, 8, 0x80, 0x90, 0xA0);
}

TEST_F(FrameCompositorTest, OversizedHeaderIsClipped) {
    Frame header = make_frame(100, 60, 0x11, 0x22, 0x33);

    ASSERT_TRUE(compositor.composite(live, paint, &header));
    expect_pixel(live, 63, 47, 0x11, 0x22, 0x33);
    EXPECT_EQ(live.size(), 64u * 48u * 3u);
}

TEST_F(FrameCompositorTest, NarrowHeaderCoversOnlyItsWidth) {
    Frame header = make_frame(16, 4, 0x11, 0x22, 0x33);

    paste_header(live, header);
    expect_pixel(live, 15, 3, 0x11, 0x22, 0x33);
    expect_pixel(live, 16, 3, 0x80, 0x90, 0xA0);
    expect_pixel(live, 15, 4, 0x80, 0x90, 0xA0);
}

TEST_F(FrameCompositorTest, SizeMismatchIsRejected) {
    Frame small(32, 24);
    small.set_rgb(0, 0, 0xFF, 0, 0);
    std::vector<uint8_t> before = live.data;

    EXPECT_FALSE(compositor.composite(live, small, nullptr));
    EXPECT_EQ(live.data, before);
}

TEST_F(FrameCompositorTest, StrokeCanvasComposites) {
    canvas::StrokeCanvas pad(64, 48);
    pad.continue_stroke(Point(10, 20), 0x00FF0000, 4);
    pad.continue_stroke(Point(40, 20), 0x00FF0000, 4);

    ASSERT_TRUE(compositor.composite(live, pad.buffer(), nullptr));
    expect_pixel(live, 25, 20, 0xFF, 0x00, 0x00);
    expect_pixel(live, 25, 40, 0x80, 0x90, 0xA0);
}

TEST(OverlayTest, SelectionBoxFillsBetweenCorners) {
    Frame frame(40, 40);
    gesture::OverlayRequest request;
    request.kind = gesture::OverlayKind::SELECTION_BOX;
    request.a = Point(20, 5);
    request.b = Point(10, 15);
    request.color = 0x000000FF;

    overlay::draw_request(frame, request);
    expect_pixel(frame, 10, 5, 0, 0, 0xFF);
    expect_pixel(frame, 20, 15, 0, 0, 0xFF);
    expect_pixel(frame, 21, 15, 0, 0, 0);
    expect_pixel(frame, 15, 4, 0, 0, 0);
}

TEST(OverlayTest, PointerIsADisc) {
    Frame frame(40, 40);
    gesture::OverlayRequest request;
    request.kind = gesture::OverlayKind::POINTER;
    request.a = Point(20, 20);
    request.radius = 5;
    request.color = 0x0000FF00;

    overlay::draw_request(frame, request);
    expect_pixel(frame, 20, 20, 0, 0xFF, 0);
    expect_pixel(frame, 25, 20, 0, 0xFF, 0);
    expect_pixel(frame, 24, 24, 0, 0, 0);
}

TEST(OverlayTest, NoneDrawsNothing) {
    Frame frame(10, 10);
    gesture::OverlayRequest request;
    overlay::draw_request(frame, request);
    EXPECT_EQ(frame.data, std::vector<uint8_t>(10 * 10 * 3, 0));
}

TEST(OverlayTest, ShapesClipAtEdges) {
    Frame frame(10, 10);
    EXPECT_NO_THROW(overlay::fill_disc(frame, Point(0, 0), 6, 0x00FFFFFF));
    EXPECT_NO_THROW(overlay::fill_rect(frame, Point(-5, -5), Point(50, 2), 0x00FFFFFF));
    expect_pixel(frame, 9, 2, 0xFF, 0xFF, 0xFF);
}

TEST(OverlayTest, LandmarksAreRingedOnlyWhenTracked) {
    Frame frame(100, 100);
    hand_tracking::HandLandmarks missing;
    overlay::draw_landmarks(frame, missing, 10, 0x000000FF);
    EXPECT_EQ(frame.data, std::vector<uint8_t>(100 * 100 * 3, 0));

    hand_tracking::HandLandmarks hand;
    for (int id = 0; id < hand_tracking::kNumLandmarks; ++id) {
        hand.set(id, 50, 50);
    }
    overlay::draw_landmarks(frame, hand, 10, 0x000000FF);
    expect_pixel(frame, 60, 50, 0, 0, 0xFF);
    // Ring, not disc
    expect_pixel(frame, 50, 50, 0, 0, 0);
}
