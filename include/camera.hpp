#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <memory>
#include <vector>

namespace camera
{

    // Frame format for image processing
    enum class PixelFormat
    {
        RGB888, // 24-bit RGB
        YUV420, // YUV 4:2:0 planar
        UNKNOWN
    };

    // Represents a single camera frame (always RGB888 once it leaves the camera)
    struct Frame
    {
        std::vector<uint8_t> data; // Raw pixel data
        uint32_t width;            // Frame width
        uint32_t height;           // Frame height
        PixelFormat format;        // Pixel format
        uint64_t timestamp_ns;     // Capture timestamp (nanoseconds)
        int stride;                // Bytes per row

        Frame() : data(), width(0), height(0),
                  format(PixelFormat::UNKNOWN), timestamp_ns(0), stride(0) {}

        Frame(uint32_t w, uint32_t h) : Frame() { allocate(w, h); }

        // Resize to w x h RGB888 and fill with zero (black)
        void allocate(uint32_t w, uint32_t h);

        bool empty() const { return data.empty() || width == 0 || height == 0; }
        size_t size() const { return data.size(); }

        // Get pixel at (x, y)
        bool get_rgb(uint32_t x, uint32_t y, uint8_t &r, uint8_t &g, uint8_t &b) const;

        // Set pixel at (x, y), ignored outside the frame
        void set_rgb(int x, int y, uint8_t r, uint8_t g, uint8_t b);
    };

    // Camera configuration
    struct CameraConfig
    {
        uint32_t width;     // Desired width (default: 1280)
        uint32_t height;    // Desired height (default: 720)
        uint32_t framerate; // Desired FPS (default: 30)
        PixelFormat format; // Format emitted by the capture command (default: YUV420)
        std::string command; // Capture command; empty selects rpicam-vid
        bool verbose;       // Enable verbose logging

        CameraConfig() : width(1280), height(720), framerate(30),
                         format(PixelFormat::YUV420), verbose(false) {}
    };

    // Camera backed by a capture subprocess writing raw frames to stdout
    class Camera
    {
    public:
        Camera();
        virtual ~Camera();

        // Initialize camera with configuration
        // Returns true on success
        bool init(const CameraConfig &config);

        // Start camera capture
        virtual bool start();

        // Stop camera capture
        virtual void stop();

        // Capture a single frame (blocking)
        // Returns pointer to frame data (valid until next capture)
        // Returns nullptr when the device is unavailable; see get_error()
        virtual Frame *capture_frame();

        // Get current configuration
        const CameraConfig &get_config() const { return config_; }

        // Check if camera is running
        bool is_running() const { return running_; }

        // Get last error message
        const std::string &get_error() const { return last_error_; }

        // Build the default capture command line for a configuration
        static std::string default_command(const CameraConfig &config);

    protected:
        CameraConfig config_;
        bool running_;
        std::string last_error_;
        Frame current_frame_;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;

        // Disable copy
        Camera(const Camera &) = delete;
        Camera &operator=(const Camera &) = delete;
    };

    // Utility functions for image processing
    namespace utils
    {
        // Convert YUV420 to RGB888
        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height);

        // Convert RGB to grayscale
        void rgb_to_gray(const uint8_t *rgb, uint8_t *gray,
                         uint32_t width, uint32_t height);

        // Mirror an RGB888 frame around its vertical axis, in place
        void flip_horizontal(Frame &frame);

        // Read exactly `size` bytes from a pipe, retrying short reads.
        // Returns the number of bytes read; fewer than `size` means EOF or error.
        size_t read_full(FILE *pipe, uint8_t *dst, size_t size, int max_retries);
    }

} // namespace camera
