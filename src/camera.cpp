#include "camera.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <cstdlib>
#include <algorithm>
#include <chrono>
#include <thread>

// Minimal camera capture using a raw video stream piped via popen.
// This avoids linking against libcamera/V4L2 directly and uses only system tools.
//  - Resilient to short reads (will retry until full frame or retries exhausted)
//  - Command override via CameraConfig::command or env var AIRPAINT_CAMERA_CMD
//  - Converts YUV420 -> RGB888 for downstream processing
// Limitations:
//  - Default command relies on rpicam-vid being installed
//  - Blocking read per frame

namespace camera
{

    // Frame methods
    void Frame::allocate(uint32_t w, uint32_t h)
    {
        width = w;
        height = h;
        format = PixelFormat::RGB888;
        stride = static_cast<int>(w * 3);
        data.assign(static_cast<size_t>(w) * h * 3, 0);
    }

    bool Frame::get_rgb(uint32_t x, uint32_t y, uint8_t &r, uint8_t &g, uint8_t &b) const
    {
        if (data.empty() || x >= width || y >= height)
            return false;

        size_t idx = (y * stride) + (x * 3);
        if (idx + 2 >= data.size())
            return false;
        r = data[idx];
        g = data[idx + 1];
        b = data[idx + 2];
        return true;
    }

    void Frame::set_rgb(int x, int y, uint8_t r, uint8_t g, uint8_t b)
    {
        if (x < 0 || y < 0 || x >= static_cast<int>(width) || y >= static_cast<int>(height))
            return;
        size_t idx = (y * stride) + (x * 3);
        data[idx] = r;
        data[idx + 1] = g;
        data[idx + 2] = b;
    }

    // Camera implementation using a capture subprocess
    class Camera::Impl
    {
    public:
        Impl() : initialized_(false), running_(false), frame_count_(0), pipe_(nullptr), expected_size_(0) {}
        ~Impl() { stop(); }

        bool init(const CameraConfig &config)
        {
            config_ = config;
            if (config_.width == 0 || config_.height == 0)
            {
                last_error_ = "Invalid frame size";
                return false;
            }
            if (config_.format == PixelFormat::YUV420)
                expected_size_ = config_.width * config_.height * 3 / 2;
            else
                expected_size_ = config_.width * config_.height * 3;
            initialized_ = true;
            if (config_.verbose)
                std::cerr << "[Camera] Initialized: " << config_.width << "x" << config_.height << "@" << config_.framerate << "fps" << std::endl;
            return true;
        }

        bool start()
        {
            if (!initialized_)
            {
                last_error_ = "Camera not initialized";
                return false;
            }
            if (running_)
                return true;

            std::string cmd = config_.command;
            const char *env_cmd = std::getenv("AIRPAINT_CAMERA_CMD");
            if (cmd.empty() && env_cmd)
                cmd = env_cmd;
            if (cmd.empty())
                cmd = Camera::default_command(config_);

            std::cerr << "[Camera][INFO] Using capture command: " << cmd << std::endl;
            pipe_ = popen(cmd.c_str(), "r");
            if (!pipe_)
            {
                last_error_ = "Failed to start capture pipe";
                std::cerr << "[Camera][ERROR] popen() failed for: " << cmd << std::endl;
                return false;
            }
            running_ = true;
            frame_count_ = 0;
            return true;
        }

        void stop()
        {
            if (pipe_)
            {
                pclose(pipe_);
                pipe_ = nullptr;
            }
            if (running_ && config_.verbose)
            {
                std::cerr << "[Camera] Stopped after " << frame_count_ << " frames" << std::endl;
            }
            running_ = false;
        }

        Frame *capture_frame(Frame &frame)
        {
            if (!running_ || !pipe_)
            {
                last_error_ = "Camera not running";
                std::cerr << "[Camera][ERROR] Not running.\n";
                return nullptr;
            }

            raw_.resize(expected_size_);
            size_t read_total = utils::read_full(pipe_, raw_.data(), expected_size_, 4);
            if (read_total != expected_size_)
            {
                if (feof(pipe_))
                    last_error_ = "End of stream";
                else
                    last_error_ = "Frame read incomplete (" + std::to_string(read_total) + "/" + std::to_string(expected_size_) + " bytes)";
                std::cerr << "[Camera][ERROR] " << last_error_ << " after " << frame_count_ << " frames.\n";
                stop();
                return nullptr;
            }

            if (frame.width != config_.width || frame.height != config_.height)
                frame.allocate(config_.width, config_.height);

            if (config_.format == PixelFormat::YUV420)
                utils::yuv420_to_rgb888(raw_.data(), frame.data.data(), config_.width, config_.height);
            else
                std::copy(raw_.begin(), raw_.end(), frame.data.begin());

            auto now = std::chrono::steady_clock::now();
            frame.timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
            frame.format = PixelFormat::RGB888;
            frame_count_++;
            return &frame;
        }

        const std::string &get_error() const { return last_error_; }

    private:
        CameraConfig config_{};
        bool initialized_{};
        bool running_{};
        uint64_t frame_count_{};
        std::string last_error_{};
        std::vector<uint8_t> raw_{}; // raw read buffer
        FILE *pipe_{};
        size_t expected_size_{};
    };

    // Camera public interface
    Camera::Camera() : running_(false), impl_(new Impl()) {}

    Camera::~Camera()
    {
        if (impl_)
            impl_->stop();
    }

    bool Camera::init(const CameraConfig &config)
    {
        config_ = config;
        bool result = impl_->init(config);
        if (!result)
        {
            last_error_ = impl_->get_error();
        }
        return result;
    }

    bool Camera::start()
    {
        bool result = impl_->start();
        if (result)
        {
            running_ = true;
        }
        else
        {
            last_error_ = impl_->get_error();
        }
        return result;
    }

    void Camera::stop()
    {
        impl_->stop();
        running_ = false;
    }

    Frame *Camera::capture_frame()
    {
        Frame *frame = impl_->capture_frame(current_frame_);
        if (!frame)
        {
            last_error_ = impl_->get_error();
            running_ = false;
        }
        return frame;
    }

    std::string Camera::default_command(const CameraConfig &config)
    {
        if (config.format == PixelFormat::RGB888)
        {
            return "ffmpeg -loglevel error -f v4l2 -video_size " + std::to_string(config.width) + "x" +
                   std::to_string(config.height) + " -framerate " + std::to_string(config.framerate) +
                   " -i /dev/video0 -pix_fmt rgb24 -f rawvideo -";
        }
        return "rpicam-vid -t 0 -n --codec yuv420 --width " + std::to_string(config.width) +
               " --height " + std::to_string(config.height) +
               " --framerate " + std::to_string(config.framerate) + " -o -";
    }

    // Utility functions
    namespace utils
    {

        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height)
        {
            size_t y_size = width * height;
            size_t uv_size = (width / 2) * (height / 2);

            const uint8_t *y_plane = yuv;
            const uint8_t *u_plane = yuv + y_size;
            const uint8_t *v_plane = yuv + y_size + uv_size;

            for (uint32_t y = 0; y < height; y++)
            {
                for (uint32_t x = 0; x < width; x++)
                {
                    size_t y_idx = y * width + x;
                    size_t uv_idx = (y / 2) * (width / 2) + (x / 2);

                    int Y = y_plane[y_idx];
                    int U = u_plane[uv_idx] - 128;
                    int V = v_plane[uv_idx] - 128;

                    int R = Y + (1.402 * V);
                    int G = Y - (0.344136 * U) - (0.714136 * V);
                    int B = Y + (1.772 * U);

                    size_t rgb_idx = y_idx * 3;
                    rgb[rgb_idx] = static_cast<uint8_t>(std::clamp(R, 0, 255));
                    rgb[rgb_idx + 1] = static_cast<uint8_t>(std::clamp(G, 0, 255));
                    rgb[rgb_idx + 2] = static_cast<uint8_t>(std::clamp(B, 0, 255));
                }
            }
        }

        void rgb_to_gray(const uint8_t *rgb, uint8_t *gray,
                         uint32_t width, uint32_t height)
        {
            for (uint32_t i = 0; i < width * height; i++)
            {
                size_t rgb_idx = i * 3;
                // Luminosity method: 0.299*R + 0.587*G + 0.114*B, rounded
                gray[i] = static_cast<uint8_t>(
                    0.299f * rgb[rgb_idx] +
                    0.587f * rgb[rgb_idx + 1] +
                    0.114f * rgb[rgb_idx + 2] + 0.5f);
            }
        }

        void flip_horizontal(Frame &frame)
        {
            if (frame.empty())
                return;
            for (uint32_t y = 0; y < frame.height; y++)
            {
                uint8_t *row = frame.data.data() + static_cast<size_t>(y) * frame.stride;
                for (uint32_t x = 0; x < frame.width / 2; x++)
                {
                    uint8_t *left = row + x * 3;
                    uint8_t *right = row + (frame.width - 1 - x) * 3;
                    std::swap_ranges(left, left + 3, right);
                }
            }
        }

        size_t read_full(FILE *pipe, uint8_t *dst, size_t size, int max_retries)
        {
            size_t read_total = 0;
            int retries = 0;
            while (read_total < size)
            {
                size_t n = fread(dst + read_total, 1, size - read_total, pipe);
                if (n == 0)
                {
                    int err = errno;
                    if (feof(pipe))
                        break;
                    if (ferror(pipe))
                    {
                        std::cerr << "[Camera][ERROR] Read error after " << read_total << " bytes: " << std::strerror(err) << " (errno=" << err << ")\n";
                        break;
                    }
                    if (++retries > max_retries)
                        break;
                    std::cerr << "[Camera][WARN] Short read: " << read_total << "/" << size << " bytes, retry " << retries << ".\n";
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    continue;
                }
                read_total += n;
            }
            return read_total;
        }

    } // namespace utils

} // namespace camera
