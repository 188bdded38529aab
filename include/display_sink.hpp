#pragma once

#include "camera.hpp"
#include <cstdint>
#include <cstdio>
#include <string>

namespace painter {

// Consumer of composited frames
class DisplaySink {
public:
    virtual ~DisplaySink() = default;

    // Present one frame. Returns false when the display is gone.
    virtual bool show(const camera::Frame& frame) = 0;

    virtual const std::string& get_error() const = 0;
};

// Streams raw RGB24 frames into a player process, e.g.
//   ffplay -f rawvideo -pixel_format rgb24 -video_size 1280x720 -
class PipeDisplaySink : public DisplaySink {
public:
    explicit PipeDisplaySink(const std::string& command);
    ~PipeDisplaySink() override;

    bool open();
    void close();
    bool show(const camera::Frame& frame) override;
    const std::string& get_error() const override { return last_error_; }

    // Default player command for a frame size
    static std::string default_command(uint32_t width, uint32_t height, uint32_t framerate);

private:
    std::string command_;
    FILE* pipe_{nullptr};
    std::string last_error_;

    // Disable copy
    PipeDisplaySink(const PipeDisplaySink&) = delete;
    PipeDisplaySink& operator=(const PipeDisplaySink&) = delete;
};

// Writes every Nth frame as <dir>/frame_000042.ppm
class PpmDisplaySink : public DisplaySink {
public:
    PpmDisplaySink(const std::string& dir, int every);

    bool show(const camera::Frame& frame) override;
    const std::string& get_error() const override { return last_error_; }

    uint64_t frames_seen() const { return frames_seen_; }
    uint64_t frames_written() const { return frames_written_; }

    // File name used for a frame number
    std::string path_for(uint64_t frame_number) const;

private:
    std::string dir_;
    int every_;
    uint64_t frames_seen_{0};
    uint64_t frames_written_{0};
    std::string last_error_;
};

} // namespace painter
