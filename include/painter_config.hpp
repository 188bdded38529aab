#pragma once

#include "gesture_resolver.hpp"
#include <cstdint>
#include <string>

namespace painter {

// Named constants for better readability
namespace constants {
    constexpr uint32_t kDefaultWidth = 1280;
    constexpr uint32_t kDefaultHeight = 720;
    constexpr int kLandmarkRadius = 10;
    constexpr uint32_t kLandmarkColor = 0x000000FF; // blue
    constexpr int kHeaderHeight = 125;
    constexpr uint32_t kMaxFrameSize = 16384;   // Largest accepted width or height
    constexpr uint32_t kMaxFramerate = 240;
} // namespace constants

// Configuration for the painter application
struct PainterConfig {
    // Frame geometry
    uint32_t width{constants::kDefaultWidth};
    uint32_t height{constants::kDefaultHeight};
    uint32_t framerate{30};
    bool mirror{true};             // Flip frames so the view acts like a mirror

    // Gesture and brush parameters
    gesture::ResolverConfig resolver;

    // Compositing
    int mask_threshold{50};        // Canvas luma above this counts as painted
    bool draw_landmarks{true};     // Circle tracked landmarks on the live frame

    // Hand tracking
    float detection_confidence{0.7f};

    // Collaborators
    std::string header_dir;        // Directory of PPM header images
    std::string camera_cmd;        // Capture command (raw frames on stdout)
    bool camera_rgb{false};        // Capture command emits RGB24 instead of YUV420
    std::string landmark_cmd;      // Landmark producer command (JSON lines)
    std::string landmark_file;     // Recorded landmark file (JSON lines)
    std::string display_cmd;       // Player command reading raw RGB24 on stdin
    std::string snapshot_dir;      // Directory for PPM snapshots
    int snapshot_every{1};         // Write every Nth frame
    uint64_t max_frames{0};        // Stop after this many frames (0 = unlimited)

    bool verbose{false};           // Enable verbose logging

    // Load from file
    [[nodiscard]] bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    // Validation
    [[nodiscard]] bool validate() const noexcept;
};

} // namespace painter
