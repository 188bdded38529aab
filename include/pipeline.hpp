#pragma once
#include "camera.hpp"
#include "display_sink.hpp"
#include "frame_compositor.hpp"
#include "gesture_resolver.hpp"
#include "landmark_stream.hpp"
#include "toolbar.hpp"
#include <atomic>
#include <cstdint>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace pipeline
{

    struct PipelineConfig
    {
        bool mirror = true;
        bool draw_landmarks = true;
        int mask_threshold = compositor::kDefaultMaskThreshold;
        uint64_t max_frames = 0; // 0 = until stopped
        bool verbose = false;
    };

    struct PipelineStats
    {
        uint64_t frames_processed{0};
        uint64_t frames_without_hand{0};
        uint64_t frames_skipped{0};
        uint64_t strokes_drawn{0};   // Segments added to the canvas
        uint64_t clears{0};
        uint64_t selections{0};      // Frames that picked a toolbar entry
        double avg_frame_ms{0.0};

        void reset() noexcept
        {
            frames_processed = 0;
            frames_without_hand = 0;
            frames_skipped = 0;
            strokes_drawn = 0;
            clears = 0;
            selections = 0;
            avg_frame_ms = 0.0;
        }
    };

    // Frame-synchronous loop: capture, track, resolve, composite, display.
    // Everything runs on the caller's thread; one frame completes before the
    // next capture.
    class Pipeline
    {
    public:
        Pipeline(const PipelineConfig &cfg,
                 camera::Camera &camera,
                 hand_tracking::PoseEstimator &estimator,
                 gesture::PaintSession &session,
                 const painter::Toolbar &toolbar,
                 painter::DisplaySink &display);

        // Process one frame. Returns false when the camera, the estimator or
        // the display is unavailable; see get_error().
        bool step();

        // Step until `stop_requested`, the frame limit or a failure.
        // Returns false only on failure.
        bool run(const std::atomic<bool> &stop_requested);

        const PipelineStats &get_stats() const { return stats_; }
        const gesture::FrameGesture &last_gesture() const { return last_gesture_; }
        bool last_frame_had_hand() const { return last_frame_had_hand_; }
        const std::string &get_error() const { return last_error_; }

        void print_stats(std::ostream &out) const;

    private:
        PipelineConfig config_;
        camera::Camera &camera_;
        hand_tracking::PoseEstimator &estimator_;
        gesture::PaintSession &session_;
        const painter::Toolbar &toolbar_;
        painter::DisplaySink &display_;
        compositor::FrameCompositor compositor_;

        std::vector<hand_tracking::HandLandmarks> hands_;
        gesture::FrameGesture last_gesture_;
        bool last_frame_had_hand_{false};
        PipelineStats stats_;
        std::string last_error_;

        void record(const gesture::FrameGesture &g);
    };

    // Watches a file descriptor for a line reading "q" or "Q" and raises
    // `stop_flag` when it sees one. The reader polls with a short timeout so
    // stop() can join it even when no input ever arrives.
    class QuitKeyWatcher
    {
    public:
        QuitKeyWatcher(int fd, std::atomic<bool> &stop_flag);
        ~QuitKeyWatcher();

        QuitKeyWatcher(const QuitKeyWatcher &) = delete;
        QuitKeyWatcher &operator=(const QuitKeyWatcher &) = delete;

        void start();
        void stop();
        bool is_running() const { return running_; }

    private:
        int fd_;
        std::atomic<bool> &stop_flag_;
        std::atomic<bool> running_{false};
        std::thread thread_;

        void watch_fn();
    };

} // namespace pipeline
