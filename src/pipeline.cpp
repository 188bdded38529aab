#include "pipeline.hpp"
#include "painter_config.hpp"
#include <cerrno>
#include <chrono>
#include <iostream>
#include <poll.h>
#include <unistd.h>

using namespace std::chrono;

namespace pipeline
{

    Pipeline::Pipeline(const PipelineConfig &cfg,
                       camera::Camera &camera,
                       hand_tracking::PoseEstimator &estimator,
                       gesture::PaintSession &session,
                       const painter::Toolbar &toolbar,
                       painter::DisplaySink &display)
        : config_(cfg), camera_(camera), estimator_(estimator), session_(session),
          toolbar_(toolbar), display_(display), compositor_(cfg.mask_threshold)
    {
    }

    bool Pipeline::step()
    {
        auto t0 = steady_clock::now();

        camera::Frame *frame = camera_.capture_frame();
        if (!frame)
        {
            last_error_ = "Camera unavailable: " + camera_.get_error();
            std::cerr << "[Pipeline][ERROR] " << last_error_ << "\n";
            return false;
        }

        if (config_.mirror)
            camera::utils::flip_horizontal(*frame);

        if (!estimator_.detect(*frame, hands_))
        {
            last_error_ = "Pose estimator unavailable: " + estimator_.get_error();
            std::cerr << "[Pipeline][ERROR] " << last_error_ << "\n";
            return false;
        }

        // Only the first hand drives gestures
        last_frame_had_hand_ = false;
        if (!hands_.empty())
        {
            const hand_tracking::HandLandmarks &hand = hands_.front();
            gesture::FrameGesture g;
            if (session_.process(hand, g))
            {
                last_frame_had_hand_ = true;
                if (config_.draw_landmarks)
                    compositor::overlay::draw_landmarks(*frame, hand, painter::constants::kLandmarkRadius,
                                                        painter::constants::kLandmarkColor);
                compositor::overlay::draw_request(*frame, g.overlay);
                record(g);
            }
        }
        if (!last_frame_had_hand_)
            stats_.frames_without_hand++;

        const camera::Frame *header = toolbar_.image(session_.active_header_index());
        if (!compositor_.composite(*frame, session_.canvas().buffer(), header))
        {
            stats_.frames_skipped++;
            stats_.frames_processed++;
            return true;
        }

        if (!display_.show(*frame))
        {
            last_error_ = "Display unavailable: " + display_.get_error();
            std::cerr << "[Pipeline][ERROR] " << last_error_ << "\n";
            return false;
        }

        double ms = duration_cast<microseconds>(steady_clock::now() - t0).count() / 1000.0;
        stats_.frames_processed++;
        stats_.avg_frame_ms += (ms - stats_.avg_frame_ms) / static_cast<double>(stats_.frames_processed);
        return true;
    }

    void Pipeline::record(const gesture::FrameGesture &g)
    {
        if (config_.verbose && g.mode != last_gesture_.mode)
        {
            std::cerr << "[Pipeline] Mode " << gesture::mode_to_string(last_gesture_.mode)
                      << " -> " << gesture::mode_to_string(g.mode)
                      << " (fingers " << hand_tracking::finger_state_to_string(g.fingers) << ")\n";
        }

        if (g.segment_drawn)
            stats_.strokes_drawn++;
        if (g.mode == gesture::GestureMode::CLEARING)
            stats_.clears++;
        if (g.selected_region >= 0)
        {
            stats_.selections++;
            if (config_.verbose && g.selected_region != last_gesture_.selected_region)
                std::cerr << "[Pipeline] Selected header " << session_.active_header_index() << "\n";
        }
        last_gesture_ = g;
    }

    bool Pipeline::run(const std::atomic<bool> &stop_requested)
    {
        while (!stop_requested.load())
        {
            if (config_.max_frames > 0 && stats_.frames_processed >= config_.max_frames)
                break;
            if (!step())
                return false;
        }
        return true;
    }

    void Pipeline::print_stats(std::ostream &out) const
    {
        out << "[Pipeline] Frames processed: " << stats_.frames_processed << "\n"
            << "  • Without hand: " << stats_.frames_without_hand << "\n"
            << "  • Skipped: " << stats_.frames_skipped << "\n"
            << "  • Segments drawn: " << stats_.strokes_drawn << "\n"
            << "  • Selections: " << stats_.selections << "\n"
            << "  • Clears: " << stats_.clears << "\n"
            << "  • Avg frame time: " << stats_.avg_frame_ms << " ms\n";
    }

    QuitKeyWatcher::QuitKeyWatcher(int fd, std::atomic<bool> &stop_flag)
        : fd_(fd), stop_flag_(stop_flag)
    {
    }

    QuitKeyWatcher::~QuitKeyWatcher() { stop(); }

    void QuitKeyWatcher::start()
    {
        if (thread_.joinable())
            return;
        running_ = true;
        thread_ = std::thread(&QuitKeyWatcher::watch_fn, this);
    }

    void QuitKeyWatcher::stop()
    {
        running_ = false;
        if (thread_.joinable())
            thread_.join();
    }

    void QuitKeyWatcher::watch_fn()
    {
        std::string line;
        char buf[64];

        while (running_ && !stop_flag_.load())
        {
            struct pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int prc = poll(&pfd, 1, 100);
            if (prc < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (prc == 0)
                continue;

            ssize_t n = read(fd_, buf, sizeof(buf));
            if (n < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                break;
            }
            if (n == 0)
                break; // EOF

            for (ssize_t i = 0; i < n; ++i)
            {
                if (buf[i] != '\n')
                {
                    line.push_back(buf[i]);
                    continue;
                }
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                if (line == "q" || line == "Q")
                {
                    stop_flag_.store(true);
                    break;
                }
                line.clear();
            }
        }
        running_ = false;
    }

} // namespace pipeline
