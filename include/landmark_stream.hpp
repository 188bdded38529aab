#pragma once

#include "camera.hpp"
#include "hand_landmarks.hpp"
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace hand_tracking {

// External hand-pose estimator. Hands are ordered by the estimator; the
// painter only consumes the first one.
class PoseEstimator {
public:
    virtual ~PoseEstimator() = default;

    // Fill `hands` with the hands found for this frame (possibly none).
    // Returns false when the estimator itself is unavailable.
    virtual bool detect(const camera::Frame& frame, std::vector<HandLandmarks>& hands) = 0;

    // Last error message
    virtual const std::string& get_error() const = 0;
};

// Configuration for a JSON-lines landmark source
struct LandmarkStreamConfig {
    std::string command;          // Producer command (read via popen)
    std::string path;             // Or a recorded file; used when command is empty
    float min_confidence{0.7f};   // Hands scoring below this are dropped
    int max_hands{1};             // Hands kept per frame
    bool verbose{false};
};

// Reads one JSON object per frame, e.g.
//   {"hands":[{"landmarks":[[x,y,z], ... 21 entries], "handedness":0.9, "score":0.95}]}
// Coordinates are normalized to [0,1] unless the object carries
// "space":"pixels". Missing "score" counts as fully confident.
class LandmarkStream : public PoseEstimator {
public:
    LandmarkStream();
    explicit LandmarkStream(const LandmarkStreamConfig& config);
    ~LandmarkStream() override;

    // Open the producer command or file
    bool init(const LandmarkStreamConfig& config);

    // Consume the next line. A malformed line yields no hands; end of
    // stream returns false.
    bool detect(const camera::Frame& frame, std::vector<HandLandmarks>& hands) override;

    void close();

    const std::string& get_error() const override { return last_error_; }
    uint64_t lines_read() const { return lines_read_; }
    uint64_t malformed_lines() const { return malformed_lines_; }

    // Parse one line for a width x height frame. Returns false if the line is
    // not a valid landmark record.
    static bool parse_line(const std::string& line, uint32_t width, uint32_t height,
                           float min_confidence, int max_hands,
                           std::vector<HandLandmarks>& hands);

private:
    LandmarkStreamConfig config_;
    FILE* source_{nullptr};
    bool is_pipe_{false};
    std::string last_error_;
    uint64_t lines_read_{0};
    uint64_t malformed_lines_{0};

    bool read_line(std::string& line);

    // Disable copy
    LandmarkStream(const LandmarkStream&) = delete;
    LandmarkStream& operator=(const LandmarkStream&) = delete;
};

} // namespace hand_tracking
