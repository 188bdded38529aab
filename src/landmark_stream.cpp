#include "landmark_stream.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace hand_tracking {

using json = nlohmann::json;

LandmarkStream::LandmarkStream() {}

LandmarkStream::LandmarkStream(const LandmarkStreamConfig& config) : config_(config) {}

LandmarkStream::~LandmarkStream() { close(); }

bool LandmarkStream::init(const LandmarkStreamConfig& config) {
    close();
    config_ = config;
    lines_read_ = 0;
    malformed_lines_ = 0;

    if (!config_.command.empty()) {
        std::cerr << "[LandmarkStream][INFO] Using producer command: " << config_.command << "\n";
        source_ = popen(config_.command.c_str(), "r");
        is_pipe_ = true;
        if (!source_) {
            last_error_ = "Failed to start producer: " + config_.command;
            std::cerr << "[LandmarkStream][ERROR] popen() failed for: " << config_.command << "\n";
            return false;
        }
    } else if (!config_.path.empty()) {
        source_ = std::fopen(config_.path.c_str(), "r");
        is_pipe_ = false;
        if (!source_) {
            last_error_ = "Failed to open " + config_.path + ": " + std::strerror(errno);
            std::cerr << "[LandmarkStream][ERROR] " << last_error_ << "\n";
            return false;
        }
    } else {
        last_error_ = "No landmark source configured";
        std::cerr << "[LandmarkStream][ERROR] " << last_error_ << "\n";
        return false;
    }
    return true;
}

void LandmarkStream::close() {
    if (!source_) return;
    if (is_pipe_)
        pclose(source_);
    else
        std::fclose(source_);
    source_ = nullptr;
}

bool LandmarkStream::read_line(std::string& line) {
    line.clear();
    char chunk[4096];
    while (std::fgets(chunk, sizeof(chunk), source_) != nullptr) {
        line += chunk;
        if (!line.empty() && line.back() == '\n') {
            line.pop_back();
            return true;
        }
    }
    // Last line without a trailing newline still counts
    return !line.empty();
}

bool LandmarkStream::detect(const camera::Frame& frame, std::vector<HandLandmarks>& hands) {
    hands.clear();
    if (!source_) {
        last_error_ = "Landmark stream not open";
        return false;
    }

    std::string line;
    if (!read_line(line)) {
        last_error_ = "End of landmark stream";
        if (config_.verbose)
            std::cerr << "[LandmarkStream] End of stream after " << lines_read_ << " lines\n";
        close();
        return false;
    }
    lines_read_++;

    if (!parse_line(line, frame.width, frame.height, config_.min_confidence, config_.max_hands, hands)) {
        malformed_lines_++;
        std::cerr << "[LandmarkStream][WARN] Ignoring malformed line " << lines_read_ << "\n";
        hands.clear();
    }
    return true;
}

bool LandmarkStream::parse_line(const std::string& line, uint32_t width, uint32_t height,
                                float min_confidence, int max_hands,
                                std::vector<HandLandmarks>& hands) {
    hands.clear();
    try {
        json j = json::parse(line);
        if (!j.is_object() || !j.contains("hands") || !j["hands"].is_array())
            return false;

        bool pixels = j.value("space", std::string("normalized")) == "pixels";

        for (const auto& h : j["hands"]) {
            if (static_cast<int>(hands.size()) >= max_hands) break;

            const auto& lms = h.at("landmarks");
            if (!lms.is_array() || lms.size() != static_cast<size_t>(kNumLandmarks))
                return false;

            float score = h.value("score", 1.0f);
            if (score < min_confidence) continue;

            HandLandmarks hand;
            for (int i = 0; i < kNumLandmarks; ++i) {
                const auto& p = lms[i];
                if (!p.is_array() || p.size() < 2) return false;
                double x = p[0].get<double>();
                double y = p[1].get<double>();
                if (!pixels) {
                    x *= width;
                    y *= height;
                }
                // Reject points more than one frame size outside the frame
                if (!(x >= -static_cast<double>(width) && x <= 2.0 * width) ||
                    !(y >= -static_cast<double>(height) && y <= 2.0 * height))
                    return false;
                hand.set(i, static_cast<int>(x), static_cast<int>(y));
            }
            hand.handedness = h.value("handedness", 0.0f);
            hand.score = score;
            hands.push_back(hand);
        }
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[LandmarkStream] JSON parse error: " << e.what() << "\n";
        hands.clear();
        return false;
    }
}

} // namespace hand_tracking
