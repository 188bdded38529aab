#include "display_sink.hpp"
#include "toolbar.hpp"
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace painter {

PipeDisplaySink::PipeDisplaySink(const std::string& command) : command_(command) {}

PipeDisplaySink::~PipeDisplaySink() { close(); }

bool PipeDisplaySink::open() {
    if (pipe_) return true;

    // A player that exits must surface as a failed write, not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    std::cerr << "[Display][INFO] Using player command: " << command_ << "\n";
    pipe_ = popen(command_.c_str(), "w");
    if (!pipe_) {
        last_error_ = "Failed to start player: " + command_;
        std::cerr << "[Display][ERROR] popen() failed for: " << command_ << "\n";
        return false;
    }
    return true;
}

void PipeDisplaySink::close() {
    if (pipe_) {
        pclose(pipe_);
        pipe_ = nullptr;
    }
}

bool PipeDisplaySink::show(const camera::Frame& frame) {
    if (!pipe_ && !open()) return false;

    size_t written = fwrite(frame.data.data(), 1, frame.data.size(), pipe_);
    if (written != frame.data.size() || fflush(pipe_) != 0) {
        last_error_ = "Player pipe closed";
        std::cerr << "[Display][ERROR] Wrote " << written << "/" << frame.data.size() << " bytes, player gone\n";
        close();
        return false;
    }
    return true;
}

std::string PipeDisplaySink::default_command(uint32_t width, uint32_t height, uint32_t framerate) {
    return "ffplay -loglevel error -window_title AirPaint -f rawvideo -pixel_format rgb24 -video_size " +
           std::to_string(width) + "x" + std::to_string(height) +
           " -framerate " + std::to_string(framerate) + " -";
}

PpmDisplaySink::PpmDisplaySink(const std::string& dir, int every)
    : dir_(dir), every_(every < 1 ? 1 : every) {}

std::string PpmDisplaySink::path_for(uint64_t frame_number) const {
    std::ostringstream oss;
    oss << dir_ << "/frame_" << std::setw(6) << std::setfill('0') << frame_number << ".ppm";
    return oss.str();
}

bool PpmDisplaySink::show(const camera::Frame& frame) {
    uint64_t number = frames_seen_++;
    if (number % static_cast<uint64_t>(every_) != 0) return true;

    std::string path = path_for(number);
    if (!ppm::write(path, frame)) {
        last_error_ = "Failed to write " + path;
        return false;
    }
    frames_written_++;
    return true;
}

} // namespace painter
