#include "painter_config.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <iostream>

namespace painter {

// Reads a whole number into `out` only if it lies in [lo, hi]; otherwise
// marks the stream failed so the caller reports a bad value.
template <typename T>
static void read_bounded(std::istream& iss, T& out, long long lo, long long hi) {
    long long value = 0;
    if (!(iss >> value)) return;
    if (value < lo || value > hi) {
        iss.setstate(std::ios::failbit);
        return;
    }
    out = static_cast<T>(value);
}

bool PainterConfig::validate() const noexcept {
    if (width == 0 || height == 0) return false;
    if (width > constants::kMaxFrameSize || height > constants::kMaxFrameSize) return false;
    if (framerate == 0 || framerate > constants::kMaxFramerate) return false;
    if (mask_threshold < 0 || mask_threshold > 255) return false;
    if (detection_confidence < 0.0f || detection_confidence > 1.0f) return false;
    if (snapshot_every < 1) return false;
    if (!resolver.validate()) return false;
    return true;
}

bool PainterConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        if (key == "width") read_bounded(iss, width, 1, constants::kMaxFrameSize);
        else if (key == "height") read_bounded(iss, height, 1, constants::kMaxFrameSize);
        else if (key == "framerate") read_bounded(iss, framerate, 1, constants::kMaxFramerate);
        else if (key == "mirror") iss >> mirror;
        else if (key == "brush_thickness") iss >> resolver.brush_thickness;
        else if (key == "pointer_radius") iss >> resolver.pointer_radius;
        else if (key == "selection_padding") iss >> resolver.selection_padding;
        else if (key == "toolbar_band") iss >> resolver.toolbar_band;
        else if (key == "mask_threshold") iss >> mask_threshold;
        else if (key == "draw_landmarks") iss >> draw_landmarks;
        else if (key == "detection_confidence") iss >> detection_confidence;
        else if (key == "header_dir") iss >> header_dir;
        else if (key == "camera_rgb") iss >> camera_rgb;
        else if (key == "snapshot_dir") iss >> snapshot_dir;
        else if (key == "snapshot_every") read_bounded(iss, snapshot_every, 1, std::numeric_limits<int>::max());
        else if (key == "max_frames") read_bounded(iss, max_frames, 0, std::numeric_limits<long long>::max());
        else if (key == "verbose") iss >> verbose;
        else if (key == "camera_cmd" || key == "landmark_cmd" || key == "display_cmd" ||
                 key == "landmark_file") {
            // Commands keep their spaces: take the rest of the line
            std::string value;
            std::getline(iss >> std::ws, value);
            if (key == "camera_cmd") camera_cmd = value;
            else if (key == "landmark_cmd") landmark_cmd = value;
            else if (key == "display_cmd") display_cmd = value;
            else landmark_file = value;
        } else if (key == "region") {
            // region <index> <x_min> <x_max> <r> <g> <b>
            int index = -1, x_min = 0, x_max = 0, r = 0, g = 0, b = 0;
            if (!(iss >> index >> x_min >> x_max >> r >> g >> b) ||
                index < 0 || index >= gesture::kNumHeaderRegions ||
                r < 0 || r > 255 || g < 0 || g > 255 || b < 0 || b > 255) {
                std::cerr << "[Config] Bad region on line " << line_no << ": " << line << "\n";
                return false;
            }
            resolver.regions[index] = gesture::HeaderRegion(
                x_min, x_max, index,
                canvas::make_color(static_cast<uint8_t>(r), static_cast<uint8_t>(g), static_cast<uint8_t>(b)));
        } else {
            std::cerr << "[Config] Unknown key '" << key << "' on line " << line_no << "\n";
            continue;
        }

        if (iss.fail()) {
            std::cerr << "[Config] Bad value for '" << key << "' on line " << line_no << "\n";
            return false;
        }
    }

    return validate();
}

bool PainterConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return false;
    }

    file << "# Painter Configuration\n";
    file << "# Frame\n";
    file << "width " << width << "\n";
    file << "height " << height << "\n";
    file << "framerate " << framerate << "\n";
    file << "mirror " << mirror << "\n";
    file << "\n# Brush and toolbar\n";
    file << "brush_thickness " << resolver.brush_thickness << "\n";
    file << "pointer_radius " << resolver.pointer_radius << "\n";
    file << "selection_padding " << resolver.selection_padding << "\n";
    file << "toolbar_band " << resolver.toolbar_band << "\n";
    for (size_t i = 0; i < resolver.regions.size(); ++i) {
        const auto& region = resolver.regions[i];
        file << "region " << i << " " << region.x_min << " " << region.x_max << " "
             << static_cast<int>(canvas::red_of(region.color)) << " "
             << static_cast<int>(canvas::green_of(region.color)) << " "
             << static_cast<int>(canvas::blue_of(region.color)) << "\n";
    }
    file << "\n# Compositing\n";
    file << "mask_threshold " << mask_threshold << "\n";
    file << "draw_landmarks " << draw_landmarks << "\n";
    file << "\n# Hand tracking\n";
    file << "detection_confidence " << detection_confidence << "\n";
    file << "\n# Collaborators\n";
    if (!header_dir.empty()) file << "header_dir " << header_dir << "\n";
    if (!camera_cmd.empty()) file << "camera_cmd " << camera_cmd << "\n";
    file << "camera_rgb " << camera_rgb << "\n";
    if (!landmark_cmd.empty()) file << "landmark_cmd " << landmark_cmd << "\n";
    if (!landmark_file.empty()) file << "landmark_file " << landmark_file << "\n";
    if (!display_cmd.empty()) file << "display_cmd " << display_cmd << "\n";
    if (!snapshot_dir.empty()) file << "snapshot_dir " << snapshot_dir << "\n";
    file << "snapshot_every " << snapshot_every << "\n";
    file << "max_frames " << max_frames << "\n";
    file << "\n# Logging\n";
    file << "verbose " << verbose << "\n";
    return file.good();
}

} // namespace painter
