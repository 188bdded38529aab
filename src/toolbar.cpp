#include "toolbar.hpp"
#include "frame_compositor.hpp"
#include "painter_config.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <iostream>

namespace painter {

namespace ppm {

// Skip whitespace and '#' comments between header fields
static void skip_separators(std::istream& in) {
    while (in) {
        int c = in.peek();
        if (c == '#') {
            std::string comment;
            std::getline(in, comment);
        } else if (std::isspace(c)) {
            in.get();
        } else {
            break;
        }
    }
}

bool read(const std::string& path, camera::Frame& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[Toolbar] Failed to open image: " << path << "\n";
        return false;
    }

    std::string magic;
    file >> magic;
    if (magic != "P6") {
        std::cerr << "[Toolbar] Not a binary PPM (P6): " << path << "\n";
        return false;
    }

    uint32_t width = 0, height = 0, maxval = 0;
    skip_separators(file);
    file >> width;
    skip_separators(file);
    file >> height;
    skip_separators(file);
    file >> maxval;
    if (!file || width == 0 || height == 0 || maxval != 255) {
        std::cerr << "[Toolbar] Unsupported PPM header in " << path << "\n";
        return false;
    }
    if (width > constants::kMaxFrameSize || height > constants::kMaxFrameSize) {
        std::cerr << "[Toolbar] PPM too large (" << width << "x" << height << ") in " << path << "\n";
        return false;
    }
    file.get(); // single whitespace before the raster

    out.allocate(width, height);
    file.read(reinterpret_cast<char*>(out.data.data()), static_cast<std::streamsize>(out.data.size()));
    if (file.gcount() != static_cast<std::streamsize>(out.data.size())) {
        std::cerr << "[Toolbar] Truncated PPM raster in " << path << "\n";
        return false;
    }
    return true;
}

bool write(const std::string& path, const camera::Frame& frame) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[Toolbar] Failed to open for writing: " << path << "\n";
        return false;
    }
    file << "P6\n" << frame.width << " " << frame.height << "\n255\n";
    file.write(reinterpret_cast<const char*>(frame.data.data()), static_cast<std::streamsize>(frame.data.size()));
    return file.good();
}

} // namespace ppm

bool Toolbar::load_directory(const std::string& dir) {
    DIR* d = opendir(dir.c_str());
    if (!d) {
        std::cerr << "[Toolbar] Failed to open " << dir << ": " << std::strerror(errno) << "\n";
        return false;
    }

    std::vector<std::string> names;
    struct dirent* ent;
    while ((ent = readdir(d)) != nullptr) {
        std::string name = ent->d_name;
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ".ppm") == 0)
            names.push_back(name);
    }
    closedir(d);
    std::sort(names.begin(), names.end());

    std::vector<camera::Frame> loaded;
    for (const auto& name : names) {
        camera::Frame img;
        if (!ppm::read(dir + "/" + name, img)) return false;
        loaded.push_back(std::move(img));
    }

    if (loaded.size() < static_cast<size_t>(gesture::kNumHeaderRegions)) {
        std::cerr << "[Toolbar] Need " << gesture::kNumHeaderRegions << " header images in " << dir
                  << ", found " << loaded.size() << "\n";
        return false;
    }

    images_ = std::move(loaded);
    std::cerr << "[Toolbar] Loaded " << images_.size() << " header images from " << dir << "\n";
    return true;
}

void Toolbar::synthesize(uint32_t width, uint32_t height, const gesture::ResolverConfig& config) {
    using hand_tracking::Point;
    const uint32_t background = 0x00303030;
    const uint32_t outline = 0x00FFFFFF;
    const int swatch_top = 15;
    const int swatch_bottom = std::min(static_cast<int>(height) - 1, config.toolbar_band - 5);

    images_.clear();
    for (int selected = 0; selected < gesture::kNumHeaderRegions; ++selected) {
        camera::Frame header(width, height);
        compositor::overlay::fill_rect(header, Point(0, 0),
                                       Point(static_cast<int>(width) - 1, static_cast<int>(height) - 1),
                                       background);

        for (int i = 0; i < gesture::kNumHeaderRegions; ++i) {
            const auto& region = config.regions[i];
            if (region.header_index == selected) {
                compositor::overlay::fill_rect(header, Point(region.x_min - 6, swatch_top - 6),
                                               Point(region.x_max + 6, swatch_bottom + 6), outline);
            }
            compositor::overlay::fill_rect(header, Point(region.x_min, swatch_top),
                                           Point(region.x_max, swatch_bottom), region.color);
        }
        images_.push_back(std::move(header));
    }
}

const camera::Frame* Toolbar::image(int index) const {
    if (index < 0 || index >= static_cast<int>(images_.size())) return nullptr;
    return &images_[index];
}

} // namespace painter
