#pragma once

#include "camera.hpp"
#include "gesture_resolver.hpp"
#include <string>
#include <vector>

namespace painter {

// Binary PPM (P6) image files
namespace ppm {
    bool read(const std::string& path, camera::Frame& out);
    bool write(const std::string& path, const camera::Frame& frame);
}

// Ordered toolbar header images; entry i is shown while header index i is
// active. At least one entry per toolbar region.
class Toolbar {
public:
    Toolbar() = default;

    // Load every *.ppm in `dir`, sorted by file name. Returns false if the
    // directory cannot be read or holds fewer images than toolbar regions.
    bool load_directory(const std::string& dir);

    // Draw one header bar per region: the swatches of all regions with the
    // selected one outlined
    void synthesize(uint32_t width, uint32_t height, const gesture::ResolverConfig& config);

    size_t size() const { return images_.size(); }
    bool empty() const { return images_.empty(); }

    // Header image for an index, nullptr when out of range
    const camera::Frame* image(int index) const;

private:
    std::vector<camera::Frame> images_;
};

} // namespace painter
