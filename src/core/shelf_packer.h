#pragma once

#include <string>
#include <vector>

namespace tessera::core {

constexpr int k_default_padding = 2;

struct PackInput {
    std::string id;
    int width = 0;
    int height = 0;
};

struct PackedRect {
    std::string id;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const PackedRect&) const = default;
};

struct PackResult {
    std::vector<PackedRect> placed;
    std::vector<std::string> rejected;
    double utilization = 0.0;
};

// Shelf packing into one atlas_size x atlas_size square. Inputs are ordered by height,
// tallest first, ties kept in input order. Each placement reserves `padding` pixels
// to its right and below. Images larger than atlas_size - 2 * padding on either axis
// are rejected without trying.
PackResult pack_shelves(const std::vector<PackInput>& images, int atlas_size, int padding);

// True when the padded footprints of a and b intersect.
bool rects_overlap(const PackedRect& a, const PackedRect& b, int padding);
bool placements_overlap(const std::vector<PackedRect>& rects, int padding);

} // namespace tessera::core
