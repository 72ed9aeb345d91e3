#include "shelf_packer.h"

#include "checked_math.h"

#include <algorithm>
#include <numeric>

namespace tessera::core {
namespace {

struct Shelf {
    int y = 0;
    int height = 0;
    int cursor = 0;
};

} // namespace

PackResult pack_shelves(const std::vector<PackInput>& images, int atlas_size, int padding) {
    PackResult result;
    int max_extent = 0;
    if (atlas_size <= 0 || padding < 0 || !checked_add_int(atlas_size, -2 * padding, max_extent) || max_extent <= 0) {
        for (const auto& image : images) {
            result.rejected.push_back(image.id);
        }
        return result;
    }

    std::vector<size_t> order(images.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return images[a].height > images[b].height;
    });

    std::vector<Shelf> shelves;
    int next_shelf_y = 0;
    size_t occupied_area = 0;

    for (size_t index : order) {
        const PackInput& image = images[index];
        if (image.width <= 0 || image.height <= 0 || image.width > max_extent || image.height > max_extent) {
            result.rejected.push_back(image.id);
            continue;
        }
        const int padded_w = image.width + padding;
        const int padded_h = image.height + padding;

        bool placed = false;
        for (auto& shelf : shelves) {
            if (shelf.height < padded_h || shelf.cursor > atlas_size - padded_w) {
                continue;
            }
            result.placed.push_back({image.id, shelf.cursor, shelf.y, image.width, image.height});
            shelf.cursor += padded_w;
            placed = true;
            break;
        }

        if (!placed) {
            if (next_shelf_y > atlas_size - padded_h) {
                result.rejected.push_back(image.id);
                continue;
            }
            shelves.push_back({next_shelf_y, padded_h, padded_w});
            result.placed.push_back({image.id, 0, next_shelf_y, image.width, image.height});
            next_shelf_y += padded_h;
        }
        occupied_area += static_cast<size_t>(image.width) * static_cast<size_t>(image.height);
    }

    const double atlas_area = static_cast<double>(atlas_size) * static_cast<double>(atlas_size);
    result.utilization = static_cast<double>(occupied_area) / atlas_area;
    return result;
}

bool rects_overlap(const PackedRect& a, const PackedRect& b, int padding) {
    const long long ax1 = static_cast<long long>(a.x) + a.width + padding;
    const long long ay1 = static_cast<long long>(a.y) + a.height + padding;
    const long long bx1 = static_cast<long long>(b.x) + b.width + padding;
    const long long by1 = static_cast<long long>(b.y) + b.height + padding;
    return a.x < bx1 && b.x < ax1 && a.y < by1 && b.y < ay1;
}

bool placements_overlap(const std::vector<PackedRect>& rects, int padding) {
    for (size_t i = 0; i < rects.size(); ++i) {
        for (size_t j = i + 1; j < rects.size(); ++j) {
            if (rects_overlap(rects[i], rects[j], padding)) {
                return true;
            }
        }
    }
    return false;
}

} // namespace tessera::core
