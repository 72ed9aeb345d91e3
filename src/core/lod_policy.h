#pragma once

#include "image.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace tessera::core {

enum class DetailLevel : int {
    LEVEL_0 = 0,
    LEVEL_1,
    LEVEL_2,
    LEVEL_3,
    LEVEL_4,
    LEVEL_5,
    LEVEL_6,
    LEVEL_7,
};

constexpr int k_detail_level_count = 8;

// One row of the level table: target resolution and half-open zoom range [zoom_min, zoom_max).
struct LevelSpec {
    int resolution = 0;
    double zoom_min = 0.0;
    double zoom_max = 0.0;
};

using LodTable = std::array<LevelSpec, k_detail_level_count>;

const LodTable& default_lod_table();

// Rejects tables whose ranges are empty, unordered, or leave gaps between levels.
bool validate_lod_table(const LodTable& table, std::string& error);

inline int level_index(DetailLevel level) {
    return static_cast<int>(level);
}

DetailLevel level_from_index(int index);
std::string level_name(DetailLevel level);

class LodPolicy {
public:
    LodPolicy();
    explicit LodPolicy(const LodTable& table);

    DetailLevel level_for(double zoom) const;
    std::optional<DetailLevel> crossed_boundary(double previous_zoom, double next_zoom) const;

    DetailLevel lowest_level() const { return DetailLevel::LEVEL_0; }
    DetailLevel focused_level() const { return DetailLevel::LEVEL_7; }
    DetailLevel boosted_level(DetailLevel level) const;

    int resolution(DetailLevel level) const;
    PixelSize scaled_size(int natural_width, int natural_height, DetailLevel level) const;
    size_t estimate_photo_bytes(DetailLevel level) const;

    const LodTable& table() const { return table_; }

private:
    LodTable table_;
};

} // namespace tessera::core
