#include "lod_policy.h"

#include <algorithm>
#include <cmath>

namespace tessera::core {

const LodTable& default_lod_table() {
    static const LodTable table = {{
        {32, 0.0, 0.3},
        {64, 0.3, 0.8},
        {128, 0.8, 1.5},
        {192, 1.5, 2.5},
        {256, 2.5, 4.0},
        {384, 4.0, 6.5},
        {512, 6.5, 10.0},
        {768, 10.0, 16.0},
    }};
    return table;
}

bool validate_lod_table(const LodTable& table, std::string& error) {
    for (int i = 0; i < k_detail_level_count; ++i) {
        const LevelSpec& spec = table[static_cast<size_t>(i)];
        if (spec.resolution <= 0) {
            error = "level " + std::to_string(i) + " has no resolution";
            return false;
        }
        if (!std::isfinite(spec.zoom_min) || !std::isfinite(spec.zoom_max) || spec.zoom_min >= spec.zoom_max) {
            error = "level " + std::to_string(i) + " has an empty zoom range";
            return false;
        }
        if (i == 0) {
            continue;
        }
        const LevelSpec& previous = table[static_cast<size_t>(i - 1)];
        if (spec.zoom_min != previous.zoom_max) {
            error = "level " + std::to_string(i) + " zoom range does not start where level " +
                    std::to_string(i - 1) + " ends";
            return false;
        }
        if (spec.resolution < previous.resolution) {
            error = "level " + std::to_string(i) + " resolution is lower than level " + std::to_string(i - 1);
            return false;
        }
    }
    return true;
}

DetailLevel level_from_index(int index) {
    return static_cast<DetailLevel>(std::clamp(index, 0, k_detail_level_count - 1));
}

std::string level_name(DetailLevel level) {
    return "LEVEL_" + std::to_string(level_index(level));
}

LodPolicy::LodPolicy() : table_(default_lod_table()) {}

LodPolicy::LodPolicy(const LodTable& table) : table_(table) {}

DetailLevel LodPolicy::level_for(double zoom) const {
    // NaN fails this comparison too and clamps low.
    if (!(zoom >= table_.front().zoom_min)) {
        return DetailLevel::LEVEL_0;
    }
    if (zoom >= table_.back().zoom_max) {
        return focused_level();
    }
    const auto it = std::upper_bound(table_.begin(), table_.end(), zoom,
                                     [](double value, const LevelSpec& spec) { return value < spec.zoom_min; });
    return level_from_index(static_cast<int>(it - table_.begin()) - 1);
}

std::optional<DetailLevel> LodPolicy::crossed_boundary(double previous_zoom, double next_zoom) const {
    const DetailLevel before = level_for(previous_zoom);
    const DetailLevel after = level_for(next_zoom);
    if (before == after) {
        return std::nullopt;
    }
    return after;
}

DetailLevel LodPolicy::boosted_level(DetailLevel level) const {
    return level_from_index(level_index(level) + 1);
}

int LodPolicy::resolution(DetailLevel level) const {
    return table_[static_cast<size_t>(level_index(level))].resolution;
}

PixelSize LodPolicy::scaled_size(int natural_width, int natural_height, DetailLevel level) const {
    if (natural_width <= 0 || natural_height <= 0) {
        return {};
    }
    const int target = resolution(level);
    if (natural_width >= natural_height) {
        const double ratio = static_cast<double>(natural_height) / static_cast<double>(natural_width);
        return {target, std::max(1, static_cast<int>(target * ratio))};
    }
    const double ratio = static_cast<double>(natural_width) / static_cast<double>(natural_height);
    return {std::max(1, static_cast<int>(target * ratio)), target};
}

size_t LodPolicy::estimate_photo_bytes(DetailLevel level) const {
    const auto side = static_cast<size_t>(resolution(level));
    return side * side * 4;
}

} // namespace tessera::core
