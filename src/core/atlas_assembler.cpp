#include "atlas_assembler.h"

#include "checked_math.h"
#include "log.h"

#include <unordered_map>

namespace tessera::core {

bool assemble_atlas(std::vector<DecodedRaster> rasters,
                    const std::vector<PackedRect>& placement,
                    int atlas_size,
                    DetailLevel level,
                    PriorityClass priority,
                    uint64_t generation,
                    AssemblyResult& out,
                    std::string& error) {
    size_t byte_count = 0;
    if (!rgba_byte_count(atlas_size, atlas_size, byte_count)) {
        error = "invalid atlas size " + std::to_string(atlas_size);
        return false;
    }

    auto atlas = std::make_shared<Atlas>();
    atlas->size = atlas_size;
    atlas->level = level;
    atlas->priority = priority;
    atlas->generation = generation;
    atlas->pixels.assign(byte_count, 0);

    std::unordered_map<std::string, size_t> raster_index;
    raster_index.reserve(rasters.size());
    for (size_t i = 0; i < rasters.size(); ++i) {
        raster_index.emplace(rasters[i].id, i);
    }

    AssemblyResult result;
    size_t drawn_area = 0;
    for (const auto& rect : placement) {
        const auto it = raster_index.find(rect.id);
        if (it == raster_index.end()) {
            result.failed.push_back(rect.id);
            continue;
        }
        DecodedRaster& raster = rasters[it->second];
        if (!raster_is_valid(raster)) {
            log_message(LogLevel::Warning, "assembler", "corrupt raster for '" + rect.id + "'");
            release_raster(raster);
            result.failed.push_back(rect.id);
            continue;
        }
        if (rect.x < 0 || rect.y < 0 || rect.width <= 0 || rect.height <= 0
            || rect.x > atlas_size - rect.width || rect.y > atlas_size - rect.height) {
            release_raster(raster);
            result.failed.push_back(rect.id);
            continue;
        }

        std::string draw_error;
        const float aspect = static_cast<float>(raster.width) / static_cast<float>(raster.height);
        const bool drawn = draw_scaled(raster.pixels.data(), raster.width, raster.height,
                                       atlas->pixels, atlas_size,
                                       rect.x, rect.y, rect.width, rect.height, draw_error);
        release_raster(raster);
        if (!drawn) {
            log_message(LogLevel::Warning, "assembler", "failed to draw '" + rect.id + "': " + draw_error);
            result.failed.push_back(rect.id);
            continue;
        }

        AtlasRegion region;
        region.id = rect.id;
        region.x = rect.x;
        region.y = rect.y;
        region.width = rect.width;
        region.height = rect.height;
        region.aspect_ratio = aspect;
        region.level = level;
        atlas->regions.emplace(rect.id, region);
        drawn_area += static_cast<size_t>(rect.width) * static_cast<size_t>(rect.height);
    }

    atlas->utilization = static_cast<double>(drawn_area) /
                         (static_cast<double>(atlas_size) * static_cast<double>(atlas_size));
    result.atlas = std::move(atlas);
    out = std::move(result);
    return true;
}

} // namespace tessera::core
