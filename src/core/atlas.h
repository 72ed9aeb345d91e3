#pragma once

#include "lod_policy.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessera::core {

// Cache bucket an atlas belongs to. Ordered from least to most important.
enum class PriorityClass { PERSISTENT, VISIBLE, ACTIVE, FOCUSED };

const char* priority_name(PriorityClass priority);

struct AtlasRegion {
    std::string id;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    float aspect_ratio = 1.0f;
    DetailLevel level = DetailLevel::LEVEL_0;
};

// A composed square RGBA texture. Immutable once published through AtlasPtr.
struct Atlas {
    int size = 0;
    DetailLevel level = DetailLevel::LEVEL_0;
    PriorityClass priority = PriorityClass::VISIBLE;
    uint64_t generation = 0;
    double utilization = 0.0;
    std::vector<unsigned char> pixels;
    std::unordered_map<std::string, AtlasRegion> regions;

    const AtlasRegion* find_region(const std::string& id) const;
    size_t byte_size() const { return pixels.size(); }
};

using AtlasPtr = std::shared_ptr<const Atlas>;

bool encode_atlas_png(const Atlas& atlas, std::vector<unsigned char>& out, std::string& error);
bool write_atlas_png(const Atlas& atlas, const std::string& path, std::string& error);

} // namespace tessera::core
