#pragma once

#include "atlas.h"
#include "image.h"
#include "lod_policy.h"
#include "memory_budget.h"
#include "shelf_packer.h"

#include <optional>
#include <string>
#include <vector>

namespace tessera::core {

enum class DistributionPolicy { SINGLE_SIZE, PRIORITY_BASED, MULTI_SIZE };

const char* policy_name(DistributionPolicy policy);

struct DistributionRequest {
    std::vector<Image> images;
    DetailLevel level = DetailLevel::LEVEL_0;
    std::optional<std::string> focused_id;
    PriorityClass priority = PriorityClass::VISIBLE;
    int padding = k_default_padding;
    // When false the image sizes are taken as the sizes to draw.
    bool scale_to_level = true;
};

// One atlas to build: its size, its members and where each member goes.
struct AtlasPlanEntry {
    int atlas_size = 0;
    DetailLevel level = DetailLevel::LEVEL_0;
    PriorityClass priority = PriorityClass::VISIBLE;
    std::vector<std::string> member_ids;
    std::vector<PackedRect> placement;
};

struct DistributionPlan {
    DistributionPolicy policy = DistributionPolicy::MULTI_SIZE;
    std::vector<AtlasPlanEntry> entries;
    std::vector<std::string> permanently_failed;
};

int min_images_per_atlas(DetailLevel level);

DistributionPlan plan_distribution(const DistributionRequest& request,
                                   const MemoryBudget& budget,
                                   const LodPolicy& lod);

} // namespace tessera::core
